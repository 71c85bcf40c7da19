#include "crypto/SessionIdGenerator.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <fmt/core.h>

using namespace sessid::config;
using namespace sessid::crypto;
using namespace sessid::logging;

namespace {

enum class OutputFormat { Text, Hex };

struct CliOptions {
    size_t count = 1;
    OutputFormat format = OutputFormat::Text;
    std::optional<std::string> configPath;
    bool printConfig = false;
    bool help = false;
};

constexpr auto USAGE =
    "usage: sessid [-n|--count N] [--format text|hex] [-c|--config PATH] [--print-config]\n"
    "\n"
    "Prints N fresh session identifiers, one per line.\n"
    "  text  56 URL-safe base64 characters (default)\n"
    "  hex   84 lowercase hex digits of the 42 raw bytes\n"
    "\n"
    "--print-config writes the effective configuration as YAML and exits.\n";

std::string toHex(const SessionId& id) {
    std::string out;
    out.reserve(id.size() * 2);
    for (const auto b : id) out += fmt::format("{:02x}", b);
    return out;
}

size_t parseCount(const std::string_view s) {
    size_t n = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (ec != std::errc{} || ptr != s.data() + s.size() || n == 0)
        throw std::invalid_argument(fmt::format("invalid count '{}'", s));
    return n;
}

CliOptions parseArgs(const int argc, char** argv) {
    CliOptions opts;

    const auto value = [&](int& i, const std::string_view flag) -> std::string_view {
        if (i + 1 >= argc) throw std::invalid_argument(fmt::format("{} requires a value", flag));
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") opts.help = true;
        else if (arg == "-n" || arg == "--count") opts.count = parseCount(value(i, arg));
        else if (arg == "-c" || arg == "--config") opts.configPath = std::string(value(i, arg));
        else if (arg == "--print-config") opts.printConfig = true;
        else if (arg == "--format") {
            const auto f = value(i, arg);
            if (f == "text") opts.format = OutputFormat::Text;
            else if (f == "hex") opts.format = OutputFormat::Hex;
            else throw std::invalid_argument(fmt::format("unknown format '{}'", f));
        }
        else throw std::invalid_argument(fmt::format("unknown argument '{}'", arg));
    }

    return opts;
}

}

int main(const int argc, char** argv) {
    CliOptions opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "sessid: " << e.what() << "\n" << USAGE;
        return 2;
    }

    if (opts.help) {
        std::cout << USAGE;
        return 0;
    }

    try {
        if (opts.configPath) ConfigRegistry::init(*opts.configPath);
        else ConfigRegistry::init(Config{});
        LogRegistry::init(ConfigRegistry::get().logging.log_dir);

        if (opts.configPath) LogRegistry::config()->debug("[main] Loaded configuration from {}", *opts.configPath);
        else LogRegistry::config()->debug("[main] No --config given, using built-in defaults");
    } catch (const std::exception& e) {
        std::cerr << "sessid: failed to initialize: " << e.what() << std::endl;
        return 1;
    }

    if (opts.printConfig) {
        std::cout << dumpConfig(ConfigRegistry::get()) << '\n';
        return 0;
    }

    try {
        auto& generator = SessionIdGenerator::instance();
        LogRegistry::cli()->debug("[main] Generating {} id(s)", opts.count);

        for (size_t i = 0; i < opts.count; ++i) {
            if (opts.format == OutputFormat::Hex) std::cout << toHex(generator.generateBytes()) << '\n';
            else std::cout << generator.generate() << '\n';
        }
    } catch (const std::exception& e) {
        LogRegistry::sessid()->critical("[main] Session id generation failed: {}", e.what());
        return 1;
    }

    return 0;
}
