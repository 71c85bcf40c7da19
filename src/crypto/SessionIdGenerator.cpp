#include "crypto/SessionIdGenerator.hpp"
#include "crypto/util/encode.hpp"
#include "crypto/util/sodium.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace sessid::config;
using namespace sessid::logging;

namespace sessid::crypto {

namespace {

bool issuanceLoggingEnabled() {
    return ConfigRegistry::isInitialized() && ConfigRegistry::get().session_ids.log_issuance;
}

template <typename T>
void putBigEndian(SessionId& id, const size_t offset, const T value) {
    for (size_t i = 0; i < sizeof(T); ++i)
        id[offset + i] = static_cast<uint8_t>(value >> ((sizeof(T) - 1 - i) * 8));
}

}

SessionIdGenerator::SessionIdGenerator()
    : SessionIdGenerator(sessid::util::systemClock(), util::secure_random_fill) {
    try {
        util::ensure_sodium_init();
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized())
            LogRegistry::crypto()->critical("[SessionIdGenerator] No secure entropy source: {}", e.what());
        throw;
    }
}

SessionIdGenerator::SessionIdGenerator(sessid::util::TimeSource clock, RandomSource random)
    : clock_(std::move(clock)), random_(std::move(random)), logIssuance_(issuanceLoggingEnabled()) {
    if (!clock_) throw std::invalid_argument("SessionIdGenerator requires a time source");
    if (!random_) throw std::invalid_argument("SessionIdGenerator requires a random source");
}

SessionIdGenerator& SessionIdGenerator::instance() {
    static SessionIdGenerator inst;
    return inst;
}

std::string SessionIdGenerator::generate() {
    return util::b64url_encode(generateBytes());
}

SessionId SessionIdGenerator::generateBytes() {
    uint64_t timestampBucket = 0;
    try {
        timestampBucket = sessid::util::timeBucket(clock_(), SessionIdLayout::TIMESTAMP_GRANULARITY);
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized())
            LogRegistry::crypto()->critical("[SessionIdGenerator] Unusable clock: {}", e.what());
        throw;
    }

    // Signed atomic arithmetic wraps; only the low 16 bits are kept
    const int32_t rolloverCounter = counter_.fetch_add(1);
    const auto counter16 = static_cast<uint16_t>(static_cast<uint32_t>(rolloverCounter));

    SessionId id{};
    putBigEndian(id, SessionIdLayout::TIMESTAMP_OFFSET, timestampBucket);
    random_(id.data() + SessionIdLayout::RANDOM_OFFSET, SessionIdLayout::RANDOM_SIZE);
    putBigEndian(id, SessionIdLayout::COUNTER_OFFSET, counter16);

    if (logIssuance_ && LogRegistry::isInitialized())
        LogRegistry::crypto()->debug("[SessionIdGenerator] Issued id #{:04X} in bucket {}", counter16, timestampBucket);

    return id;
}

std::vector<std::string> SessionIdGenerator::generateBatch(const size_t n) {
    std::vector<std::string> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) out.push_back(generate());
    return out;
}

}
