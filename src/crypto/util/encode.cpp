#include "crypto/util/encode.hpp"
#include "crypto/util/sodium.hpp"

#include <sodium.h>
#include <cstring>
#include <stdexcept>

namespace sessid::crypto::util {

static constexpr int VARIANT = sodium_base64_VARIANT_URLSAFE_NO_PADDING;

std::string b64url_encode(const uint8_t* data, const size_t len) {
    ensure_sodium_init();
    if (len == 0) return {};

    const size_t encoded_len = sodium_base64_ENCODED_LEN(len, VARIANT);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(), data, len, VARIANT);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

std::string b64url_encode(const std::vector<uint8_t>& data) {
    return b64url_encode(data.data(), data.size());
}

std::string b64url_encode(const SessionId& id) {
    return b64url_encode(id.data(), id.size());
}

std::vector<uint8_t> b64url_decode(const std::string_view b64) {
    ensure_sodium_init();
    if (b64.empty()) return {};

    // A single trailing sextet can never hold a whole byte
    if (b64.size() % 4 == 1) throw std::invalid_argument("Invalid base64url length");

    std::vector<uint8_t> decoded(b64.size() / 4 * 3 + 2);
    size_t out_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          b64.data(), b64.size(),
                          nullptr, &out_len, &end,
                          VARIANT) != 0 || end != b64.data() + b64.size())
    {
        throw std::invalid_argument("Invalid base64url input");
    }

    decoded.resize(out_len);
    return decoded;
}

}
