#pragma once

#include "crypto/SessionId.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sessid::crypto::util {

// URL-safe alphabet ('-' and '_' instead of '+' and '/'), no '=' padding.
std::string b64url_encode(const uint8_t* data, size_t len);

std::string b64url_encode(const std::vector<uint8_t>& data);

std::string b64url_encode(const SessionId& id);

// Throws std::invalid_argument on padding, characters outside the alphabet
// or a length no unpadded encoding can have.
std::vector<uint8_t> b64url_decode(std::string_view b64);

}
