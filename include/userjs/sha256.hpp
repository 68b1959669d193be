#pragma once

#include <string>
#include <string_view>

namespace userjs {

// Lowercase hex SHA-256 of `data`; empty string if the digest could not be computed.
std::string Sha256Hex(std::string_view data);

} // namespace userjs
