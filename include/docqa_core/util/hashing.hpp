#pragma once

#include <string>
#include <string_view>

namespace docqa_core {

// Lowercase hex SHA-256 of the given bytes
std::string sha256_hex(std::string_view data);

}  // namespace docqa_core
