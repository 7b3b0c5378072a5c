#pragma once

#include <string>

namespace thumbgrid {

// Lowercase hex SHA-256 digest of `input`. Throws std::runtime_error when
// the digest cannot be computed.
std::string sha256_hex(const std::string& input);

} // namespace thumbgrid
