#pragma once

#include <cstddef>
#include <string>

namespace cligate::common {

/// Lowercase hex string built from `bytes` random bytes (2 * bytes characters).
[[nodiscard]] std::string random_hex(std::size_t bytes);

} // namespace cligate::common
