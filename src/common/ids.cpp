#include "cligate/common/ids.hpp"

#include <openssl/rand.h>

#include <random>
#include <vector>

namespace cligate::common {

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> raw(bytes);
  if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
    // Names only have to be unique, so a weaker source is acceptable here.
    std::random_device device;
    for (auto &byte : raw) {
      byte = static_cast<unsigned char>(device() & 0xFFu);
    }
  }

  static constexpr char kDigits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(bytes * 2);
  for (const unsigned char byte : raw) {
    hex += kDigits[byte >> 4];
    hex += kDigits[byte & 0x0F];
  }
  return hex;
}

} // namespace cligate::common
