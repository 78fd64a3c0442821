#include "common/types.h"
#include <iomanip>
#include <sstream>

namespace clique {
namespace common {

// Explicit template instantiations for frequently used Result types
template class Result<bool>;
template class Result<uint64_t>;
template class Result<std::vector<uint8_t>>;

std::string to_hex(const std::vector<uint8_t> &bytes) {
  std::ostringstream ss;
  for (auto byte : bytes) {
    ss << std::hex << std::setfill('0') << std::setw(2)
       << static_cast<int>(byte);
  }
  return ss.str();
}

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

Result<std::vector<uint8_t>> from_hex(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return Result<std::vector<uint8_t>>("Hex string has odd length");
  }

  std::vector<uint8_t> bytes;
  bytes.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hex_value(hex[i]);
    int lo = hex_value(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return Result<std::vector<uint8_t>>("Invalid hex character at offset " +
                                          std::to_string(hi < 0 ? i : i + 1));
    }
    bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return Result<std::vector<uint8_t>>(std::move(bytes));
}

} // namespace common
} // namespace clique
