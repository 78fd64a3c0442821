#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace clique {
namespace models {

/**
 * Little-endian byte writer used to build the signed representation of
 * operations, endorsements, headers and blocks. Only the writing side
 * exists: content is never decoded, only hashed and signed.
 */
class Serializer {
public:
  static void write_u8(std::vector<uint8_t> &buf, uint8_t val);
  static void write_u32(std::vector<uint8_t> &buf, uint32_t val);
  static void write_u64(std::vector<uint8_t> &buf, uint64_t val);
  /// Length-prefixed (u32) byte string
  static void write_bytes(std::vector<uint8_t> &buf,
                          const std::vector<uint8_t> &bytes);
  static void write_string(std::vector<uint8_t> &buf, const std::string &str);
};

} // namespace models
} // namespace clique
