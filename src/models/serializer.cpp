#include "models/serializer.h"

namespace clique {
namespace models {

void Serializer::write_u8(std::vector<uint8_t> &buf, uint8_t val) {
  buf.push_back(val);
}

void Serializer::write_u32(std::vector<uint8_t> &buf, uint32_t val) {
  for (int i = 0; i < 4; ++i) {
    buf.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
  }
}

void Serializer::write_u64(std::vector<uint8_t> &buf, uint64_t val) {
  for (int i = 0; i < 8; ++i) {
    buf.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
  }
}

void Serializer::write_bytes(std::vector<uint8_t> &buf,
                             const std::vector<uint8_t> &bytes) {
  write_u32(buf, static_cast<uint32_t>(bytes.size()));
  buf.insert(buf.end(), bytes.begin(), bytes.end());
}

void Serializer::write_string(std::vector<uint8_t> &buf,
                              const std::string &str) {
  write_u32(buf, static_cast<uint32_t>(str.size()));
  buf.insert(buf.end(), str.begin(), str.end());
}

} // namespace models
} // namespace clique
