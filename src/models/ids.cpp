#include "models/ids.h"
#include "crypto/keys.h"

namespace clique {
namespace models {

Address Address::from_public_key(const PublicKey &public_key) {
  return Address(crypto::sha256(public_key));
}

uint8_t Address::get_thread(uint8_t thread_count) const {
  if (thread_count <= 1 || hash_.empty()) {
    return 0;
  }
  int bits = 0;
  while ((1u << bits) < thread_count) {
    ++bits;
  }
  return static_cast<uint8_t>(hash_[0] >> (8 - bits));
}

std::ostream &operator<<(std::ostream &os, const Address &address) {
  return os << address.to_string();
}

} // namespace models
} // namespace clique
