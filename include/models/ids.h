#pragma once

#include "common/types.h"
#include <functional>
#include <ostream>
#include <string>

namespace clique {
namespace models {

using namespace clique::common;

/**
 * @brief Content-addressed identifier
 *
 * The Tag parameter keeps block, operation and endorsement identifiers from
 * being mixed up even though all three wrap a SHA-256 hash.
 */
template <typename Tag>
class ContentId {
public:
  ContentId() = default;
  explicit ContentId(Hash hash) : hash_(std::move(hash)) {}

  const Hash &hash() const { return hash_; }
  bool empty() const { return hash_.empty(); }

  std::string to_string() const { return to_hex(hash_); }

  bool operator==(const ContentId &other) const { return hash_ == other.hash_; }
  bool operator!=(const ContentId &other) const { return hash_ != other.hash_; }
  bool operator<(const ContentId &other) const { return hash_ < other.hash_; }

private:
  Hash hash_;
};

template <typename Tag>
std::ostream &operator<<(std::ostream &os, const ContentId<Tag> &id) {
  return os << id.to_string();
}

struct BlockIdTag {};
struct OperationIdTag {};
struct EndorsementIdTag {};

using BlockId = ContentId<BlockIdTag>;
using OperationId = ContentId<OperationIdTag>;
using EndorsementId = ContentId<EndorsementIdTag>;

/**
 * @brief Account address, the SHA-256 of an Ed25519 public key
 */
class Address {
public:
  Address() = default;
  explicit Address(Hash hash) : hash_(std::move(hash)) {}

  static Address from_public_key(const PublicKey &public_key);

  /**
   * @brief Thread this address belongs to
   *
   * Taken from the leading bits of the hash; thread_count must be a power
   * of two.
   */
  uint8_t get_thread(uint8_t thread_count) const;

  const Hash &hash() const { return hash_; }
  std::string to_string() const { return to_hex(hash_); }

  bool operator==(const Address &other) const { return hash_ == other.hash_; }
  bool operator!=(const Address &other) const { return hash_ != other.hash_; }
  bool operator<(const Address &other) const { return hash_ < other.hash_; }

private:
  Hash hash_;
};

std::ostream &operator<<(std::ostream &os, const Address &address);

} // namespace models
} // namespace clique

namespace std {
template <typename Tag>
struct hash<clique::models::ContentId<Tag>> {
  std::size_t operator()(const clique::models::ContentId<Tag> &id) const
      noexcept {
    return std::hash<std::vector<uint8_t>>()(id.hash());
  }
};

template <>
struct hash<clique::models::Address> {
  std::size_t operator()(const clique::models::Address &address) const
      noexcept {
    return std::hash<std::vector<uint8_t>>()(address.hash());
  }
};
} // namespace std
