#pragma once

#include "common/types.h"
#include "crypto/keys.h"
#include "models/ids.h"
#include "models/serializer.h"
#include <vector>

namespace clique {
namespace models {

/**
 * @brief How a wrapped object's identifier follows from its signed hash
 *
 * Identity by default. Blocks specialise this so that a block and its header
 * share one identifier.
 */
template <typename T, typename IdT>
struct IdDerivation {
  static IdT derive(const T & /*content*/, const Hash &content_hash) {
    return IdT(content_hash);
  }
};

/**
 * @brief Signed, content-addressed envelope
 *
 * hash = SHA256(creator_public_key || serialized content), the signature is
 * Ed25519 over that hash, and the identifier is derived from it. Content is
 * not meant to be mutated after wrapping; verify() detects it if it is.
 */
template <typename T, typename IdT>
struct Wrapped {
  T content;
  Signature signature;
  PublicKey creator_public_key;
  Address creator_address;
  IdT id;

  static Result<Wrapped> new_wrapped(T content, const PrivateKey &private_key,
                                     const PublicKey &public_key) {
    Hash hash = content_hash(content, public_key);
    auto sig = crypto::sign(hash, private_key);
    if (sig.is_err()) {
      return Result<Wrapped>("Failed to sign content: " + sig.error());
    }

    Wrapped wrapped;
    wrapped.id = IdDerivation<T, IdT>::derive(content, hash);
    wrapped.content = std::move(content);
    wrapped.signature = std::move(sig).value();
    wrapped.creator_public_key = public_key;
    wrapped.creator_address = Address::from_public_key(public_key);
    return Result<Wrapped>(std::move(wrapped));
  }

  /**
   * @brief Check signature, identifier and creator address
   */
  bool verify() const {
    Hash hash = content_hash(content, creator_public_key);
    if (!(IdDerivation<T, IdT>::derive(content, hash) == id)) {
      return false;
    }
    if (creator_address != Address::from_public_key(creator_public_key)) {
      return false;
    }
    return crypto::verify(hash, signature, creator_public_key);
  }

  /// Envelope bytes embedded in a parent object's serialization
  void serialize(std::vector<uint8_t> &buf) const {
    Serializer::write_bytes(buf, id.hash());
    Serializer::write_bytes(buf, signature);
    Serializer::write_bytes(buf, creator_public_key);
  }

private:
  static Hash content_hash(const T &content, const PublicKey &public_key) {
    std::vector<uint8_t> data(public_key.begin(), public_key.end());
    content.serialize(data);
    return crypto::sha256(data);
  }
};

} // namespace models
} // namespace clique
