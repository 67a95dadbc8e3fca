#pragma once

#include <type_traits>

#include "nectar/core/errors.hpp"
#include "nectar/core/types.hpp"

namespace nectar::crypto {
    using nectar::core::u8;
    using nectar::core::Address;
    using nectar::core::Hash256;
    using nectar::core::Signature;
    using nectar::core::Status;

    struct PrivateKeyTag {};
    using PrivateKey = nectar::core::FixedBytes<PrivateKeyTag, 32>;

    // Uncompressed point without the 0x04 prefix: x(32) || y(32), big-endian.
    struct PublicKeyTag {};
    using PublicKey = nectar::core::FixedBytes<PublicKeyTag, 64>;

    // Recovery ids 0/1 and their Ethereum form 27/28 are accepted on input;
    // signatures are always produced with v = 27 + recid.
    inline constexpr u8 kSignatureVOffset = 27;

    // Crypto/Invalid when the key is zero or not below the group order.
    Status secp256k1_public_key(const PrivateKey& key, PublicKey* out) noexcept;

    // Deterministic ECDSA over a 32-byte digest (RFC 6979 nonce, HMAC-SHA256),
    // normalized to low-S.
    Status secp256k1_sign_hash(const PrivateKey& key, const Hash256& digest, Signature* out) noexcept;

    // Recovers the public key that produced sig over digest. A malformed
    // signature and a failed recovery both report StatusCode::Crypto.
    Status secp256k1_recover(const Hash256& digest, const Signature& sig, PublicKey* out) noexcept;

    // Last 20 bytes of keccak256(x || y).
    [[nodiscard]] Address address_from_public_key(const PublicKey& key) noexcept;

    static_assert(std::is_trivially_copyable_v<PrivateKey>);
    static_assert(sizeof(PublicKey) == 64);

} // namespace nectar::crypto
