#include "nectar/crypto/signer.hpp"

#include <cstring>

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include "nectar/crypto/keccak.hpp"

namespace nectar::crypto {
    namespace {
        constexpr char kEthPrefix[] = "\x19" "Ethereum Signed Message:\n32";
    } // namespace

    Hash256 eth_message_digest(const Hash256& digest) noexcept {
        return keccak256_pair(reinterpret_cast<const u8*>(kEthPrefix), sizeof(kEthPrefix) - 1,
            digest.b.data(), digest.b.size());
    }

    LocalSigner::LocalSigner(const PrivateKey& key, const PublicKey& pub) noexcept
        : key_(key), public_key_(pub), address_(address_from_public_key(pub)) {}

    LocalSigner::~LocalSigner() {
        OPENSSL_cleanse(key_.b.data(), key_.b.size());
    }

    Status LocalSigner::create(const PrivateKey& key, std::unique_ptr<LocalSigner>* out) {
        if (out == nullptr) {
            return nectar::core::make_status(nectar::core::StatusDomain::Crypto, nectar::core::StatusCode::Invalid);
        }
        PublicKey pub{};
        const Status st = secp256k1_public_key(key, &pub);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        out->reset(new LocalSigner(key, pub));
        return nectar::core::ok_status();
    }

    Status LocalSigner::random(std::unique_ptr<LocalSigner>* out) {
        PrivateKey key{};
        for (int attempt = 0; attempt < 8; ++attempt) {
            if (RAND_bytes(key.b.data(), static_cast<int>(key.b.size())) != 1) {
                return nectar::core::make_status(nectar::core::StatusDomain::Crypto, nectar::core::StatusCode::Unavailable);
            }
            const Status st = create(key, out);
            if (st.code != nectar::core::StatusCode::Invalid) {
                OPENSSL_cleanse(key.b.data(), key.b.size());
                return st;
            }
        }
        OPENSSL_cleanse(key.b.data(), key.b.size());
        return nectar::core::make_status(nectar::core::StatusDomain::Crypto, nectar::core::StatusCode::Crypto);
    }

    Status LocalSigner::sign(const Hash256& digest, Signature* out) noexcept {
        return secp256k1_sign_hash(key_, eth_message_digest(digest), out);
    }

    Status recover_signer(const Hash256& digest, const Signature& sig, Address* out) noexcept {
        if (out == nullptr) {
            return nectar::core::make_status(nectar::core::StatusDomain::Crypto, nectar::core::StatusCode::Invalid);
        }
        PublicKey pub{};
        const Status st = secp256k1_recover(eth_message_digest(digest), sig, &pub);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        *out = address_from_public_key(pub);
        return nectar::core::ok_status();
    }
} // namespace nectar::crypto
