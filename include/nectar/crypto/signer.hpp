#pragma once

#include <memory>

#include "nectar/core/errors.hpp"
#include "nectar/core/types.hpp"
#include "nectar/crypto/secp256k1.hpp"

namespace nectar::crypto {

    // Ethereum personal-message digest:
    // keccak256("\x19Ethereum Signed Message:\n32" || digest).
    [[nodiscard]] Hash256 eth_message_digest(const Hash256& digest) noexcept;

    // Produces 65-byte recoverable signatures over the personal-message form of
    // a 32-byte digest. sign() may block (remote keys, hardware); callers that
    // need a deadline impose it around the call.
    class Signer {
    public:
        virtual ~Signer() = default;

        [[nodiscard]] virtual Address address() const noexcept = 0;
        virtual Status sign(const Hash256& digest, Signature* out) noexcept = 0;
    };

    // In-process key.
    class LocalSigner final : public Signer {
    public:
        // Crypto/Invalid for an out-of-range key.
        static Status create(const PrivateKey& key, std::unique_ptr<LocalSigner>* out);
        // Fresh key from the OpenSSL CSPRNG.
        static Status random(std::unique_ptr<LocalSigner>* out);

        ~LocalSigner() override;

        LocalSigner(const LocalSigner&) = delete;
        LocalSigner& operator=(const LocalSigner&) = delete;

        [[nodiscard]] Address address() const noexcept override { return address_; }
        [[nodiscard]] const PublicKey& public_key() const noexcept { return public_key_; }

        Status sign(const Hash256& digest, Signature* out) noexcept override;

    private:
        LocalSigner(const PrivateKey& key, const PublicKey& pub) noexcept;

        PrivateKey key_;
        PublicKey public_key_;
        Address address_;
    };

    // Recovers the address that signed the personal-message form of digest.
    Status recover_signer(const Hash256& digest, const Signature& sig, Address* out) noexcept;

} // namespace nectar::crypto
