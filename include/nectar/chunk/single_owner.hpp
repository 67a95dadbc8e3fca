#pragma once

#include <vector>

#include "nectar/chunk/body.hpp"
#include "nectar/crypto/signer.hpp"

namespace nectar::chunk {
    using nectar::core::Address;
    using nectar::core::Signature;
    using nectar::core::SocId;

    inline constexpr u32 kSocIdSize = 32;
    inline constexpr u32 kSocSignatureSize = 65;
    inline constexpr u32 kSocHeaderSize = kSocIdSize + kSocSignatureSize;

    // keccak256(id || owner)
    [[nodiscard]] ChunkAddress soc_address(const SocId& id, const Address& owner) noexcept;
    // keccak256(id || body address); what the owner signs.
    [[nodiscard]] Hash256 soc_signing_digest(const SocId& id, const ChunkAddress& body_address) noexcept;

    // Single-owner chunk: wire form id(32) || signature(65) || span(8 LE) || payload.
    class SingleOwnerChunk {
    public:
        SingleOwnerChunk() = default;

        [[nodiscard]] const SocId& id() const noexcept { return id_; }
        [[nodiscard]] const Address& owner() const noexcept { return owner_; }
        [[nodiscard]] const Signature& signature() const noexcept { return signature_; }
        [[nodiscard]] const BmtBody& body() const noexcept { return body_; }
        [[nodiscard]] u32 size() const noexcept { return kSocHeaderSize + body_.size(); }

        [[nodiscard]] ChunkAddress address() const noexcept { return soc_address(id_, owner_); }

        // True only if the signature recovers to owner() and expected is
        // keccak256(id || owner).
        [[nodiscard]] bool verify(const ChunkAddress& expected) const noexcept;

        void encode(std::vector<u8>* out) const;
        [[nodiscard]] std::vector<u8> to_bytes() const;

        friend bool operator==(const SingleOwnerChunk& a, const SingleOwnerChunk& b) noexcept {
            return a.id_ == b.id_ && a.owner_ == b.owner_ && a.signature_ == b.signature_ && a.body_ == b.body_;
        }

    private:
        friend Status soc_from_parts(const SocId& id, const Address& owner, const Signature& sig, BmtBody body,
            SingleOwnerChunk* out);

        SocId id_{};
        Address owner_{};
        Signature signature_{};
        BmtBody body_;
    };

    // Filled by soc_new_signed on Chunk/AddressMismatch.
    struct SocMismatch {
        ChunkAddress expected{};
        ChunkAddress recovered_address{};
        Address recovered_owner{};
    };

    // Signs id over a body with span = payload length.
    Status soc_new(const SocId& id, BufferView payload, nectar::crypto::Signer& signer, SingleOwnerChunk* out);
    // Signs id over an existing body, keeping its span.
    Status soc_wrap(const SocId& id, BmtBody body, nectar::crypto::Signer& signer, SingleOwnerChunk* out);

    // Externally signed chunk: recovers the owner from sig and fails with
    // Chunk/AddressMismatch unless keccak256(id || owner) equals address.
    Status soc_new_signed(const ChunkAddress& address, const SocId& id, const Signature& sig, BufferView payload,
        SingleOwnerChunk* out, SocMismatch* mismatch);

    // Chunk/InsufficientData below kSocHeaderSize + span; Crypto when the
    // owner cannot be recovered.
    Status soc_decode(BufferView wire, SingleOwnerChunk* out);

    // Assembles stored parts as-is; nothing is recovered or checked.
    Status soc_from_parts(const SocId& id, const Address& owner, const Signature& sig, BmtBody body,
        SingleOwnerChunk* out);

} // namespace nectar::chunk
