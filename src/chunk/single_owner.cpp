#include "nectar/chunk/single_owner.hpp"

#include <utility>

#include "nectar/crypto/keccak.hpp"

namespace nectar::chunk {
    namespace {
        using nectar::core::make_status;
        using nectar::core::StatusCode;
        using nectar::core::StatusDomain;

        [[nodiscard]] Status recover_owner(const SocId& id, const BmtBody& body, const Signature& sig,
            Address* owner) noexcept {
            return nectar::crypto::recover_signer(soc_signing_digest(id, body.hash()), sig, owner);
        }
    } // namespace

    ChunkAddress soc_address(const SocId& id, const Address& owner) noexcept {
        const Hash256 h = nectar::crypto::keccak256_pair(id.b.data(), id.b.size(), owner.b.data(), owner.b.size());
        return ChunkAddress::from(h.b.data());
    }

    Hash256 soc_signing_digest(const SocId& id, const ChunkAddress& body_address) noexcept {
        return nectar::crypto::keccak256_pair(id.b.data(), id.b.size(), body_address.b.data(), body_address.b.size());
    }

    bool SingleOwnerChunk::verify(const ChunkAddress& expected) const noexcept {
        Address recovered{};
        if (!nectar::core::is_ok(recover_owner(id_, body_, signature_, &recovered))) {
            return false;
        }
        return recovered == owner_ && expected == address();
    }

    void SingleOwnerChunk::encode(std::vector<u8>* out) const {
        out->insert(out->end(), id_.b.begin(), id_.b.end());
        out->insert(out->end(), signature_.b.begin(), signature_.b.end());
        body_.encode(out);
    }

    std::vector<u8> SingleOwnerChunk::to_bytes() const {
        std::vector<u8> out;
        out.reserve(size());
        encode(&out);
        return out;
    }

    Status soc_new(const SocId& id, BufferView payload, nectar::crypto::Signer& signer, SingleOwnerChunk* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Chunk, StatusCode::Invalid);
        }
        BmtBody body;
        const Status st = body_from_payload(payload, &body);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        return soc_wrap(id, std::move(body), signer, out);
    }

    Status soc_wrap(const SocId& id, BmtBody body, nectar::crypto::Signer& signer, SingleOwnerChunk* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Chunk, StatusCode::Invalid);
        }
        Signature sig{};
        const Status st = signer.sign(soc_signing_digest(id, body.hash()), &sig);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        return soc_from_parts(id, signer.address(), sig, std::move(body), out);
    }

    Status soc_new_signed(const ChunkAddress& address, const SocId& id, const Signature& sig, BufferView payload,
        SingleOwnerChunk* out, SocMismatch* mismatch) {
        if (out == nullptr) {
            return make_status(StatusDomain::Chunk, StatusCode::Invalid);
        }
        BmtBody body;
        Status st = body_from_payload(payload, &body);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        Address owner{};
        st = recover_owner(id, body, sig, &owner);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        const ChunkAddress recovered = soc_address(id, owner);
        if (recovered != address) {
            if (mismatch != nullptr) {
                *mismatch = SocMismatch{address, recovered, owner};
            }
            return make_status(StatusDomain::Chunk, StatusCode::AddressMismatch);
        }
        return soc_from_parts(id, owner, sig, std::move(body), out);
    }

    Status soc_decode(BufferView wire, SingleOwnerChunk* out) {
        if (out == nullptr || !nectar::core::buffer_ok(wire)) {
            return make_status(StatusDomain::Chunk, StatusCode::Invalid);
        }
        if (wire.len < kSocHeaderSize) {
            return make_status(StatusDomain::Chunk, StatusCode::InsufficientData, wire.len, kSocHeaderSize);
        }
        const SocId id = SocId::from(wire.data);
        const Signature sig = Signature::from(wire.data + kSocIdSize);

        BmtBody body;
        Status st = body_decode(BufferView{wire.data + kSocHeaderSize, wire.len - kSocHeaderSize}, &body);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        Address owner{};
        st = recover_owner(id, body, sig, &owner);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        return soc_from_parts(id, owner, sig, std::move(body), out);
    }

    Status soc_from_parts(const SocId& id, const Address& owner, const Signature& sig, BmtBody body,
        SingleOwnerChunk* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Chunk, StatusCode::Invalid);
        }
        out->id_ = id;
        out->owner_ = owner;
        out->signature_ = sig;
        out->body_ = std::move(body);
        return nectar::core::ok_status();
    }
} // namespace nectar::chunk
