#include "nectar/postage/stamp.hpp"

#include <cstring>

#include "nectar/crypto/keccak.hpp"

namespace nectar::postage {
    namespace {
        using nectar::core::make_status;
        using nectar::core::StatusCode;
        using nectar::core::StatusDomain;
        using nectar::core::u32;
        using nectar::core::u64;
        using nectar::core::u8;

        void put_u32_be(u8* out, u32 v) noexcept {
            out[0] = static_cast<u8>((v >> 24) & 0xffu);
            out[1] = static_cast<u8>((v >> 16) & 0xffu);
            out[2] = static_cast<u8>((v >> 8) & 0xffu);
            out[3] = static_cast<u8>(v & 0xffu);
        }

        void put_u64_be(u8* out, u64 v) noexcept {
            put_u32_be(out, static_cast<u32>(v >> 32));
            put_u32_be(out + 4, static_cast<u32>(v & 0xffffffffu));
        }

        [[nodiscard]] u32 get_u32_be(const u8* in) noexcept {
            return (static_cast<u32>(in[0]) << 24) | (static_cast<u32>(in[1]) << 16)
                | (static_cast<u32>(in[2]) << 8) | static_cast<u32>(in[3]);
        }

        [[nodiscard]] u64 get_u64_be(const u8* in) noexcept {
            return (static_cast<u64>(get_u32_be(in)) << 32) | get_u32_be(in + 4);
        }
    } // namespace

    u32 bucket_of(const ChunkAddress& address, u8 bucket_depth) noexcept {
        if (bucket_depth == 0) {
            return 0;
        }
        const u32 prefix = get_u32_be(address.b.data());
        return bucket_depth >= 32 ? prefix : (prefix >> (32 - bucket_depth));
    }

    Hash256 stamp_digest(const ChunkAddress& chunk, const nectar::core::BatchId& batch_id, StampIndex index,
        nectar::core::Timestamp timestamp) noexcept {
        u8 tail[4 + 4 + 8];
        put_u32_be(tail, index.x);
        put_u32_be(tail + 4, index.y);
        put_u64_be(tail + 8, timestamp);

        nectar::crypto::Keccak256Hasher h;
        nectar::crypto::keccak256_init(&h);
        nectar::crypto::keccak256_update(&h, chunk.b.data(), chunk.b.size());
        nectar::crypto::keccak256_update(&h, batch_id.b.data(), batch_id.b.size());
        nectar::crypto::keccak256_update(&h, tail, sizeof(tail));
        Hash256 out{};
        nectar::crypto::keccak256_finalize(&h, out.b.data());
        return out;
    }

    Status stamp_sign(const ChunkAddress& chunk, const nectar::core::BatchId& batch_id, StampIndex index,
        nectar::core::Timestamp timestamp, nectar::crypto::Signer& signer, Stamp* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        Stamp stamp;
        stamp.batch_id = batch_id;
        stamp.index = index;
        stamp.timestamp = timestamp;
        const Status st = signer.sign(stamp_digest(chunk, batch_id, index, timestamp), &stamp.signature);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        *out = stamp;
        return nectar::core::ok_status();
    }

    void stamp_marshal(const Stamp& stamp, u8 out[kStampSize]) noexcept {
        std::memcpy(out, stamp.batch_id.b.data(), 32);
        put_u32_be(out + 32, stamp.index.x);
        put_u32_be(out + 36, stamp.index.y);
        put_u64_be(out + 40, stamp.timestamp);
        std::memcpy(out + 48, stamp.signature.b.data(), stamp.signature.b.size());
    }

    std::array<u8, kStampSize> stamp_to_bytes(const Stamp& stamp) noexcept {
        std::array<u8, kStampSize> out{};
        stamp_marshal(stamp, out.data());
        return out;
    }

    Status stamp_unmarshal(BufferView in, Stamp* out) noexcept {
        if (out == nullptr || !nectar::core::buffer_ok(in)) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        if (in.len < kStampSize) {
            return make_status(StatusDomain::Postage, StatusCode::InsufficientData, in.len, kStampSize);
        }
        if (in.len > kStampSize) {
            return make_status(StatusDomain::Postage, StatusCode::SizeExceeded, in.len, kStampSize);
        }
        Stamp stamp;
        stamp.batch_id = nectar::core::BatchId::from(in.data);
        stamp.index.x = get_u32_be(in.data + 32);
        stamp.index.y = get_u32_be(in.data + 36);
        stamp.timestamp = get_u64_be(in.data + 40);
        stamp.signature = Signature::from(in.data + 48);
        *out = stamp;
        return nectar::core::ok_status();
    }

    Status stamp_recover_issuer(const Stamp& stamp, const ChunkAddress& chunk, nectar::core::Address* out) noexcept {
        return nectar::crypto::recover_signer(stamp_digest(chunk, stamp.batch_id, stamp.index, stamp.timestamp),
            stamp.signature, out);
    }
} // namespace nectar::postage
