#pragma once

#include <array>
#include <type_traits>

#include "nectar/core/buffer.hpp"
#include "nectar/core/errors.hpp"
#include "nectar/core/types.hpp"
#include "nectar/crypto/signer.hpp"

namespace nectar::postage {
    using nectar::core::BufferView;
    using nectar::core::ChunkAddress;
    using nectar::core::Hash256;
    using nectar::core::Signature;
    using nectar::core::Status;

    // batch_id(32) || x(4 BE) || y(4 BE) || timestamp(8 BE) || signature(65)
    inline constexpr nectar::core::u32 kStampSize = 32 + 4 + 4 + 8 + 65;

    // x: collision bucket, y: sequence within the bucket.
    struct StampIndex {
        nectar::core::u32 x{0};
        nectar::core::u32 y{0};

        friend constexpr bool operator==(const StampIndex&, const StampIndex&) noexcept = default;
    };

    [[nodiscard]] constexpr nectar::core::u64 stamp_index_pack(StampIndex i) noexcept {
        return (static_cast<nectar::core::u64>(i.x) << 32) | i.y;
    }

    [[nodiscard]] constexpr StampIndex stamp_index_unpack(nectar::core::u64 v) noexcept {
        return StampIndex{static_cast<nectar::core::u32>(v >> 32), static_cast<nectar::core::u32>(v & 0xffffffffu)};
    }

    // Top bucket_depth bits of the address as a big-endian integer.
    [[nodiscard]] nectar::core::u32 bucket_of(const ChunkAddress& address, nectar::core::u8 bucket_depth) noexcept;

    struct Stamp {
        nectar::core::BatchId batch_id{};
        StampIndex index{};
        // Milliseconds since the Unix epoch.
        nectar::core::Timestamp timestamp{0};
        Signature signature{};
    };

    // keccak256(chunk_address || batch_id || x(4 BE) || y(4 BE) || timestamp(8 BE))
    [[nodiscard]] Hash256 stamp_digest(const ChunkAddress& chunk, const nectar::core::BatchId& batch_id,
        StampIndex index, nectar::core::Timestamp timestamp) noexcept;

    // Signs the digest for chunk; the signer's error is returned unchanged.
    Status stamp_sign(const ChunkAddress& chunk, const nectar::core::BatchId& batch_id, StampIndex index,
        nectar::core::Timestamp timestamp, nectar::crypto::Signer& signer, Stamp* out) noexcept;

    void stamp_marshal(const Stamp& stamp, nectar::core::u8 out[kStampSize]) noexcept;
    [[nodiscard]] std::array<nectar::core::u8, kStampSize> stamp_to_bytes(const Stamp& stamp) noexcept;
    // Postage/InsufficientData below kStampSize, SizeExceeded above.
    Status stamp_unmarshal(BufferView in, Stamp* out) noexcept;

    // Address that signed the stamp for chunk; Crypto on a bad signature.
    Status stamp_recover_issuer(const Stamp& stamp, const ChunkAddress& chunk, nectar::core::Address* out) noexcept;

    static_assert(std::is_trivially_copyable_v<Stamp>);
    static_assert(std::is_standard_layout_v<StampIndex>);

} // namespace nectar::postage
