#pragma once

#include "nectar/chunk/chunk.hpp"
#include "nectar/core/errors.hpp"
#include "nectar/core/types.hpp"

namespace nectar::auth {
    using nectar::core::Status;
    using nectar::core::Timestamp;
    using nectar::core::u64;

    // Admits chunks on presentation of a proof. A successful validate()
    // records the authorization.
    template <typename Proof>
    class Authorizer {
    public:
        virtual ~Authorizer() = default;

        // Distinct (batch, stamp) authorizations currently held.
        [[nodiscard]] virtual u64 authorized_chunk_count() const noexcept = 0;
        virtual Status validate(const nectar::chunk::Chunk& chunk, const Proof& proof) = 0;
    };

    // Authorizations that lapse with time.
    class TimeBoundAuthorizer {
    public:
        virtual ~TimeBoundAuthorizer() = default;

        // Drops every grant with expires_at <= now. removed receives the
        // number of chunk authorizations dropped, not the number of grants.
        virtual Status cleanup_expired(Timestamp now, u64* removed) = 0;
    };

    // Authorizers backed by reserved capacity.
    class ReservedCapacity {
    public:
        virtual ~ReservedCapacity() = default;

        [[nodiscard]] virtual u64 reserved_chunks() const noexcept = 0;
        [[nodiscard]] virtual u64 available_chunks() const noexcept = 0;

        [[nodiscard]] bool can_authorize() const noexcept { return available_chunks() > 0; }
    };

} // namespace nectar::auth
