#include "nectar/auth/postage_authorizer.hpp"

#include <algorithm>

#include "nectar/core/hex.hpp"
#include "nectar/core/log.hpp"
#include "nectar/postage/batch.hpp"

namespace nectar::auth {
    namespace {
        using nectar::core::make_status;
        using nectar::core::StatusCode;
        using nectar::core::StatusDomain;

        [[nodiscard]] Status auth_error(StatusCode code, u32 aux = 0, u32 limit = 0) noexcept {
            return make_status(StatusDomain::Auth, code, aux, limit);
        }
    } // namespace

    // ============================================================================
    // BatchInfo
    // ============================================================================

    bool BatchInfo::index_fits(const ChunkAddress& chunk, nectar::postage::StampIndex index) const noexcept {
        u8 lo = std::min(nectar::postage::kMinBucketDepth, depth);
        u8 hi = std::min(depth, nectar::postage::kMaxBucketDepth);
        if (bucket_depth) {
            lo = hi = *bucket_depth;
        }
        // Smallest bucket depth first: it allows the most slots per bucket.
        for (unsigned bd = lo; bd <= hi; ++bd) {
            const u64 per_bucket = u64{1} << (depth - bd);
            if (index.y < per_bucket && index.x == nectar::postage::bucket_of(chunk, static_cast<u8>(bd))) {
                return true;
            }
        }
        return false;
    }

    // ============================================================================
    // ChunkAuthorizations
    // ============================================================================

    bool ChunkAuthorizations::add(const ChunkAddress& chunk, const BatchId& batch, u64 stamp_index) {
        if (!by_chunk_[chunk].insert(Entry{batch, stamp_index}).second) {
            return false;
        }
        by_batch_[batch].emplace_back(chunk, stamp_index);
        ++total_;
        return true;
    }

    u64 ChunkAuthorizations::remove_batch(const BatchId& batch) {
        auto it = by_batch_.find(batch);
        if (it == by_batch_.end()) {
            return 0;
        }
        u64 removed = 0;
        for (const auto& [chunk, index] : it->second) {
            auto entry = by_chunk_.find(chunk);
            if (entry == by_chunk_.end()) {
                continue;
            }
            removed += entry->second.erase(Entry{batch, index});
            if (entry->second.empty()) {
                by_chunk_.erase(entry);
            }
        }
        by_batch_.erase(it);
        total_ -= removed;
        return removed;
    }

    std::size_t ChunkAuthorizations::count_for(const ChunkAddress& chunk) const {
        auto it = by_chunk_.find(chunk);
        return it == by_chunk_.end() ? 0 : it->second.size();
    }

    // ============================================================================
    // PostageAuthorizer
    // ============================================================================

    Status PostageAuthorizer::add_batch(const BatchId& id, u8 depth, Timestamp expires_at, u64 amount_per_chunk,
        bool immutable) {
        BatchParams params;
        params.depth = depth;
        params.expires_at = expires_at;
        params.amount_per_chunk = amount_per_chunk;
        params.immutable = immutable;
        return add_batch(id, params);
    }

    Status PostageAuthorizer::add_batch(const BatchId& id, const BatchParams& params) {
        if (batches_.count(id) != 0) {
            return auth_error(StatusCode::Conflict);
        }
        if (!nectar::postage::batch_depth_ok(params.depth)) {
            return auth_error(StatusCode::Invalid, params.depth, nectar::postage::kMaxBatchDepth);
        }
        if (params.bucket_depth
            && (*params.bucket_depth > params.depth || *params.bucket_depth > nectar::postage::kMaxBucketDepth)) {
            return auth_error(StatusCode::Invalid, *params.bucket_depth, params.depth);
        }

        BatchInfo info;
        info.expires_at = params.expires_at;
        info.depth = params.depth;
        info.bucket_depth = params.bucket_depth;
        info.amount_per_chunk = params.amount_per_chunk;
        info.immutable = params.immutable;
        info.owner = params.owner;
        batches_.emplace(id, std::move(info));

        nectar::core::log_debug("auth", "batch %s added depth=%u expires_at=%llu", nectar::core::to_hex(id).c_str(),
            static_cast<unsigned>(params.depth), static_cast<unsigned long long>(params.expires_at));
        return nectar::core::ok_status();
    }

    Status PostageAuthorizer::validate(const nectar::chunk::Chunk& chunk, const Stamp& proof) {
        return validate_address(nectar::chunk::chunk_address(chunk), proof);
    }

    Status PostageAuthorizer::validate_address(const ChunkAddress& chunk, const Stamp& proof) {
        auto it = batches_.find(proof.batch_id);
        if (it == batches_.end()) {
            return auth_error(StatusCode::NotFound);
        }
        BatchInfo& batch = it->second;

        if (batch.expires_at <= proof.timestamp) {
            return auth_error(StatusCode::Expired);
        }

        const u64 packed = nectar::postage::stamp_index_pack(proof.index);
        if (batch.used_stamps.count(packed) != 0) {
            return auth_error(StatusCode::StampUsed, proof.index.x, proof.index.y);
        }

        if (batch.full()) {
            return auth_error(StatusCode::CapacityExceeded);
        }

        if (!batch.index_fits(chunk, proof.index)) {
            return auth_error(StatusCode::InvalidStampIndex, proof.index.x, proof.index.y);
        }

        Address issuer{};
        const Status st = nectar::postage::stamp_recover_issuer(proof, chunk, &issuer);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        if (batch.owner && *batch.owner != issuer) {
            nectar::core::log_debug("auth", "stamp issuer %s is not the owner of %s",
                nectar::core::to_hex(issuer).c_str(), nectar::core::to_hex(proof.batch_id).c_str());
            return auth_error(StatusCode::Crypto);
        }

        batch.used_stamps.insert(packed);
        auths_.add(chunk, proof.batch_id, packed);
        return nectar::core::ok_status();
    }

    Status PostageAuthorizer::cleanup_expired(Timestamp now, u64* removed) {
        if (removed == nullptr) {
            return auth_error(StatusCode::Invalid);
        }
        u64 total = 0;
        std::size_t batches = 0;
        for (auto it = batches_.begin(); it != batches_.end();) {
            if (it->second.expires_at <= now) {
                total += auths_.remove_batch(it->first);
                it = batches_.erase(it);
                ++batches;
            } else {
                ++it;
            }
        }
        if (batches > 0) {
            nectar::core::log_info("auth", "expired %zu batches, %llu authorizations", batches,
                static_cast<unsigned long long>(total));
        }
        *removed = total;
        return nectar::core::ok_status();
    }

    u64 PostageAuthorizer::reserved_chunks() const noexcept {
        u64 total = 0;
        for (const auto& [id, batch] : batches_) {
            const u64 n = batch.max_stamps();
            total = (n > UINT64_MAX - total) ? UINT64_MAX : total + n;
        }
        return total;
    }

    u64 PostageAuthorizer::available_chunks() const noexcept {
        const u64 reserved = reserved_chunks();
        const u64 used = authorized_chunk_count();
        return reserved > used ? reserved - used : 0;
    }

    const BatchInfo* PostageAuthorizer::find_batch(const BatchId& id) const {
        auto it = batches_.find(id);
        return it == batches_.end() ? nullptr : &it->second;
    }

    std::array<u8, nectar::postage::kStampSize> proof_data(const Stamp& proof) noexcept {
        return nectar::postage::stamp_to_bytes(proof);
    }
} // namespace nectar::auth
