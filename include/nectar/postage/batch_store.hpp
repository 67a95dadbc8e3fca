#pragma once

#include <mutex>
#include <unordered_map>

#include "nectar/postage/batch.hpp"

namespace nectar::postage {

    // Source of batch records for accountant rehydration.
    class BatchStore {
    public:
        virtual ~BatchStore() = default;

        // NotFound when no record exists.
        virtual Status get(const BatchId& id, Batch* out) = 0;
        // Inserts or replaces.
        virtual Status put(const Batch& batch) = 0;
        // NotFound when no record exists.
        virtual Status remove(const BatchId& id) = 0;
    };

    class MemoryBatchStore final : public BatchStore {
    public:
        Status get(const BatchId& id, Batch* out) override;
        Status put(const Batch& batch) override;
        Status remove(const BatchId& id) override;

        [[nodiscard]] std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::unordered_map<BatchId, Batch, nectar::core::FixedBytesHash> batches_;
    };

} // namespace nectar::postage
