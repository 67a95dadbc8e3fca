#include "nectar/postage/batch_store.hpp"

namespace nectar::postage {

    Status MemoryBatchStore::get(const BatchId& id, Batch* out) {
        if (out == nullptr) {
            return nectar::core::make_status(nectar::core::StatusDomain::Postage, nectar::core::StatusCode::Invalid);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = batches_.find(id);
        if (it == batches_.end()) {
            return nectar::core::make_status(nectar::core::StatusDomain::Postage, nectar::core::StatusCode::NotFound);
        }
        *out = it->second;
        return nectar::core::ok_status();
    }

    Status MemoryBatchStore::put(const Batch& batch) {
        std::lock_guard<std::mutex> lock(mutex_);
        batches_[batch.id] = batch;
        return nectar::core::ok_status();
    }

    Status MemoryBatchStore::remove(const BatchId& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (batches_.erase(id) == 0) {
            return nectar::core::make_status(nectar::core::StatusDomain::Postage, nectar::core::StatusCode::NotFound);
        }
        return nectar::core::ok_status();
    }

    std::size_t MemoryBatchStore::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return batches_.size();
    }
} // namespace nectar::postage
