#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "nectar/core/errors.hpp"
#include "nectar/postage/batch_store.hpp"

struct sqlite3;

namespace nectar::db {
    using nectar::core::Status;

    struct DbConfig {
        // nullptr opens a private in-memory database.
        const char* path{nullptr};
    };

    // SQLite-backed batch records plus accountant snapshots. Journal mode
    // comes from NECTAR_DB_JOURNAL_MODE (default WAL). Calls are serialized
    // on an internal mutex.
    class SqliteBatchStore final : public nectar::postage::BatchStore {
    public:
        // Db/Io with aux = SQLite result code when the file cannot be opened
        // or the schema cannot be applied.
        static Status open(const DbConfig& cfg, std::unique_ptr<SqliteBatchStore>* out);

        ~SqliteBatchStore() override;

        SqliteBatchStore(const SqliteBatchStore&) = delete;
        SqliteBatchStore& operator=(const SqliteBatchStore&) = delete;

        Status get(const nectar::core::BatchId& id, nectar::postage::Batch* out) override;
        Status put(const nectar::postage::Batch& batch) override;
        Status remove(const nectar::core::BatchId& id) override;

        Status count(nectar::core::u64* out);

        // Opaque BucketAccountant::snapshot() bytes, keyed by batch id.
        Status save_snapshot(const nectar::core::BatchId& id, const std::vector<nectar::core::u8>& snapshot,
            nectar::core::Timestamp updated_at);
        Status load_snapshot(const nectar::core::BatchId& id, std::vector<nectar::core::u8>* out);

    private:
        explicit SqliteBatchStore(sqlite3* db) noexcept : db_(db) {}

        std::mutex mutex_;
        sqlite3* db_{nullptr};
    };

} // namespace nectar::db
