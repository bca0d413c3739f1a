#pragma once

#include <mutex>
#include <string>

#include "document_store.hpp"

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace certchain::storage {

    // ===========================================
    // SqliteStore - documents table in a SQLite database
    // ===========================================

    /// All collections share one table keyed by (collection, doc_key). A put() on an existing key updates the
    /// body in place and keeps the row's sequence number, so listAll() stays in first-write order.
    class SqliteStore : public DocumentStore {
      public:
        SqliteStore();
        ~SqliteStore() override;

        // Non-copyable
        SqliteStore(const SqliteStore &) = delete;
        SqliteStore &operator=(const SqliteStore &) = delete;

        /// Open (or create) the database file and its schema. ":memory:" gives a private in-memory database.
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});
        void close();
        bool isOpen() const;

        dp::Result<void, dp::Error> put(const std::string &collection, const std::string &key,
                                        const dp::ByteBuf &body) override;
        dp::Result<dp::ByteBuf, dp::Error> get(const std::string &collection, const std::string &key) override;
        dp::Result<std::vector<dp::ByteBuf>, dp::Error> listAll(const std::string &collection) override;

        /// Number of documents in a collection
        dp::Result<dp::i64, dp::Error> count(const std::string &collection);

      private:
        void applyPragmas(const OpenOptions &opts);
        bool executeSql(const std::string &sql);
        dp::Error lastError(const std::string &context) const;

        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;
        mutable std::mutex mutex_;
    };

} // namespace certchain::storage
