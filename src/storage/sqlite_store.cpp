#include <certchain/storage/sqlite_store.hpp>
#include <iostream>
#include <sqlite3.h>

namespace certchain::storage {

    namespace {

        const char *DOCUMENTS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS documents (
                collection TEXT NOT NULL,
                doc_key TEXT NOT NULL,
                body BLOB NOT NULL,
                seq INTEGER NOT NULL,
                updated_at INTEGER NOT NULL,
                PRIMARY KEY (collection, doc_key)
            )
        )";

        const char *IDX_DOCUMENTS_SEQ = "CREATE INDEX IF NOT EXISTS idx_documents_seq ON documents(collection, seq)";

        dp::ByteBuf columnBlob(sqlite3_stmt *stmt, int column) {
            const auto *data = static_cast<const dp::u8 *>(sqlite3_column_blob(stmt, column));
            int size = sqlite3_column_bytes(stmt, column);
            dp::ByteBuf body;
            for (int i = 0; i < size; i++)
                body.push_back(data[i]);
            return body;
        }

    } // namespace

    SqliteStore::SqliteStore() : db_(nullptr), is_open_(false) {}

    SqliteStore::~SqliteStore() { close(); }

    dp::Result<void, dp::Error> SqliteStore::open(const std::string &path, const OpenOptions &opts) {
        std::lock_guard<std::mutex> lock(mutex_);
        // Re-opening switches databases; the previous handle is released first
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
        }

        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            auto error = lastError("Failed to open " + path);
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(error);
        }

        db_path_ = path;
        is_open_ = true;
        applyPragmas(opts);

        if (!executeSql(DOCUMENTS_TABLE) || !executeSql(IDX_DOCUMENTS_SEQ)) {
            auto error = lastError("Failed to create schema");
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(error);
        }
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteStore::close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
        }
    }

    bool SqliteStore::isOpen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return is_open_;
    }

    void SqliteStore::applyPragmas(const OpenOptions &opts) {
        if (!db_)
            return;

        if (opts.enable_wal) {
            executeSql("PRAGMA journal_mode=WAL;");
        }

        executeSql("PRAGMA busy_timeout=" + std::to_string(opts.busy_timeout_ms) + ";");

        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            executeSql("PRAGMA synchronous=OFF;");
            break;
        case OpenOptions::Synchronous::NORMAL:
            executeSql("PRAGMA synchronous=NORMAL;");
            break;
        case OpenOptions::Synchronous::FULL:
            executeSql("PRAGMA synchronous=FULL;");
            break;
        }
    }

    dp::Result<void, dp::Error> SqliteStore::put(const std::string &collection, const std::string &key,
                                                 const dp::ByteBuf &body) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(store_failed("Store not open"));

        sqlite3_stmt *stmt;
        const char *sql = "INSERT INTO documents (collection, doc_key, body, seq, updated_at) "
                          "VALUES (?1, ?2, ?3, (SELECT COALESCE(MAX(seq), 0) + 1 FROM documents WHERE collection = ?1), ?4) "
                          "ON CONFLICT(collection, doc_key) DO UPDATE SET body = excluded.body, "
                          "updated_at = excluded.updated_at";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(lastError("Failed to prepare put"));
        }

        sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_blob(stmt, 3, body.data(), static_cast<int>(body.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 4, currentTimestamp());

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        if (!success)
            return dp::Result<void, dp::Error>::err(lastError("Failed to store " + collection + "/" + key));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<dp::ByteBuf, dp::Error> SqliteStore::get(const std::string &collection, const std::string &key) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<dp::ByteBuf, dp::Error>::err(store_failed("Store not open"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT body FROM documents WHERE collection = ? AND doc_key = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<dp::ByteBuf, dp::Error>::err(lastError("Failed to prepare get"));
        }

        sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            auto body = columnBlob(stmt, 0);
            sqlite3_finalize(stmt);
            return dp::Result<dp::ByteBuf, dp::Error>::ok(body);
        }
        sqlite3_finalize(stmt);

        if (rc == SQLITE_DONE)
            return dp::Result<dp::ByteBuf, dp::Error>::err(missing(collection, key));
        return dp::Result<dp::ByteBuf, dp::Error>::err(lastError("Failed to read " + collection + "/" + key));
    }

    dp::Result<std::vector<dp::ByteBuf>, dp::Error> SqliteStore::listAll(const std::string &collection) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<std::vector<dp::ByteBuf>, dp::Error>::err(store_failed("Store not open"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT body FROM documents WHERE collection = ? ORDER BY seq ASC";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<std::vector<dp::ByteBuf>, dp::Error>::err(lastError("Failed to prepare listAll"));
        }

        sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);

        std::vector<dp::ByteBuf> bodies;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            bodies.push_back(columnBlob(stmt, 0));
        }
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE)
            return dp::Result<std::vector<dp::ByteBuf>, dp::Error>::err(lastError("Failed to list " + collection));
        return dp::Result<std::vector<dp::ByteBuf>, dp::Error>::ok(bodies);
    }

    dp::Result<dp::i64, dp::Error> SqliteStore::count(const std::string &collection) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<dp::i64, dp::Error>::err(store_failed("Store not open"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT COUNT(*) FROM documents WHERE collection = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<dp::i64, dp::Error>::err(lastError("Failed to prepare count"));
        }

        sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);

        dp::i64 total = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            total = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return dp::Result<dp::i64, dp::Error>::ok(total);
    }

    bool SqliteStore::executeSql(const std::string &sql) {
        if (!db_)
            return false;

        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);

        if (rc != SQLITE_OK) {
            if (errmsg) {
                std::cout << "SQL error: " << errmsg << std::endl;
                sqlite3_free(errmsg);
            }
            return false;
        }

        return true;
    }

    dp::Error SqliteStore::lastError(const std::string &context) const {
        std::string detail = db_ ? sqlite3_errmsg(db_) : "no database handle";
        return store_failed(dp::String((context + ": " + detail).c_str()));
    }

} // namespace certchain::storage
