#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <string>
#include <tuple>
#include <vector>

#include "certchain/common/error.hpp"

namespace certchain::storage {

    inline dp::i64 currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    /// Storage configuration options
    struct OpenOptions {
        bool enable_wal = true;     // SqliteStore only
        dp::i32 busy_timeout_ms = 5000; // SqliteStore only
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;

        auto members() { return std::tie(enable_wal, busy_timeout_ms, sync_mode); }
        auto members() const { return std::tie(enable_wal, busy_timeout_ms, sync_mode); }
    };

    /// Durable key/value store of serialized records, grouped into named collections.
    ///
    /// put() overwrites, get() reports a miss as ERR_DOCUMENT_NOT_FOUND, listAll() returns the latest body of
    /// every key in the order the keys were first written. Implementations are safe to call from several
    /// threads.
    class DocumentStore {
      public:
        virtual ~DocumentStore() = default;

        virtual dp::Result<void, dp::Error> put(const std::string &collection, const std::string &key,
                                                const dp::ByteBuf &body) = 0;

        virtual dp::Result<dp::ByteBuf, dp::Error> get(const std::string &collection, const std::string &key) = 0;

        virtual dp::Result<std::vector<dp::ByteBuf>, dp::Error> listAll(const std::string &collection) = 0;

        virtual dp::Result<bool, dp::Error> contains(const std::string &collection, const std::string &key) {
            auto found = get(collection, key);
            if (found.is_ok())
                return dp::Result<bool, dp::Error>::ok(true);
            if (found.error().code == ERR_DOCUMENT_NOT_FOUND)
                return dp::Result<bool, dp::Error>::ok(false);
            return dp::Result<bool, dp::Error>::err(found.error());
        }

      protected:
        static inline dp::Error missing(const std::string &collection, const std::string &key) {
            return document_not_found(dp::String((collection + "/" + key + " not found").c_str()));
        }
    };

} // namespace certchain::storage
