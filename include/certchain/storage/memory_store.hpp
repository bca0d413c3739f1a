#pragma once

#include <map>
#include <shared_mutex>
#include <unordered_map>

#include "document_store.hpp"

namespace certchain::storage {

    /// Process-local DocumentStore. Nothing survives the process; used by tests and throwaway runs.
    class MemoryStore : public DocumentStore {
      public:
        MemoryStore() = default;

        inline dp::Result<void, dp::Error> put(const std::string &collection, const std::string &key,
                                               const dp::ByteBuf &body) override {
            std::unique_lock lock(mutex_);
            auto &docs = collections_[collection];
            auto it = docs.index.find(key);
            if (it == docs.index.end()) {
                docs.index[key] = docs.bodies.size();
                docs.bodies.push_back(body);
            } else {
                docs.bodies[it->second] = body;
            }
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<dp::ByteBuf, dp::Error> get(const std::string &collection, const std::string &key) override {
            std::shared_lock lock(mutex_);
            auto coll = collections_.find(collection);
            if (coll == collections_.end())
                return dp::Result<dp::ByteBuf, dp::Error>::err(missing(collection, key));
            auto it = coll->second.index.find(key);
            if (it == coll->second.index.end())
                return dp::Result<dp::ByteBuf, dp::Error>::err(missing(collection, key));
            return dp::Result<dp::ByteBuf, dp::Error>::ok(coll->second.bodies[it->second]);
        }

        inline dp::Result<std::vector<dp::ByteBuf>, dp::Error> listAll(const std::string &collection) override {
            std::shared_lock lock(mutex_);
            auto coll = collections_.find(collection);
            if (coll == collections_.end())
                return dp::Result<std::vector<dp::ByteBuf>, dp::Error>::ok(std::vector<dp::ByteBuf>{});
            return dp::Result<std::vector<dp::ByteBuf>, dp::Error>::ok(coll->second.bodies);
        }

        inline size_t size(const std::string &collection) const {
            std::shared_lock lock(mutex_);
            auto coll = collections_.find(collection);
            return coll == collections_.end() ? 0 : coll->second.bodies.size();
        }

      private:
        struct Collection {
            std::unordered_map<std::string, size_t> index; // key -> position in bodies
            std::vector<dp::ByteBuf> bodies;               // first-write order
        };

        std::map<std::string, Collection> collections_;
        mutable std::shared_mutex mutex_;
    };

} // namespace certchain::storage
