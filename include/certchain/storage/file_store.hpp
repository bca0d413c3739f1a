#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <shared_mutex>
#include <unordered_map>

#include "document_store.hpp"

namespace certchain::storage {

    using namespace datapod;

    /// One stored document as it sits in a collection file
    struct DocumentRecord {
        String key;
        Vector<u8> body;
        i64 stored_at = 0;

        auto members() { return std::tie(key, body, stored_at); }
        auto members() const { return std::tie(key, body, stored_at); }
    };

    // ===========================================
    // FileStore - one append-only file per collection
    // ===========================================

    /// Every put() appends a length-prefixed record to <path>/<collection>.dat. The newest record for a key
    /// wins; the index of key -> offset is rebuilt from the files on open().
    class FileStore : public DocumentStore {
      public:
        inline FileStore() : is_open_(false), sync_mode_(OpenOptions::Synchronous::NORMAL) {}

        // Non-copyable
        FileStore(const FileStore &) = delete;
        FileStore &operator=(const FileStore &) = delete;

        /// Open or create storage at given path (directory)
        inline Result<void, Error> open(const String &path, const OpenOptions &opts = OpenOptions{}) {
            std::unique_lock lock(mutex_);
            try {
                base_path_ = std::string(path.c_str());
                sync_mode_ = opts.sync_mode;

                std::filesystem::create_directories(base_path_);
                loadIndexes();

                is_open_ = true;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                return Result<void, Error>::err(store_failed(String(e.what())));
            }
        }

        inline void close() {
            std::unique_lock lock(mutex_);
            is_open_ = false;
            collections_.clear();
        }

        inline bool isOpen() const {
            std::shared_lock lock(mutex_);
            return is_open_;
        }

        inline Result<void, Error> put(const std::string &collection, const std::string &key,
                                       const ByteBuf &body) override {
            std::unique_lock lock(mutex_);
            if (!is_open_)
                return Result<void, Error>::err(store_failed("Store not open"));

            DocumentRecord record;
            record.key = String(key.c_str());
            record.body = Vector<u8>(body.begin(), body.end());
            record.stored_at = currentTimestamp();

            try {
                u64 offset;
                appendRecord(collectionPath(collection), record, offset);
                auto &index = collections_[collection];
                if (index.offsets.find(key) == index.offsets.end())
                    index.order.push_back(key);
                index.offsets[key] = offset;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                return Result<void, Error>::err(store_failed(String(e.what())));
            }
        }

        inline Result<ByteBuf, Error> get(const std::string &collection, const std::string &key) override {
            std::shared_lock lock(mutex_);
            if (!is_open_)
                return Result<ByteBuf, Error>::err(store_failed("Store not open"));

            auto coll = collections_.find(collection);
            if (coll == collections_.end())
                return Result<ByteBuf, Error>::err(missing(collection, key));
            auto it = coll->second.offsets.find(key);
            if (it == coll->second.offsets.end())
                return Result<ByteBuf, Error>::err(missing(collection, key));

            return readBodyAt(collectionPath(collection), it->second);
        }

        inline Result<std::vector<ByteBuf>, Error> listAll(const std::string &collection) override {
            std::shared_lock lock(mutex_);
            if (!is_open_)
                return Result<std::vector<ByteBuf>, Error>::err(store_failed("Store not open"));

            std::vector<ByteBuf> bodies;
            auto coll = collections_.find(collection);
            if (coll == collections_.end())
                return Result<std::vector<ByteBuf>, Error>::ok(bodies);

            for (const auto &key : coll->second.order) {
                auto body = readBodyAt(collectionPath(collection), coll->second.offsets.at(key));
                if (!body.is_ok())
                    return Result<std::vector<ByteBuf>, Error>::err(body.error());
                bodies.push_back(body.value());
            }
            return Result<std::vector<ByteBuf>, Error>::ok(bodies);
        }

        inline Result<bool, Error> contains(const std::string &collection, const std::string &key) override {
            std::shared_lock lock(mutex_);
            if (!is_open_)
                return Result<bool, Error>::err(store_failed("Store not open"));
            auto coll = collections_.find(collection);
            return Result<bool, Error>::ok(coll != collections_.end() &&
                                           coll->second.offsets.find(key) != coll->second.offsets.end());
        }

      private:
        struct CollectionIndex {
            std::unordered_map<std::string, u64> offsets; // key -> offset of newest record
            std::vector<std::string> order;              // first-write order
        };

        inline std::filesystem::path collectionPath(const std::string &collection) const {
            return base_path_ / (collection + ".dat");
        }

        // ===========================================
        // File I/O with datapod serialization
        // ===========================================

        inline void appendRecord(const std::filesystem::path &file, const DocumentRecord &record, u64 &offset) {
            std::ofstream out(file, std::ios::binary | std::ios::app);
            if (!out)
                throw std::runtime_error("Failed to open " + file.string() + " for writing");

            offset = out.tellp();

            // Serialize using datapod (need mutable copy)
            DocumentRecord mutable_record = record;
            auto buffer = datapod::serialize(mutable_record);
            u32 len = static_cast<u32>(buffer.size());

            out.write(reinterpret_cast<const char *>(&len), sizeof(len));
            out.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());
            if (!out)
                throw std::runtime_error("Failed to write " + file.string());

            if (sync_mode_ == OpenOptions::Synchronous::FULL) {
                out.flush();
            }
        }

        inline Result<ByteBuf, Error> readBodyAt(const std::filesystem::path &file, u64 offset) const {
            std::ifstream in(file, std::ios::binary);
            if (!in)
                return Result<ByteBuf, Error>::err(store_failed(String(("Cannot read " + file.string()).c_str())));

            in.seekg(offset);

            u32 len;
            in.read(reinterpret_cast<char *>(&len), sizeof(len));
            if (!in)
                return Result<ByteBuf, Error>::err(corrupt_record("Truncated record header"));

            ByteBuf data(len);
            in.read(reinterpret_cast<char *>(data.data()), len);
            if (!in)
                return Result<ByteBuf, Error>::err(corrupt_record("Truncated record body"));

            try {
                auto record = datapod::deserialize<Mode::NONE, DocumentRecord>(data);
                return Result<ByteBuf, Error>::ok(ByteBuf(record.body.begin(), record.body.end()));
            } catch (const std::exception &e) {
                return Result<ByteBuf, Error>::err(corrupt_record(String(e.what())));
            }
        }

        // ===========================================
        // Index management
        // ===========================================

        inline void loadIndexes() {
            collections_.clear();
            for (const auto &entry : std::filesystem::directory_iterator(base_path_)) {
                if (!entry.is_regular_file() || entry.path().extension() != ".dat")
                    continue;
                loadCollectionIndex(entry.path().stem().string(), entry.path());
            }
        }

        inline void loadCollectionIndex(const std::string &collection, const std::filesystem::path &file) {
            std::ifstream in(file, std::ios::binary);
            if (!in)
                return;

            auto &index = collections_[collection];
            u64 good_end = 0;
            while (in) {
                u64 record_offset = in.tellg();

                u32 len;
                in.read(reinterpret_cast<char *>(&len), sizeof(len));
                if (!in)
                    break;

                ByteBuf data(len);
                in.read(reinterpret_cast<char *>(data.data()), len);
                if (!in)
                    break; // torn tail from an interrupted write

                auto record = datapod::deserialize<Mode::NONE, DocumentRecord>(data);
                std::string key(record.key.c_str());
                if (index.offsets.find(key) == index.offsets.end())
                    index.order.push_back(key);
                index.offsets[key] = record_offset;
                good_end = record_offset + sizeof(len) + len;
            }
            in.close();

            // New records are appended, so a torn tail must go before the next put()
            auto file_size = std::filesystem::file_size(file);
            if (file_size > good_end) {
                std::cout << "Discarding " << (file_size - good_end) << " torn bytes from " << file.string()
                          << std::endl;
                std::filesystem::resize_file(file, good_end);
            }
        }

        // ===========================================
        // Member variables
        // ===========================================

        std::filesystem::path base_path_;
        bool is_open_;
        OpenOptions::Synchronous sync_mode_;
        std::map<std::string, CollectionIndex> collections_;
        mutable std::shared_mutex mutex_;
    };

} // namespace certchain::storage
