// POLITY - Typed Record Store
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Thin typed layer over a Database. Records are serialized with the
// project's DataStream format and staged into WriteBatches so related
// records can be committed atomically.

#ifndef POLITY_DB_RECORDSTORE_H
#define POLITY_DB_RECORDSTORE_H

#include "polity/db/database.h"

#include <functional>
#include <string>

namespace polity {
namespace db {

class RecordStore {
public:
    /// db must outlive the store
    explicit RecordStore(Database* db, bool sync = false) : db_(db) {
        writeOptions_.sync = sync;
    }

    Database* GetDatabase() const { return db_; }

    /// Read and decode one record
    template<typename T>
    Status Read(const std::string& key, T* out) const {
        std::string raw;
        Status s = db_->Get(key, &raw);
        if (!s.ok()) {
            return s;
        }
        if (!DeserializeFromString(raw, *out)) {
            return Status::Corruption("undecodable record under key prefix '" +
                                      key.substr(0, 1) + "'");
        }
        return Status::Ok();
    }

    /// Stage a record into batch
    template<typename T>
    static void Put(WriteBatch& batch, const std::string& key, const T& obj) {
        batch.Put(key, SerializeToString(obj));
    }

    /// Write one record immediately
    template<typename T>
    Status Write(const std::string& key, const T& obj) {
        WriteBatch batch;
        Put(batch, key, obj);
        return Commit(batch);
    }

    Status Erase(const std::string& key) {
        return db_->Delete(writeOptions_, key);
    }

    /// Apply a batch atomically
    Status Commit(WriteBatch& batch) {
        if (batch.Empty()) {
            return Status::Ok();
        }
        return db_->Write(writeOptions_, &batch);
    }

    /**
     * Decode every record under keyPrefix. Stops with Corruption at the
     * first record that fails to decode.
     */
    template<typename T>
    Status ForEach(char keyPrefix, const std::function<void(T&&)>& visitor) const {
        Status decodeStatus;
        Status scan = ScanPrefix(*db_, MakeKey(keyPrefix),
            [&](const Slice& key, const Slice& value) {
                T obj;
                if (!DeserializeFromBytes(reinterpret_cast<const uint8_t*>(value.data()),
                                          value.size(), obj)) {
                    decodeStatus = Status::Corruption("undecodable record " +
                                                      std::to_string(key.size()) +
                                                      "-byte key under prefix '" +
                                                      std::string(1, keyPrefix) + "'");
                    return false;
                }
                visitor(std::move(obj));
                return true;
            });
        return scan.ok() ? decodeStatus : scan;
    }

    /// Named 64-bit counter; defaultValue if never written
    Status ReadCounter(const std::string& name, uint64_t defaultValue, uint64_t* out) const {
        Status s = Read(MakeKey(prefix::COUNTER, name), out);
        if (s.IsNotFound()) {
            *out = defaultValue;
            return Status::Ok();
        }
        return s;
    }

    static void PutCounter(WriteBatch& batch, const std::string& name, uint64_t value) {
        Put(batch, MakeKey(prefix::COUNTER, name), value);
    }

private:
    Database* db_;
    WriteOptions writeOptions_;
};

} // namespace db
} // namespace polity

#endif // POLITY_DB_RECORDSTORE_H
