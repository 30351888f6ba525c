// POLITY - Database Abstraction Layer
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Abstract key-value store interface. Organization records, transition
// records, in-flight actions and invites are all persisted through it.

#ifndef POLITY_DB_DATABASE_H
#define POLITY_DB_DATABASE_H

#include "polity/core/serialize.h"
#include "polity/core/types.h"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace polity {
namespace db {

// ============================================================================
// Database Status
// ============================================================================

/**
 * Status returned by storage operations.
 */
class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR = 5,
    };
    
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}
    
    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }
    
    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    
    Code code() const { return code_; }
    const std::string& message() const { return message_; }
    
    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

// ============================================================================
// Slice
// ============================================================================

/**
 * Non-owning view of a byte range. The underlying buffer must outlive it.
 */
class Slice {
public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}
    
    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    
    std::string ToString() const { return std::string(data_, size_); }
    
    /// True if this slice begins with prefix
    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ &&
               std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Options
// ============================================================================

struct Options {
    /// Create the database if it doesn't exist
    bool create_if_missing = true;
    
    /// Fail if the database already exists
    bool error_if_exists = false;
    
    /// LRU block cache (default 8MB, 0 disables)
    size_t block_cache_size = 8 * 1024 * 1024;
    
    /// Bloom filter bits per key (0 disables)
    int bloom_filter_bits = 10;
};

struct ReadOptions {
    bool verify_checksums = false;
};

struct WriteOptions {
    /// Sync write to disk before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch
// ============================================================================

/**
 * A batch of puts and deletes applied atomically by Database::Write.
 */
class WriteBatch {
public:
    WriteBatch() = default;
    
    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }
    
    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }

    /// Append every operation of other after this batch's own
    void Append(const WriteBatch& other) {
        operations_.insert(operations_.end(), other.operations_.begin(),
                           other.operations_.end());
    }

    bool Empty() const { return operations_.empty(); }
    
    /// Visit operations in insertion order; a nullopt value is a delete
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;
};

// ============================================================================
// Iterator
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;
    
    virtual bool Valid() const = 0;
    
    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;
    
    virtual void Next() = 0;
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database
// ============================================================================

/**
 * Abstract interface for an ordered key-value database.
 */
class Database {
public:
    virtual ~Database() = default;
    
    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;
    
    Status Get(const Slice& key, std::string* value) {
        return Get(ReadOptions(), key, value);
    }
    
    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    
    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }
    
    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    
    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }
    
    /// Apply a batch of writes atomically
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    
    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }
    
    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;
    
    std::unique_ptr<Iterator> NewIterator() {
        return NewIterator(ReadOptions());
    }
    
    virtual Status Sync() { return Status::Ok(); }
};

// ============================================================================
// Factory Functions
// ============================================================================

/**
 * Open a LevelDB database at the specified path.
 * @return Pair of (status, database pointer); pointer is null on failure
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/**
 * Visit every entry whose key begins with keyPrefix, in key order.
 * The visitor returns false to stop early.
 */
Status ScanPrefix(Database& db, const std::string& keyPrefix,
                  const std::function<bool(const Slice& key, const Slice& value)>& visitor);

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return std::string(reinterpret_cast<const char*>(ss.data()), ss.size());
}

/// Returns false on truncated, malformed or trailing data
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    return DeserializeFromBytes(reinterpret_cast<const uint8_t*>(data.data()),
                                data.size(), obj);
}

// ============================================================================
// Key Prefixes
// ============================================================================

namespace prefix {
    constexpr char ORGANIZATION = 'o';    // org id -> organization record
    constexpr char TOMBSTONE = 'x';       // org id -> removal marker
    constexpr char TRANSITION = 't';      // transition id -> transition record
    constexpr char ACTION = 'a';          // action id -> action record
    constexpr char INVITE = 'i';          // invite id -> invite record
    constexpr char COUNTER = 'N';         // counter name -> next value
}

inline std::string MakeKey(char keyPrefix, const Slice& key) {
    std::string result;
    result.reserve(1 + key.size());
    result.push_back(keyPrefix);
    result.append(key.data(), key.size());
    return result;
}

inline std::string MakeKey(char keyPrefix) {
    return std::string(1, keyPrefix);
}

/// Prefix plus the big-endian id, so iteration follows numeric order
inline std::string MakeKey(char keyPrefix, uint64_t id) {
    std::string result;
    result.reserve(9);
    result.push_back(keyPrefix);
    for (int shift = 56; shift >= 0; shift -= 8) {
        result.push_back(static_cast<char>((id >> shift) & 0xFF));
    }
    return result;
}

inline std::string MakeKey(char keyPrefix, const Hash256& hash) {
    std::string result;
    result.reserve(1 + Hash256::SIZE);
    result.push_back(keyPrefix);
    result.append(reinterpret_cast<const char*>(hash.data()), Hash256::SIZE);
    return result;
}

} // namespace db
} // namespace polity

#endif // POLITY_DB_DATABASE_H
