// STAKEVAULT - LevelDB Wrapper
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// LevelDB implementation of the database interface, plus the in-memory
// database used when LevelDB is not built in and by tests.

#ifndef STAKEVAULT_DB_LEVELDB_H
#define STAKEVAULT_DB_LEVELDB_H

#include <stakevault/db/database.h>
#include <map>
#include <mutex>

#ifdef STAKEVAULT_USE_LEVELDB
#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#endif

namespace stakevault {
namespace db {

#ifdef STAKEVAULT_USE_LEVELDB

// ============================================================================
// LevelDB Database
// ============================================================================

/// Map a LevelDB status onto ours
Status FromLevelDBStatus(const leveldb::Status& s);

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return FromLevelDBStatus(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache)
        : cache_(cache), db_(db) {}

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    const char* Backend() const override { return "leveldb"; }

private:
    // Declared first so the database closes before its cache is freed
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<leveldb::DB> db_;
};

#endif // STAKEVAULT_USE_LEVELDB

// ============================================================================
// In-Memory Database
// ============================================================================

class MemoryDatabase : public Database {
public:
    using Map = std::map<std::string, std::string>;

    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a snapshot taken at creation
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    const char* Backend() const override { return "memory"; }

    size_t Size() const;
    void Clear();

private:
    Map data_;
    mutable std::mutex mutex_;
};

class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(MemoryDatabase::Map snapshot)
        : data_(std::move(snapshot)), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override;

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }

private:
    MemoryDatabase::Map data_;
    MemoryDatabase::Map::const_iterator iter_;
};

} // namespace db
} // namespace stakevault

#endif // STAKEVAULT_DB_LEVELDB_H
