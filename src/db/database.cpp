// STAKEVAULT - Database Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <stakevault/db/database.h>
#include <stakevault/db/leveldb.h>
#include <stakevault/util/logging.h>

#include <system_error>

namespace stakevault {
namespace db {

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result;
    switch (code_) {
        case NOT_FOUND: result = "NotFound: "; break;
        case CORRUPTION: result = "Corruption: "; break;
        case NOT_SUPPORTED: result = "NotSupported: "; break;
        case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
        case IO_ERROR: result = "IOError: "; break;
        default: result = "Unknown: "; break;
    }
    return result + message_;
}

// ============================================================================
// Keys
// ============================================================================

std::string MakeSequenceKey(char prefix, uint64_t sequence) {
    std::string key(9, '\0');
    key[0] = prefix;
    for (int i = 0; i < 8; ++i) {
        key[1 + i] = static_cast<char>((sequence >> (8 * (7 - i))) & 0xFF);
    }
    return key;
}

std::optional<uint64_t> ParseSequenceKey(char prefix, const Slice& key) {
    if (key.size() != 9 || key[0] != prefix) {
        return std::nullopt;
    }
    uint64_t sequence = 0;
    for (size_t i = 1; i < 9; ++i) {
        sequence = (sequence << 8) | static_cast<uint8_t>(key[i]);
    }
    return sequence;
}

#ifdef STAKEVAULT_USE_LEVELDB

// ============================================================================
// LevelDB Database
// ============================================================================

Status FromLevelDBStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

namespace {

leveldb::ReadOptions ToLevelDB(const ReadOptions& opts) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = opts.verify_checksums;
    lo.fill_cache = opts.fill_cache;
    return lo;
}

leveldb::WriteOptions ToLevelDB(const WriteOptions& opts) {
    leveldb::WriteOptions lo;
    lo.sync = opts.sync;
    return lo;
}

leveldb::Slice ToLevelDB(const Slice& s) {
    return leveldb::Slice(s.data(), s.size());
}

} // anonymous namespace

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    return FromLevelDBStatus(db_->Get(ToLevelDB(options), ToLevelDB(key), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    return FromLevelDBStatus(db_->Put(ToLevelDB(options), ToLevelDB(key), ToLevelDB(value)));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    return FromLevelDBStatus(db_->Delete(ToLevelDB(options), ToLevelDB(key)));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    return FromLevelDBStatus(db_->Write(ToLevelDB(options), &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(ToLevelDB(options)));
}

#endif // STAKEVAULT_USE_LEVELDB

// ============================================================================
// In-Memory Database
// ============================================================================

Status MemoryDatabase::Get(const ReadOptions&, const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions&, const Slice& key, const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions&, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions&, WriteBatch* batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    });
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions&) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

void MemoryDatabase::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

void MemoryIterator::Next() {
    if (iter_ != data_.end()) {
        ++iter_;
    }
}

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
#ifdef STAKEVAULT_USE_LEVELDB
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;
    lo.compression = options.compression ? leveldb::kSnappyCompression
                                         : leveldb::kNoCompression;

    std::unique_ptr<leveldb::Cache> cache;
    if (options.block_cache_size > 0) {
        cache.reset(leveldb::NewLRUCache(options.block_cache_size));
        lo.block_cache = cache.get();
    }

    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &raw);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot open " << path.string() << ": " << s.ToString();
        return {FromLevelDBStatus(s), nullptr};
    }

    LOG_INFO(util::LogCategory::DB) << "Opened LevelDB at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(raw, cache.release())};
#else
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError(path.string() + ": " + ec.message()), nullptr};
        }
    } else if (!std::filesystem::exists(path)) {
        return {Status::InvalidArgument(path.string() + " does not exist"), nullptr};
    }

    LOG_WARN(util::LogCategory::DB) << "LevelDB not built in; journal for "
                                    << path.string() << " is held in memory";
    return {Status::Ok(), std::make_unique<MemoryDatabase>()};
#endif
}

} // namespace db
} // namespace stakevault
