#pragma once

#include "storage/mail.hpp"
#include <string>
#include <optional>
#include <filesystem>
#include <functional>
#include <mutex>
#include <stdexcept>

struct sqlite3;

namespace mailcatch {

// Raised when the database engine reports a failure
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised when a stored value does not decode into a Mail
class CorruptRecordError : public StorageError {
public:
    explicit CorruptRecordError(const std::string& id)
        : StorageError("Corrupt mail record: " + id), id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

enum class RemoveResult {
    Removed,   // key existed and is gone
    Missing,   // write succeeded, nothing was stored under the key
    Failed     // engine error
};

// Durable ordered map from mail id to encoded Mail, backed by one SQLite table.
// Every operation takes the same mutex, so callers see them in a single total order.
class MailStore {
public:
    // Visitor receives (id, encoded value) in ascending id order; return false to stop
    using Visitor = std::function<bool(const std::string& id, const std::string& encoded)>;

    explicit MailStore(const std::filesystem::path& db_path);
    ~MailStore();

    MailStore(const MailStore&) = delete;
    MailStore& operator=(const MailStore&) = delete;

    bool initialize();

    // Inserts or replaces the record stored under id
    void put(const std::string& id, const Mail& mail);
    std::optional<Mail> get(const std::string& id);
    RemoveResult remove(const std::string& id);

    // Skips the first offset entries, then hands entries to visitor until it returns false
    void iterate(size_t offset, const Visitor& visitor);
    size_t count();

    const std::filesystem::path& path() const { return db_path_; }
    std::string last_error() const;

private:
    bool execute_sql(const char* sql);
    [[noreturn]] void fail(const std::string& context);

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    std::string last_error_;
    mutable std::mutex mutex_;
};

}  // namespace mailcatch
