#include "storage/mail_store.hpp"
#include "logger.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <limits>

namespace mailcatch {

namespace {

// Finalizes the statement on every exit path, including a throwing visitor
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }

    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

    void bind_text(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    void bind_blob(int index, const std::string& value) {
        sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    std::string column_text(int index) const {
        const auto* text = sqlite3_column_text(stmt_, index);
        int size = sqlite3_column_bytes(stmt_, index);
        return text ? std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size)) : std::string();
    }

    std::string column_blob(int index) const {
        const void* blob = sqlite3_column_blob(stmt_, index);
        int size = sqlite3_column_bytes(stmt_, index);
        return blob ? std::string(static_cast<const char*>(blob), static_cast<size_t>(size)) : std::string();
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

}  // namespace

MailStore::MailStore(const std::filesystem::path& db_path)
    : db_path_(db_path) {
}

MailStore::~MailStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool MailStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        if (auto parent = db_path_.parent_path(); !parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        last_error_ = e.what();
        LOG_ERROR(last_error_);
        return false;
    }

    int rc = sqlite3_open(db_path_.string().c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = std::string("Cannot open database: ") + sqlite3_errmsg(db_);
        LOG_ERROR(last_error_);
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, 5000);
    execute_sql("PRAGMA journal_mode=WAL;");
    execute_sql("PRAGMA synchronous=FULL;");

    const char* mails_table = R"(
        CREATE TABLE IF NOT EXISTS mails (
            id TEXT PRIMARY KEY NOT NULL,
            data BLOB NOT NULL
        ) WITHOUT ROWID;
    )";

    if (!execute_sql(mails_table)) {
        return false;
    }

    LOG_INFO_FMT("Mail store opened at {}", db_path_.string());
    return true;
}

bool MailStore::execute_sql(const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = std::string("SQL error: ") + (err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        LOG_ERROR(last_error_);
        return false;
    }
    return true;
}

void MailStore::fail(const std::string& context) {
    last_error_ = context + ": " + (db_ ? sqlite3_errmsg(db_) : "database not open");
    LOG_ERROR(last_error_);
    throw StorageError(last_error_);
}

void MailStore::put(const std::string& id, const Mail& mail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) fail("put");

    Statement stmt(db_, "INSERT OR REPLACE INTO mails (id, data) VALUES (?, ?);");
    if (!stmt.ok()) fail("put");

    stmt.bind_text(1, id);
    stmt.bind_blob(2, mail.serialize());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        fail("put " + id);
    }
}

std::optional<Mail> MailStore::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) fail("get");

    Statement stmt(db_, "SELECT data FROM mails WHERE id = ?;");
    if (!stmt.ok()) fail("get");

    stmt.bind_text(1, id);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        fail("get " + id);
    }

    auto mail = Mail::deserialize(stmt.column_blob(0));
    if (!mail) {
        LOG_ERROR_FMT("Stored value for {} does not decode", id);
        throw CorruptRecordError(id);
    }
    return mail;
}

RemoveResult MailStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        last_error_ = "remove: database not open";
        return RemoveResult::Failed;
    }

    Statement stmt(db_, "DELETE FROM mails WHERE id = ?;");
    if (!stmt.ok()) {
        last_error_ = std::string("remove: ") + sqlite3_errmsg(db_);
        LOG_ERROR(last_error_);
        return RemoveResult::Failed;
    }

    stmt.bind_text(1, id);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        last_error_ = "remove " + id + ": " + sqlite3_errmsg(db_);
        LOG_ERROR(last_error_);
        return RemoveResult::Failed;
    }

    return sqlite3_changes(db_) > 0 ? RemoveResult::Removed : RemoveResult::Missing;
}

void MailStore::iterate(size_t offset, const Visitor& visitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) fail("iterate");

    Statement stmt(db_, "SELECT id, data FROM mails ORDER BY id LIMIT -1 OFFSET ?;");
    if (!stmt.ok()) fail("iterate");

    auto clamped = std::min<size_t>(offset, static_cast<size_t>(std::numeric_limits<sqlite3_int64>::max()));
    sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(clamped));

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        if (!visitor(stmt.column_text(0), stmt.column_blob(1))) {
            return;
        }
    }

    if (rc != SQLITE_DONE) {
        fail("iterate");
    }
}

size_t MailStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) fail("count");

    Statement stmt(db_, "SELECT COUNT(*) FROM mails;");
    if (!stmt.ok() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
        fail("count");
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

std::string MailStore::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

}  // namespace mailcatch
