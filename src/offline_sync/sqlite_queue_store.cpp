#include "offline_sync/sqlite_queue_store.hpp"

#include <array>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <sqlite3.h>

#include "offline_sync/errors.hpp"

namespace offline_sync {

namespace {

struct Migration final {
    int target_version;
    const char* sql;
};

// Each step runs in the same transaction as the user_version bump.
constexpr std::array<Migration, 2> k_migrations{{
    {1, R"(
        CREATE TABLE IF NOT EXISTS queued_messages (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            chat_id TEXT NOT NULL,
            payload BLOB NOT NULL,
            timestamp INTEGER NOT NULL,
            status TEXT NOT NULL DEFAULT 'pending',
            retry_count INTEGER NOT NULL DEFAULT 0,
            max_retries INTEGER NOT NULL DEFAULT 3,
            last_error TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_queued_messages_chat_id ON queued_messages(chat_id);
        CREATE INDEX IF NOT EXISTS idx_queued_messages_timestamp ON queued_messages(timestamp);
        CREATE INDEX IF NOT EXISTS idx_queued_messages_status ON queued_messages(status);
    )"},
    {2, R"(
        ALTER TABLE queued_messages ADD COLUMN next_attempt_at INTEGER NOT NULL DEFAULT 0;
    )"},
}};

constexpr std::string_view k_select_columns{
    "SELECT id, chat_id, payload, timestamp, status, retry_count, max_retries, last_error, next_attempt_at "
    "FROM queued_messages"
};

/** @brief Prepared statement owner; finalizes on scope exit. */
class Statement final {
  public:
    Statement(sqlite3* db, std::string_view sql)
        : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr) != SQLITE_OK) {
            throw StorageError(fmt::format("Failed to prepare statement: {}", sqlite3_errmsg(db_)));
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_text(int index, const std::string& value) {
        check_bind(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void bind_int64(int index, std::int64_t value) {
        check_bind(sqlite3_bind_int64(stmt_, index, value));
    }

    void bind_blob(int index, const Payload& value) {
        if (value.empty()) {
            // A null data pointer would bind SQL NULL and trip the NOT NULL constraint.
            check_bind(sqlite3_bind_zeroblob(stmt_, index, 0));
            return;
        }
        check_bind(sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void bind_null(int index) {
        check_bind(sqlite3_bind_null(stmt_, index));
    }

    /** @brief Advance; true while rows remain. */
    bool step() {
        const int result = sqlite3_step(stmt_);
        if (result == SQLITE_ROW) {
            return true;
        }
        if (result == SQLITE_DONE) {
            return false;
        }
        throw StorageError(fmt::format("Statement failed: {}", sqlite3_errmsg(db_)));
    }

    [[nodiscard]] std::int64_t column_int64(int index) const {
        return sqlite3_column_int64(stmt_, index);
    }

    [[nodiscard]] int column_int(int index) const {
        return sqlite3_column_int(stmt_, index);
    }

    [[nodiscard]] bool column_is_null(int index) const {
        return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
    }

    [[nodiscard]] std::string column_text(int index) const {
        const auto* text = sqlite3_column_text(stmt_, index);
        if (text == nullptr) {
            return {};
        }
        return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
    }

    [[nodiscard]] Payload column_blob(int index) const {
        const auto* blob = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt_, index));
        const int blob_size = sqlite3_column_bytes(stmt_, index);
        if (blob == nullptr || blob_size <= 0) {
            return {};
        }
        return Payload(blob, blob + blob_size);
    }

  private:
    void check_bind(int result) const {
        if (result != SQLITE_OK) {
            throw StorageError(fmt::format("Failed to bind parameter: {}", sqlite3_errmsg(db_)));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
};

int read_user_version(sqlite3* db) {
    Statement statement{db, "PRAGMA user_version"};
    if (!statement.step()) {
        throw StorageError("PRAGMA user_version returned no rows");
    }
    return statement.column_int(0);
}

QueuedMessage read_entry(const Statement& statement) {
    QueuedMessage entry{};
    entry.id = statement.column_int64(0);
    entry.chat_id = statement.column_text(1);
    entry.payload = statement.column_blob(2);
    entry.queued_at = statement.column_int64(3);

    const std::string str_status = statement.column_text(4);
    const std::optional<QueueStatus> status = parse_queue_status(str_status);
    if (!status.has_value()) {
        throw StorageError(fmt::format("Queue entry {} has unknown status '{}'", entry.id, str_status));
    }
    entry.status = status.value();

    entry.retry_count = statement.column_int(5);
    entry.max_retries = statement.column_int(6);
    if (!statement.column_is_null(7)) {
        entry.last_error = statement.column_text(7);
    }
    entry.next_attempt_at = statement.column_int64(8);
    return entry;
}

}  // namespace

SqliteQueueStore::SqliteQueueStore(std::filesystem::path database_path)
    : path_database_(std::move(database_path)),
      logger_(get_logger()) {}

SqliteQueueStore::~SqliteQueueStore() {
    std::scoped_lock lock(mutex_);
    if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteQueueStore::open() {
    std::scoped_lock lock(mutex_);
    if (db_ != nullptr) {
        return;
    }

    const std::string str_path = path_database_.string();
    if (str_path != k_in_memory_database && path_database_.has_parent_path()) {
        std::error_code error_directory;
        std::filesystem::create_directories(path_database_.parent_path(), error_directory);
        if (error_directory) {
            throw StorageError("Unable to create database directory at " + path_database_.parent_path().string());
        }
    }

    sqlite3* handle = nullptr;
    const int result = sqlite3_open_v2(
        str_path.c_str(),
        &handle,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    if (result != SQLITE_OK) {
        const std::string message = handle != nullptr ? sqlite3_errmsg(handle) : "out of memory";
        sqlite3_close(handle);
        throw StorageError(fmt::format("Cannot open database {}: {}", str_path, message));
    }
    db_ = handle;

    try {
        sqlite3_busy_timeout(db_, 5000);
        exec("PRAGMA journal_mode=WAL");
        migrate();
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    logger_->info(R"({{"component":"queue_store","action":"open","path":"{}","schema":{}}})", str_path, k_queue_schema_version);
}

QueueId SqliteQueueStore::add(const QueuedMessage& entry) {
    std::scoped_lock lock(mutex_);
    sqlite3* db = require_open();

    Statement statement{db, R"(
        INSERT INTO queued_messages
            (chat_id, payload, timestamp, status, retry_count, max_retries, last_error, next_attempt_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )"};
    statement.bind_text(1, entry.chat_id);
    statement.bind_blob(2, entry.payload);
    statement.bind_int64(3, entry.queued_at);
    statement.bind_text(4, std::string{to_string(entry.status)});
    statement.bind_int64(5, entry.retry_count);
    statement.bind_int64(6, entry.max_retries);
    if (entry.last_error.has_value()) {
        statement.bind_text(7, entry.last_error.value());
    } else {
        statement.bind_null(7);
    }
    statement.bind_int64(8, entry.next_attempt_at);
    statement.step();

    const QueueId queue_id = sqlite3_last_insert_rowid(db);
    logger_->debug("Stored queue entry {} for chat {}", queue_id, entry.chat_id);
    return queue_id;
}

std::optional<QueuedMessage> SqliteQueueStore::get(QueueId id) {
    std::scoped_lock lock(mutex_);
    Statement statement{require_open(), std::string{k_select_columns} + " WHERE id = ?"};
    statement.bind_int64(1, id);
    if (!statement.step()) {
        return std::nullopt;
    }
    return read_entry(statement);
}

std::vector<QueuedMessage> SqliteQueueStore::get_all(const std::optional<std::string>& chat_id) {
    std::scoped_lock lock(mutex_);
    std::string sql{k_select_columns};
    if (chat_id.has_value()) {
        sql += " WHERE chat_id = ?";
    }
    sql += " ORDER BY timestamp ASC, id ASC";

    Statement statement{require_open(), sql};
    if (chat_id.has_value()) {
        statement.bind_text(1, chat_id.value());
    }

    std::vector<QueuedMessage> entries;
    while (statement.step()) {
        entries.push_back(read_entry(statement));
    }
    return entries;
}

bool SqliteQueueStore::update(QueueId id, const QueuedMessageUpdate& update) {
    std::scoped_lock lock(mutex_);
    sqlite3* db = require_open();

    if (update.empty()) {
        Statement statement{db, "SELECT 1 FROM queued_messages WHERE id = ?"};
        statement.bind_int64(1, id);
        return statement.step();
    }

    std::string assignments;
    const auto append = [&assignments](std::string_view column) {
        if (!assignments.empty()) {
            assignments += ", ";
        }
        assignments += column;
        assignments += " = ?";
    };
    if (update.status) {
        append("status");
    }
    if (update.retry_count) {
        append("retry_count");
    }
    if (update.clear_last_error || update.last_error) {
        append("last_error");
    }
    if (update.next_attempt_at) {
        append("next_attempt_at");
    }

    Statement statement{db, fmt::format("UPDATE queued_messages SET {} WHERE id = ?", assignments)};
    int index = 1;
    if (update.status) {
        statement.bind_text(index++, std::string{to_string(update.status.value())});
    }
    if (update.retry_count) {
        statement.bind_int64(index++, update.retry_count.value());
    }
    if (update.clear_last_error) {
        statement.bind_null(index++);
    } else if (update.last_error) {
        statement.bind_text(index++, update.last_error.value());
    }
    if (update.next_attempt_at) {
        statement.bind_int64(index++, update.next_attempt_at.value());
    }
    statement.bind_int64(index, id);
    statement.step();

    return sqlite3_changes(db) > 0;
}

bool SqliteQueueStore::remove(QueueId id) {
    std::scoped_lock lock(mutex_);
    sqlite3* db = require_open();
    Statement statement{db, "DELETE FROM queued_messages WHERE id = ?"};
    statement.bind_int64(1, id);
    statement.step();
    return sqlite3_changes(db) > 0;
}

std::size_t SqliteQueueStore::clear(const std::optional<std::string>& chat_id) {
    std::scoped_lock lock(mutex_);
    sqlite3* db = require_open();
    std::string sql{"DELETE FROM queued_messages"};
    if (chat_id.has_value()) {
        sql += " WHERE chat_id = ?";
    }
    Statement statement{db, sql};
    if (chat_id.has_value()) {
        statement.bind_text(1, chat_id.value());
    }
    statement.step();
    return static_cast<std::size_t>(sqlite3_changes(db));
}

const std::filesystem::path& SqliteQueueStore::database_path() const noexcept {
    return path_database_;
}

int SqliteQueueStore::schema_version() {
    std::scoped_lock lock(mutex_);
    return read_user_version(require_open());
}

sqlite3* SqliteQueueStore::require_open() const {
    if (db_ == nullptr) {
        throw StorageError("Queue store is not open: " + path_database_.string());
    }
    return db_;
}

void SqliteQueueStore::migrate() {
    const int current_version = read_user_version(db_);
    if (current_version > k_queue_schema_version) {
        throw StorageError(fmt::format(
            "Database schema version {} is newer than supported version {}",
            current_version,
            k_queue_schema_version
        ));
    }
    if (current_version == k_queue_schema_version) {
        return;
    }

    exec("BEGIN IMMEDIATE");
    try {
        for (const Migration& migration : k_migrations) {
            if (migration.target_version <= current_version) {
                continue;
            }
            exec(migration.sql);
            logger_->info(R"({{"component":"queue_store","action":"migrate","to_version":{}}})", migration.target_version);
        }
        exec(fmt::format("PRAGMA user_version = {}", k_queue_schema_version));
        exec("COMMIT");
    } catch (const StorageError& exc) {
        logger_->error(R"({{"component":"queue_store","action":"migrate","error":"{}"}})", exc.what());
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
}

void SqliteQueueStore::exec(const std::string& sql) {
    char* error_message = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_message) != SQLITE_OK) {
        const std::string message = error_message != nullptr ? error_message : sqlite3_errmsg(db_);
        sqlite3_free(error_message);
        throw StorageError("SQLite error: " + message);
    }
}

}  // namespace offline_sync
