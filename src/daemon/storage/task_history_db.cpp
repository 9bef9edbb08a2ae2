#include "storage/task_history_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

TaskHistoryDb::TaskHistoryDb() = default;

TaskHistoryDb::~TaskHistoryDb() {
    close();
}

bool TaskHistoryDb::open(const std::string& path) {
    if (path != ":memory:") {
        std::error_code ec;
        fs::create_directories(fs::path(path).parent_path(), ec);
    }

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    const char* insert_sql =
        "INSERT INTO tasks (task, success, message, steps, duration, error, app_id, window_title) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, task, success, message, steps, duration, error, app_id, window_title "
        "FROM tasks ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare recent failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    return true;
}

void TaskHistoryDb::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool TaskHistoryDb::insert(const std::string& task, bool success, const std::string& message, int steps,
                           double duration, const std::optional<std::string>& error,
                           const WindowInfo& ctx) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    sqlite3_bind_text(insert_stmt_, 1, task.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(insert_stmt_, 2, success ? 1 : 0);
    bind_nullable(3, message);
    sqlite3_bind_int(insert_stmt_, 4, steps);
    sqlite3_bind_double(insert_stmt_, 5, duration);
    bind_nullable(6, error.value_or(""));
    bind_nullable(7, ctx.app());
    bind_nullable(8, ctx.title);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<TaskHistoryEntry> TaskHistoryDb::recent(int limit) {
    std::vector<TaskHistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        TaskHistoryEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.task = get_text(recent_stmt_, 2);
        e.success = sqlite3_column_int(recent_stmt_, 3) != 0;
        e.message = get_text(recent_stmt_, 4);
        e.steps = sqlite3_column_int(recent_stmt_, 5);
        e.duration = sqlite3_column_double(recent_stmt_, 6);
        e.error = get_text(recent_stmt_, 7);
        e.app_id = get_text(recent_stmt_, 8);
        e.window_title = get_text(recent_stmt_, 9);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool TaskHistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS tasks (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            task TEXT NOT NULL,
            success INTEGER NOT NULL,
            message TEXT,
            steps INTEGER,
            duration REAL,
            error TEXT,
            app_id TEXT,
            window_title TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
