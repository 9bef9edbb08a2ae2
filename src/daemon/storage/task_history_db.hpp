#pragma once

#include "sway/window_info.hpp"

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct TaskHistoryEntry {
    int64_t id;
    std::string timestamp;
    std::string task;
    bool success;
    std::string message;
    int steps;
    double duration;
    std::string error;
    std::string app_id;
    std::string window_title;
};

// Journal of finished tasks.
class TaskHistoryDb {
public:
    TaskHistoryDb();
    ~TaskHistoryDb();

    TaskHistoryDb(const TaskHistoryDb&) = delete;
    TaskHistoryDb& operator=(const TaskHistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // `context` is the window focused when the task was started.
    bool insert(const std::string& task, bool success, const std::string& message, int steps,
                double duration, const std::optional<std::string>& error, const WindowInfo& context);

    std::vector<TaskHistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
