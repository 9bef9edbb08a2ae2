#include <catch2/catch_test_macros.hpp>

#include "storage/task_history_db.hpp"
#include "sway/window_info.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("dp_test_tasks_" + std::to_string(getpid()) + "/tasks.db");
    }

    ~TmpDb() { std::filesystem::remove_all(std::filesystem::path(path).parent_path()); }
};

} // namespace

TEST_CASE("TaskHistoryDb", "[journal]") {

    SECTION("OpenCreatesDirectoryAndFile") {
        TmpDb tmp;
        TaskHistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InMemory") {
        TaskHistoryDb db;
        REQUIRE(db.open(":memory:"));
        REQUIRE(db.recent(5).empty());
    }

    SECTION("InsertAndRetrieve") {
        TaskHistoryDb db;
        REQUIRE(db.open(":memory:"));

        WindowInfo ctx{.app_id = "firefox", .title = "Start Page"};
        REQUIRE(db.insert("open the downloads page", true, "Complete", 3, 12.5, std::nullopt, ctx));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        auto& e = entries[0];
        REQUIRE(e.id == 1);
        REQUIRE(e.task == "open the downloads page");
        REQUIRE(e.success);
        REQUIRE(e.message == "Complete");
        REQUIRE(e.steps == 3);
        REQUIRE(e.duration == 12.5);
        REQUIRE(e.error.empty());
        REQUIRE(e.app_id == "firefox");
        REQUIRE(e.window_title == "Start Page");
    }

    SECTION("FailureWithError") {
        TaskHistoryDb db;
        REQUIRE(db.open(":memory:"));

        REQUIRE(db.insert("click submit", false, "Failed", 2, 4.0,
                          std::string("Cannot connect to model server."), WindowInfo{}));

        auto e = db.recent(1).at(0);
        REQUIRE_FALSE(e.success);
        REQUIRE(e.error == "Cannot connect to model server.");
        REQUIRE(e.app_id.empty());
        REQUIRE(e.window_title.empty());
    }

    SECTION("XwaylandClassStoredAsApp") {
        TaskHistoryDb db;
        REQUIRE(db.open(":memory:"));

        WindowInfo ctx{.window_class = "Steam", .title = "Library"};
        REQUIRE(db.insert("t", true, "Complete", 1, 1.0, std::nullopt, ctx));
        REQUIRE(db.recent(1).at(0).app_id == "Steam");
    }

    SECTION("NewestFirstAndLimit") {
        TaskHistoryDb db;
        REQUIRE(db.open(":memory:"));

        for (auto task : {"first", "second", "third"}) {
            REQUIRE(db.insert(task, true, "Complete", 1, 1.0, std::nullopt, WindowInfo{}));
        }

        auto entries = db.recent(2);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].task == "third");
        REQUIRE(entries[1].task == "second");
    }

    SECTION("TimestampAutoPopulated") {
        TaskHistoryDb db;
        REQUIRE(db.open(":memory:"));
        REQUIRE(db.insert("t", true, "Complete", 1, 1.0, std::nullopt, WindowInfo{}));

        auto ts = db.recent(1).at(0).timestamp;
        REQUIRE(ts.size() >= 19);
        REQUIRE(ts[4] == '-');
        REQUIRE(ts[10] == 'T');
    }

    SECTION("PersistsAcrossReopen") {
        TmpDb tmp;
        {
            TaskHistoryDb db;
            REQUIRE(db.open(tmp.path));
            REQUIRE(db.insert("kept", true, "Complete", 1, 1.0, std::nullopt, WindowInfo{}));
        }
        TaskHistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.recent(10).at(0).task == "kept");
    }

    SECTION("ClosedDbRejectsWrites") {
        TaskHistoryDb db;
        REQUIRE_FALSE(db.insert("t", true, "", 0, 0, std::nullopt, WindowInfo{}));
        REQUIRE(db.recent(1).empty());
    }
}
