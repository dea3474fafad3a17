#include <catch2/catch_test_macros.hpp>

#include "storage/notification_store.hpp"

#include <atomic>
#include <filesystem>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("pt_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

NotificationInput make_input(const std::string& badge, const std::string& pane = "",
                             const std::string& repo = "api", const std::string& root = "/src/api") {
    NotificationInput in;
    in.badge = badge;
    in.body = badge + " body";
    in.badge_color = BadgeColor::Green;
    in.icon = Icon::ClaudeCode;
    in.repo = repo;
    in.repo_root = root;
    in.tmux_pane = pane;
    return in;
}

} // namespace

TEST_CASE("NotificationStore", "[store]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        NotificationStore store;
        REQUIRE(store.open(tmp.path));
        REQUIRE(store.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InsertAndRetrieve") {
        TmpDb tmp;
        NotificationStore store;
        REQUIRE(store.open(tmp.path));

        auto in = make_input("Stop", "%3");
        in.metadata["branch"] = "main";
        in.terminal_bundle_id = "kitty";
        auto stored = store.insert(in);
        REQUIRE(stored.has_value());
        REQUIRE(stored->id > 0);
        REQUIRE_FALSE(stored->created_at.empty());
        REQUIRE_FALSE(stored->is_read);

        auto rows = store.list(10);
        REQUIRE(rows.has_value());
        REQUIRE(rows->size() == 1);
        auto& n = rows->front();
        REQUIRE(n.badge == "Stop");
        REQUIRE(n.body == "Stop body");
        REQUIRE(n.badge_color == BadgeColor::Green);
        REQUIRE(n.icon == Icon::ClaudeCode);
        REQUIRE(n.repo == "api");
        REQUIRE(n.repo_root == "/src/api");
        REQUIRE(n.tmux_pane == "%3");
        REQUIRE(n.terminal_bundle_id == "kitty");
        REQUIRE(n.metadata.at("branch") == "main");
        REQUIRE(n.group_key() == "/src/api");
    }

    SECTION("OneRowPerPane") {
        TmpDb tmp;
        NotificationStore store;
        REQUIRE(store.open(tmp.path));

        REQUIRE(store.insert(make_input("first", "%1")).has_value());
        auto second = store.insert(make_input("second", "%1"));
        REQUIRE(second.has_value());

        auto rows = store.list(10);
        REQUIRE(rows->size() == 1);
        REQUIRE(rows->front().badge == "second");
        REQUIRE(rows->front().id == second->id);
    }

    SECTION("EmptyPaneNeverReplaces") {
        TmpDb tmp;
        NotificationStore store;
        REQUIRE(store.open(tmp.path));

        REQUIRE(store.insert(make_input("a")).has_value());
        REQUIRE(store.insert(make_input("b")).has_value());
        REQUIRE(store.list(10)->size() == 2);
    }

    SECTION("NewestFirst") {
        TmpDb tmp;
        NotificationStore store;
        REQUIRE(store.open(tmp.path));

        REQUIRE(store.insert(make_input("A", "%1")).has_value());
        REQUIRE(store.insert(make_input("B", "%2")).has_value());
        REQUIRE(store.insert(make_input("C", "%3")).has_value());

        auto rows = store.list(10);
        REQUIRE(rows->size() == 3);
        REQUIRE((*rows)[0].badge == "C");
        REQUIRE((*rows)[1].badge == "B");
        REQUIRE((*rows)[2].badge == "A");

        REQUIRE(store.list(2)->size() == 2);
    }

    SECTION("UnreadCount") {
        TmpDb tmp;
        NotificationStore store;
        REQUIRE(store.open(tmp.path));

        REQUIRE(store.unread_count().value() == 0);
        REQUIRE(store.insert(make_input("A", "%1")).has_value());
        REQUIRE(store.insert(make_input("B", "%2")).has_value());
        REQUIRE(store.unread_count().value() == 2);
    }

    SECTION("RemoveById") {
        TmpDb tmp;
        NotificationStore store;
        REQUIRE(store.open(tmp.path));

        auto a = store.insert(make_input("A", "%1"));
        REQUIRE(store.insert(make_input("B", "%2")).has_value());

        REQUIRE(store.remove(a->id).value() == 1);
        REQUIRE(store.remove(a->id).value() == 0);
        REQUIRE(store.list(10)->size() == 1);
    }

    SECTION("RemoveByPaneIsIdempotent") {
        TmpDb tmp;
        NotificationStore store;
        REQUIRE(store.open(tmp.path));

        REQUIRE(store.insert(make_input("A", "%1")).has_value());
        REQUIRE(store.remove_by_pane("%1").value() == 1);
        REQUIRE(store.remove_by_pane("%1").value() == 0);
        REQUIRE(store.remove_by_pane("").value() == 0);
        REQUIRE(store.list(10)->empty());
    }

    SECTION("RemoveByPanes") {
        TmpDb tmp;
        NotificationStore store;
        REQUIRE(store.open(tmp.path));

        REQUIRE(store.insert(make_input("A", "%1")).has_value());
        REQUIRE(store.insert(make_input("B", "%2")).has_value());
        REQUIRE(store.insert(make_input("C", "%3")).has_value());

        REQUIRE(store.remove_by_panes({"%1", "", "%3"}).value() == 2);
        auto rows = store.list(10);
        REQUIRE(rows->size() == 1);
        REQUIRE(rows->front().tmux_pane == "%2");
    }

    SECTION("RemoveByGroup") {
        TmpDb tmp;
        NotificationStore store;
        REQUIRE(store.open(tmp.path));

        REQUIRE(store.insert(make_input("A", "%1", "api", "/src/api")).has_value());
        REQUIRE(store.insert(make_input("B", "%2", "web", "/src/web")).has_value());
        // No root recorded: the group name is the key.
        REQUIRE(store.insert(make_input("C", "", "scratch", "")).has_value());

        REQUIRE(store.remove_by_group("/src/api").value() == 1);
        REQUIRE(store.remove_by_group("scratch").value() == 1);
        auto rows = store.list(10);
        REQUIRE(rows->size() == 1);
        REQUIRE(rows->front().repo == "web");
    }

    SECTION("RemoveByGroupAndPane") {
        TmpDb tmp;
        NotificationStore store;
        REQUIRE(store.open(tmp.path));

        REQUIRE(store.insert(make_input("A", "%1", "api", "/src/api")).has_value());
        REQUIRE(store.insert(make_input("B", "%2", "api", "/src/api")).has_value());

        REQUIRE(store.remove_by_group_and_pane("/src/web", "%1").value() == 0);
        REQUIRE(store.remove_by_group_and_pane("/src/api", "%1").value() == 1);
        REQUIRE(store.list(10)->size() == 1);
    }

    SECTION("RemoveAll") {
        TmpDb tmp;
        NotificationStore store;
        REQUIRE(store.open(tmp.path));

        REQUIRE(store.insert(make_input("A", "%1")).has_value());
        REQUIRE(store.insert(make_input("B")).has_value());
        REQUIRE(store.remove_all().value() == 2);
        REQUIRE(store.unread_count().value() == 0);
    }

    SECTION("LatestByPane") {
        TmpDb tmp;
        NotificationStore store;
        REQUIRE(store.open(tmp.path));

        REQUIRE_FALSE(store.latest_by_pane("%1").value().has_value());
        REQUIRE(store.insert(make_input("A", "%1")).has_value());
        auto latest = store.latest_by_pane("%1");
        REQUIRE(latest.has_value());
        REQUIRE(latest->has_value());
        REQUIRE((*latest)->badge == "A");
    }

    SECTION("ListAfterId") {
        TmpDb tmp;
        NotificationStore store;
        REQUIRE(store.open(tmp.path));

        REQUIRE(store.max_id().value() == 0);
        auto a = store.insert(make_input("A", "%1"));
        auto mark = store.max_id().value();
        REQUIRE(mark == a->id);

        REQUIRE(store.insert(make_input("B", "%2")).has_value());
        REQUIRE(store.insert(make_input("C", "%3")).has_value());

        auto fresh = store.list_after(mark);
        REQUIRE(fresh.has_value());
        REQUIRE(fresh->size() == 2);
        REQUIRE((*fresh)[0].badge == "B");
        REQUIRE((*fresh)[1].badge == "C");
    }

    SECTION("PersistsAcrossReopen") {
        TmpDb tmp;
        {
            NotificationStore store;
            REQUIRE(store.open(tmp.path));
            REQUIRE(store.insert(make_input("A", "%1")).has_value());
        }
        NotificationStore store;
        REQUIRE(store.open(tmp.path));
        REQUIRE(store.list(10)->size() == 1);
    }

    SECTION("ConcurrentInsertsKeepOneRowPerPane") {
        TmpDb tmp;
        NotificationStore store;
        REQUIRE(store.open(tmp.path));

        std::atomic<int> failures{0};
        std::vector<std::thread> writers;
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([&store, &failures, t] {
                for (int i = 0; i < 10; ++i) {
                    auto res = store.insert(make_input("w" + std::to_string(t), "%" + std::to_string(i % 3)));
                    if (!res) failures++;
                }
            });
        }
        for (auto& w : writers) w.join();
        REQUIRE(failures == 0);

        auto rows = store.list(100);
        REQUIRE(rows.has_value());
        REQUIRE(rows->size() == 3);
    }

    SECTION("NotOpenReportsError") {
        NotificationStore store;
        auto res = store.insert(make_input("A", "%1"));
        REQUIRE_FALSE(res.has_value());
        REQUIRE_FALSE(res.error().message.empty());
        REQUIRE_FALSE(store.list(10).has_value());
    }
}
