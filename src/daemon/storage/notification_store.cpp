#include "storage/notification_store.hpp"

#include <filesystem>
#include <format>
#include <memory>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr const char* kColumns =
    "id, badge, body, badge_color, icon, metadata, repo, repo_root, tmux_pane, "
    "terminal_bundle_id, force_focus, is_read, created_at";

constexpr const char* kOrder = "ORDER BY created_at DESC, id DESC";

// Group key as stored: the repository root when known, else the group name.
constexpr const char* kGroupKey = "COALESCE(repo_root, repo)";

struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

std::string get_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

Notification read_row(sqlite3_stmt* stmt) {
    Notification n;
    n.id = sqlite3_column_int64(stmt, 0);
    n.badge = get_text(stmt, 1);
    n.body = get_text(stmt, 2);
    n.badge_color = badge_color_from_string(get_text(stmt, 3)).value_or(BadgeColor::Gray);
    n.icon = icon_from_string(get_text(stmt, 4)).value_or(Icon::Default);

    auto meta = get_text(stmt, 5);
    if (!meta.empty()) {
        try {
            auto j = nlohmann::json::parse(meta);
            for (auto& [k, v] : j.items()) {
                if (v.is_string()) n.metadata[k] = v.get<std::string>();
            }
        } catch (const nlohmann::json::exception& e) {
            std::println(stderr, "store: bad metadata on row {}: {}", n.id, e.what());
        }
    }

    n.repo = get_text(stmt, 6);
    n.repo_root = get_text(stmt, 7);
    n.tmux_pane = get_text(stmt, 8);
    n.terminal_bundle_id = get_text(stmt, 9);
    n.force_focus = sqlite3_column_int(stmt, 10) != 0;
    n.is_read = sqlite3_column_int(stmt, 11) != 0;
    n.created_at = get_text(stmt, 12);
    return n;
}

} // namespace

NotificationStore::NotificationStore() = default;

NotificationStore::~NotificationStore() {
    close();
}

bool NotificationStore::open(const std::string& path) {
    std::lock_guard lock(mutex_);
    path_ = path;
    return open_locked();
}

bool NotificationStore::open_locked() {
    fs::path p(path_);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "store: failed to open {}: {}", path_, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 5000);

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    auto insert_sql =
        "INSERT INTO notifications (badge, body, badge_color, icon, metadata, repo, repo_root, "
        "tmux_pane, terminal_bundle_id, force_focus) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    auto list_sql = std::format("SELECT {} FROM notifications {} LIMIT ?", kColumns, kOrder);

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db_, list_sql.c_str(), -1, &list_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "store: prepare failed: {}", sqlite3_errmsg(db_));
        if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    return true;
}

void NotificationStore::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (list_stmt_) { sqlite3_finalize(list_stmt_); list_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool NotificationStore::is_open() const {
    std::lock_guard lock(mutex_);
    return db_ != nullptr;
}

bool NotificationStore::ensure_open() {
    if (db_) return true;
    if (path_.empty()) return false;
    return open_locked();
}

StorageError NotificationStore::error(const std::string& what) {
    if (!db_) return {what + ": store is not open", SQLITE_CANTOPEN};
    return {what + ": " + sqlite3_errmsg(db_), sqlite3_errcode(db_)};
}

// Connection-level failures close the handle so the next mutation reopens it.
void NotificationStore::drop_if_broken(int rc) {
    switch (rc & 0xFF) {
        case SQLITE_IOERR:
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
        case SQLITE_CANTOPEN:
        case SQLITE_READONLY:
            std::println(stderr, "store: connection lost (code {}), will reopen", rc);
            close();
            break;
        default:
            break;
    }
}

std::expected<Notification, StorageError> NotificationStore::insert(const NotificationInput& input) {
    std::lock_guard lock(mutex_);
    if (!ensure_open()) return std::unexpected(error("insert"));

    auto rollback = [this](const std::string& what) {
        auto err = error(what);
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        drop_if_broken(err.code);
        return std::unexpected(err);
    };

    if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
        auto err = error("insert: begin");
        drop_if_broken(err.code);
        return std::unexpected(err);
    }

    if (!input.tmux_pane.empty()) {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_, "DELETE FROM notifications WHERE tmux_pane = ?", -1, &raw, nullptr) != SQLITE_OK) {
            return rollback("insert: prepare replace");
        }
        Stmt del(raw);
        sqlite3_bind_text(del.get(), 1, input.tmux_pane.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(del.get()) != SQLITE_DONE) return rollback("insert: replace pane row");
    }

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    auto color = to_string(input.badge_color);
    auto icon = to_string(input.icon);
    auto metadata = nlohmann::json(input.metadata).dump();

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, input.badge.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, input.body.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 3, color.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 4, icon.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 5, metadata.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 6, input.repo.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(7, input.repo_root);
    bind_nullable(8, input.tmux_pane);
    bind_nullable(9, input.terminal_bundle_id);
    sqlite3_bind_int(insert_stmt_, 10, input.force_focus ? 1 : 0);

    if (sqlite3_step(insert_stmt_) != SQLITE_DONE) return rollback("insert");
    sqlite3_reset(insert_stmt_);

    int64_t id = sqlite3_last_insert_rowid(db_);

    auto select_sql = std::format("SELECT {} FROM notifications WHERE id = ?", kColumns);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, select_sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return rollback("insert: prepare readback");
    }
    Stmt select(raw);
    sqlite3_bind_int64(select.get(), 1, id);
    if (sqlite3_step(select.get()) != SQLITE_ROW) return rollback("insert: readback");
    auto stored = read_row(select.get());
    select.reset();

    if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        return rollback("insert: commit");
    }
    return stored;
}

std::expected<int, StorageError> NotificationStore::execute_delete(const std::string& sql,
                                                                   const std::vector<std::string>& params) {
    if (!ensure_open()) return std::unexpected(error("delete"));

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(error("delete: prepare"));
    }
    Stmt stmt(raw);
    for (size_t i = 0; i < params.size(); i++) {
        sqlite3_bind_text(stmt.get(), static_cast<int>(i + 1), params[i].c_str(), -1, SQLITE_TRANSIENT);
    }

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        auto err = error("delete");
        drop_if_broken(err.code);
        return std::unexpected(err);
    }
    return sqlite3_changes(db_);
}

std::expected<int, StorageError> NotificationStore::remove(int64_t id) {
    std::lock_guard lock(mutex_);
    return execute_delete("DELETE FROM notifications WHERE id = ?", {std::to_string(id)});
}

std::expected<int, StorageError> NotificationStore::remove_by_pane(const std::string& tmux_pane) {
    if (tmux_pane.empty()) return 0;
    std::lock_guard lock(mutex_);
    return execute_delete("DELETE FROM notifications WHERE tmux_pane = ?", {tmux_pane});
}

std::expected<int, StorageError> NotificationStore::remove_by_panes(const std::vector<std::string>& panes) {
    std::vector<std::string> params;
    for (auto& p : panes) {
        if (!p.empty()) params.push_back(p);
    }
    if (params.empty()) return 0;

    std::string placeholders;
    for (size_t i = 0; i < params.size(); i++) {
        placeholders += i == 0 ? "?" : ", ?";
    }

    std::lock_guard lock(mutex_);
    return execute_delete(std::format("DELETE FROM notifications WHERE tmux_pane IN ({})", placeholders), params);
}

std::expected<int, StorageError> NotificationStore::remove_by_group(const std::string& group_key) {
    std::lock_guard lock(mutex_);
    return execute_delete(std::format("DELETE FROM notifications WHERE {} = ?", kGroupKey), {group_key});
}

std::expected<int, StorageError> NotificationStore::remove_by_group_and_pane(const std::string& group_key,
                                                                             const std::string& tmux_pane) {
    std::lock_guard lock(mutex_);
    return execute_delete(std::format("DELETE FROM notifications WHERE {} = ? AND tmux_pane = ?", kGroupKey),
                          {group_key, tmux_pane});
}

std::expected<int, StorageError> NotificationStore::remove_all() {
    std::lock_guard lock(mutex_);
    return execute_delete("DELETE FROM notifications", {});
}

std::expected<std::vector<Notification>, StorageError> NotificationStore::query(sqlite3_stmt* stmt) {
    std::vector<Notification> rows;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        rows.push_back(read_row(stmt));
    }
    if (rc != SQLITE_DONE) return std::unexpected(error("query"));
    return rows;
}

std::expected<std::vector<Notification>, StorageError> NotificationStore::list(int limit) {
    std::lock_guard lock(mutex_);
    if (!list_stmt_) return std::unexpected(error("list"));

    sqlite3_reset(list_stmt_);
    sqlite3_bind_int(list_stmt_, 1, limit);
    auto rows = query(list_stmt_);
    sqlite3_reset(list_stmt_);
    return rows;
}

std::expected<int64_t, StorageError> NotificationStore::unread_count() {
    std::lock_guard lock(mutex_);
    if (!db_) return std::unexpected(error("unread_count"));

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM notifications WHERE is_read = 0", -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(error("unread_count: prepare"));
    }
    Stmt stmt(raw);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) return std::unexpected(error("unread_count"));
    return sqlite3_column_int64(stmt.get(), 0);
}

std::expected<std::optional<Notification>, StorageError>
NotificationStore::latest_by_pane(const std::string& tmux_pane) {
    std::lock_guard lock(mutex_);
    if (!db_) return std::unexpected(error("latest_by_pane"));

    auto sql = std::format("SELECT {} FROM notifications WHERE tmux_pane = ? {} LIMIT 1", kColumns, kOrder);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(error("latest_by_pane: prepare"));
    }
    Stmt stmt(raw);
    sqlite3_bind_text(stmt.get(), 1, tmux_pane.c_str(), -1, SQLITE_TRANSIENT);

    auto rows = query(stmt.get());
    if (!rows) return std::unexpected(rows.error());
    if (rows->empty()) return std::optional<Notification>{};
    return std::optional<Notification>{std::move(rows->front())};
}

std::expected<int64_t, StorageError> NotificationStore::max_id() {
    std::lock_guard lock(mutex_);
    if (!db_) return std::unexpected(error("max_id"));

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COALESCE(MAX(id), 0) FROM notifications", -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(error("max_id: prepare"));
    }
    Stmt stmt(raw);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) return std::unexpected(error("max_id"));
    return sqlite3_column_int64(stmt.get(), 0);
}

std::expected<std::vector<Notification>, StorageError> NotificationStore::list_after(int64_t id) {
    std::lock_guard lock(mutex_);
    if (!db_) return std::unexpected(error("list_after"));

    auto sql = std::format("SELECT {} FROM notifications WHERE id > ? ORDER BY id ASC", kColumns);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(error("list_after: prepare"));
    }
    Stmt stmt(raw);
    sqlite3_bind_int64(stmt.get(), 1, id);
    return query(stmt.get());
}

bool NotificationStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS notifications (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            badge TEXT NOT NULL DEFAULT '',
            body TEXT NOT NULL DEFAULT '',
            badge_color TEXT NOT NULL DEFAULT 'gray',
            icon TEXT NOT NULL DEFAULT 'default',
            metadata TEXT NOT NULL DEFAULT '{}',
            repo TEXT NOT NULL DEFAULT '',
            repo_root TEXT,
            tmux_pane TEXT,
            terminal_bundle_id TEXT,
            force_focus INTEGER NOT NULL DEFAULT 0,
            is_read INTEGER NOT NULL DEFAULT 0,
            created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ','now'))
        );
        CREATE INDEX IF NOT EXISTS idx_notifications_created_at ON notifications(created_at DESC);
        CREATE INDEX IF NOT EXISTS idx_notifications_tmux_pane ON notifications(tmux_pane);
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "store: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
