#pragma once

#include "models/notification.hpp"

#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct StorageError {
    std::string message;
    int code = 0;
};

// Single-writer notification table. Every operation holds the store mutex, so
// the "one row per non-empty tmux pane" rule survives concurrent producers.
class NotificationStore {
public:
    static constexpr int kAllRows = -1;

    NotificationStore();
    ~NotificationStore();

    NotificationStore(const NotificationStore&) = delete;
    NotificationStore& operator=(const NotificationStore&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const;

    // Replaces any existing row for input.tmux_pane in the same transaction.
    std::expected<Notification, StorageError> insert(const NotificationInput& input);

    std::expected<int, StorageError> remove(int64_t id);
    std::expected<int, StorageError> remove_by_pane(const std::string& tmux_pane);
    std::expected<int, StorageError> remove_by_panes(const std::vector<std::string>& panes);
    std::expected<int, StorageError> remove_by_group(const std::string& group_key);
    std::expected<int, StorageError> remove_by_group_and_pane(const std::string& group_key,
                                                              const std::string& tmux_pane);
    std::expected<int, StorageError> remove_all();

    // Newest first: created_at descending, then id descending. A negative limit returns every row.
    std::expected<std::vector<Notification>, StorageError> list(int limit = 100);
    std::expected<int64_t, StorageError> unread_count();
    std::expected<std::optional<Notification>, StorageError> latest_by_pane(const std::string& tmux_pane);
    std::expected<int64_t, StorageError> max_id();
    std::expected<std::vector<Notification>, StorageError> list_after(int64_t id);

private:
    bool open_locked();
    bool create_tables();
    bool ensure_open();
    StorageError error(const std::string& what);
    void drop_if_broken(int rc);

    std::expected<int, StorageError> execute_delete(const std::string& sql,
                                                    const std::vector<std::string>& params);
    std::expected<std::vector<Notification>, StorageError> query(sqlite3_stmt* stmt);

    mutable std::mutex mutex_;
    std::string path_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* list_stmt_ = nullptr;
};
