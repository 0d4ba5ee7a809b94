/**
 * @file host_registry.hpp
 * @brief Durable MAC-keyed registry of discovered hosts on SQLite.
 *
 * One table, one row per MAC. Every write runs inside BEGIN IMMEDIATE so a
 * logical operation is atomic on disk, and a shared_mutex serializes writes
 * against all other operations while letting reads overlap.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace lan_beacon {

class Logger;

using Clock = std::function<Timestamp()>;

class HostRegistry {
public:
    /**
     * @brief Open (or create) the registry database.
     *
     * @param path   Database file, or ":memory:" for a private in-memory store.
     * @param logger Receives warnings about unreadable rows. May be null.
     * @param clock  Time source for first_seen / last_seen / key_pushed_at.
     *               Defaults to system_clock::now.
     */
    static Result<std::unique_ptr<HostRegistry>> open(const std::filesystem::path& path,
                                                      Logger* logger = nullptr,
                                                      Clock clock = {});
    ~HostRegistry();

    HostRegistry(const HostRegistry&) = delete;
    HostRegistry& operator=(const HostRegistry&) = delete;

    /**
     * @brief Insert or refresh the record for metadata.mac_address.
     *
     * New: first_seen = last_seen = now, packet_count = 1, active = true.
     * Existing: last_seen = now, packet_count + 1, active = true, metadata
     * replaced. first_seen and the key-push fields are untouched.
     */
    Result<HostRecord> upsert(const HostMetadata& metadata);

    Result<std::vector<HostRecord>> get_all() const;
    Result<std::vector<HostRecord>> get_active() const;
    Result<std::optional<HostRecord>> find(const MacAddress& mac) const;

    /// ErrorCode::NotFound when no record exists for @p mac.
    Result<void> mark_key_pushed(const MacAddress& mac);

    /**
     * @brief Deactivate every active record with now - last_seen >= threshold.
     * @return The records that changed, in their post-update state.
     */
    Result<std::vector<HostRecord>> expire_stale(std::chrono::milliseconds threshold);

    Result<size_t> size() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    struct DbCloser {
        void operator()(sqlite3* db) const noexcept;
    };
    using DbHandle = std::unique_ptr<sqlite3, DbCloser>;

    HostRegistry(DbHandle db, std::filesystem::path path, Logger* logger, Clock clock);

    Result<std::vector<HostRecord>> query_records(const char* sql,
                                                  std::optional<int64_t> bind_value) const;
    Result<std::optional<HostRecord>> find_locked(const std::string& mac) const;
    Error storage_error(std::string_view what) const;

    DbHandle db_;
    std::filesystem::path path_;
    Logger* logger_;
    Clock clock_;
    mutable std::shared_mutex mutex_;
};

}  // namespace lan_beacon
