/**
 * @file host_registry.cpp
 * @brief HostRegistry implementation on the SQLite C API.
 */

#include "registry/host_registry.hpp"

#include "core/logger.hpp"
#include "protocol/payload_codec.hpp"

#include <sqlite3.h>

#include <mutex>

namespace lan_beacon {

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;

constexpr const char* SCHEMA_SQL = R"sql(
CREATE TABLE IF NOT EXISTS hosts (
    mac              TEXT PRIMARY KEY,
    metadata         BLOB NOT NULL,
    first_seen_ms    INTEGER NOT NULL,
    last_seen_ms     INTEGER NOT NULL,
    packet_count     INTEGER NOT NULL DEFAULT 0,
    active           INTEGER NOT NULL DEFAULT 1,
    ssh_key_pushed   INTEGER NOT NULL DEFAULT 0,
    key_pushed_at_ms INTEGER
);
)sql";

constexpr const char* UPSERT_SQL = R"sql(
INSERT INTO hosts (mac, metadata, first_seen_ms, last_seen_ms, packet_count, active)
VALUES (?1, ?2, ?3, ?3, 1, 1)
ON CONFLICT(mac) DO UPDATE SET
    metadata     = excluded.metadata,
    last_seen_ms = excluded.last_seen_ms,
    packet_count = hosts.packet_count + 1,
    active       = 1
)sql";

constexpr const char* SELECT_ONE_SQL =
    "SELECT mac, metadata, first_seen_ms, last_seen_ms, packet_count, active,"
    " ssh_key_pushed, key_pushed_at_ms FROM hosts WHERE mac = ?1";

constexpr const char* SELECT_ALL_SQL =
    "SELECT mac, metadata, first_seen_ms, last_seen_ms, packet_count, active,"
    " ssh_key_pushed, key_pushed_at_ms FROM hosts ORDER BY mac";

constexpr const char* SELECT_ACTIVE_SQL =
    "SELECT mac, metadata, first_seen_ms, last_seen_ms, packet_count, active,"
    " ssh_key_pushed, key_pushed_at_ms FROM hosts WHERE active = 1 ORDER BY mac";

constexpr const char* SELECT_STALE_SQL =
    "SELECT mac, metadata, first_seen_ms, last_seen_ms, packet_count, active,"
    " ssh_key_pushed, key_pushed_at_ms FROM hosts"
    " WHERE active = 1 AND last_seen_ms <= ?1 ORDER BY mac";

constexpr const char* EXPIRE_SQL =
    "UPDATE hosts SET active = 0 WHERE active = 1 AND last_seen_ms <= ?1";

constexpr const char* MARK_PUSHED_SQL =
    "UPDATE hosts SET ssh_key_pushed = 1, key_pushed_at_ms = ?2 WHERE mac = ?1";

constexpr const char* COUNT_SQL = "SELECT COUNT(*) FROM hosts";

struct StmtFinalizer {
    void operator()(sqlite3_stmt* stmt) const noexcept { ::sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

Statement prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (::sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        ::sqlite3_finalize(raw);
        return nullptr;
    }
    return Statement(raw);
}

/**
 * @brief BEGIN IMMEDIATE on begin(), ROLLBACK on destruction unless committed.
 */
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {}
    ~Transaction() {
        if (open_) ::sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    bool begin() {
        open_ = ::sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK;
        return open_;
    }

    bool commit() {
        if (::sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) return false;
        open_ = false;
        return true;
    }

private:
    sqlite3* db_;
    bool open_{false};
};

void bind_text(sqlite3_stmt* stmt, int index, const std::string& text) {
    ::sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()),
                        SQLITE_TRANSIENT);
}

/// Decode the current row. Column order matches the SELECT_* statements.
Result<HostRecord> read_row(sqlite3_stmt* stmt) {
    const auto* blob = static_cast<const uint8_t*>(::sqlite3_column_blob(stmt, 1));
    auto blob_size = static_cast<size_t>(::sqlite3_column_bytes(stmt, 1));

    auto metadata = PayloadCodec::decode(std::span<const uint8_t>(blob, blob_size));
    if (!metadata) return metadata.error();

    HostRecord record;
    record.metadata = std::move(*metadata);
    record.first_seen = from_unix_millis(::sqlite3_column_int64(stmt, 2));
    record.last_seen = from_unix_millis(::sqlite3_column_int64(stmt, 3));
    record.packet_count = static_cast<uint64_t>(::sqlite3_column_int64(stmt, 4));
    record.active = ::sqlite3_column_int(stmt, 5) != 0;
    record.ssh_key_pushed = ::sqlite3_column_int(stmt, 6) != 0;
    if (::sqlite3_column_type(stmt, 7) != SQLITE_NULL) {
        record.key_pushed_at = from_unix_millis(::sqlite3_column_int64(stmt, 7));
    }
    return record;
}

std::string row_key(sqlite3_stmt* stmt) {
    const auto* text = ::sqlite3_column_text(stmt, 0);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

void HostRegistry::DbCloser::operator()(sqlite3* db) const noexcept {
    ::sqlite3_close_v2(db);
}

HostRegistry::HostRegistry(DbHandle db, std::filesystem::path path, Logger* logger, Clock clock)
    : db_(std::move(db))
    , path_(std::move(path))
    , logger_(logger)
    , clock_(std::move(clock)) {}

HostRegistry::~HostRegistry() = default;

Result<std::unique_ptr<HostRegistry>> HostRegistry::open(const std::filesystem::path& path,
                                                         Logger* logger,
                                                         Clock clock) {
    sqlite3* raw = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = ::sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    DbHandle db(raw);

    if (rc != SQLITE_OK) {
        std::string reason = raw ? ::sqlite3_errmsg(raw) : ::sqlite3_errstr(rc);
        return Error{ErrorCode::Storage,
                     "Cannot open registry " + path.string() + ": " + reason};
    }

    ::sqlite3_busy_timeout(db.get(), BUSY_TIMEOUT_MS);

    for (const char* sql : {"PRAGMA journal_mode=WAL", "PRAGMA synchronous=NORMAL", SCHEMA_SQL}) {
        char* err = nullptr;
        if (::sqlite3_exec(db.get(), sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string reason = err ? err : "unknown error";
            ::sqlite3_free(err);
            return Error{ErrorCode::Storage,
                         "Cannot initialize registry " + path.string() + ": " + reason};
        }
    }

    if (!clock) {
        clock = [] { return std::chrono::system_clock::now(); };
    }

    return std::unique_ptr<HostRegistry>(
        new HostRegistry(std::move(db), path, logger, std::move(clock)));
}

Error HostRegistry::storage_error(std::string_view what) const {
    return Error{ErrorCode::Storage,
                 std::string(what) + ": " + ::sqlite3_errmsg(db_.get())};
}

// ─────────────────────────────────────────────
// Writes
// ─────────────────────────────────────────────

Result<HostRecord> HostRegistry::upsert(const HostMetadata& metadata) {
    auto key = canonical_mac(metadata.mac_address);
    if (key.empty()) {
        return Error{ErrorCode::InvalidArgument, "Host metadata has no MAC address"};
    }
    auto blob = PayloadCodec::encode(metadata);

    std::unique_lock lock(mutex_);
    auto now_ms = to_unix_millis(clock_());

    Transaction txn(db_.get());
    if (!txn.begin()) return storage_error("Cannot begin upsert");

    auto stmt = prepare(db_.get(), UPSERT_SQL);
    if (!stmt) return storage_error("Cannot prepare upsert");
    bind_text(stmt.get(), 1, key);
    ::sqlite3_bind_blob(stmt.get(), 2, blob.data(), static_cast<int>(blob.size()),
                        SQLITE_TRANSIENT);
    ::sqlite3_bind_int64(stmt.get(), 3, now_ms);
    if (::sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return storage_error("Upsert failed for " + key);
    }

    auto record = find_locked(key);
    if (!record) return record.error();
    if (!*record) {
        return Error{ErrorCode::Storage, "Upserted record vanished: " + key};
    }

    if (!txn.commit()) return storage_error("Cannot commit upsert");
    return std::move(**record);
}

Result<void> HostRegistry::mark_key_pushed(const MacAddress& mac) {
    auto key = canonical_mac(mac);

    std::unique_lock lock(mutex_);
    auto now_ms = to_unix_millis(clock_());

    Transaction txn(db_.get());
    if (!txn.begin()) return storage_error("Cannot begin mark_key_pushed");

    auto stmt = prepare(db_.get(), MARK_PUSHED_SQL);
    if (!stmt) return storage_error("Cannot prepare mark_key_pushed");
    bind_text(stmt.get(), 1, key);
    ::sqlite3_bind_int64(stmt.get(), 2, now_ms);
    if (::sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return storage_error("mark_key_pushed failed for " + key);
    }

    if (::sqlite3_changes(db_.get()) == 0) {
        return Error{ErrorCode::NotFound, "Host not found: " + key};
    }

    if (!txn.commit()) return storage_error("Cannot commit mark_key_pushed");
    return Result<void>{};
}

Result<std::vector<HostRecord>> HostRegistry::expire_stale(std::chrono::milliseconds threshold) {
    std::unique_lock lock(mutex_);
    auto cutoff_ms = to_unix_millis(clock_()) - threshold.count();

    Transaction txn(db_.get());
    if (!txn.begin()) return storage_error("Cannot begin expiry");

    auto stale = query_records(SELECT_STALE_SQL, cutoff_ms);
    if (!stale) return stale.error();

    auto stmt = prepare(db_.get(), EXPIRE_SQL);
    if (!stmt) return storage_error("Cannot prepare expiry");
    ::sqlite3_bind_int64(stmt.get(), 1, cutoff_ms);
    if (::sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return storage_error("Expiry update failed");
    }

    if (!txn.commit()) return storage_error("Cannot commit expiry");

    for (auto& record : *stale) {
        record.active = false;
    }
    return stale;
}

// ─────────────────────────────────────────────
// Reads
// ─────────────────────────────────────────────

Result<std::vector<HostRecord>> HostRegistry::get_all() const {
    std::shared_lock lock(mutex_);
    return query_records(SELECT_ALL_SQL, std::nullopt);
}

Result<std::vector<HostRecord>> HostRegistry::get_active() const {
    std::shared_lock lock(mutex_);
    return query_records(SELECT_ACTIVE_SQL, std::nullopt);
}

Result<std::optional<HostRecord>> HostRegistry::find(const MacAddress& mac) const {
    std::shared_lock lock(mutex_);
    return find_locked(canonical_mac(mac));
}

Result<size_t> HostRegistry::size() const {
    std::shared_lock lock(mutex_);

    auto stmt = prepare(db_.get(), COUNT_SQL);
    if (!stmt) return storage_error("Cannot prepare count");
    if (::sqlite3_step(stmt.get()) != SQLITE_ROW) return storage_error("Count failed");
    return static_cast<size_t>(::sqlite3_column_int64(stmt.get(), 0));
}

Result<std::optional<HostRecord>> HostRegistry::find_locked(const std::string& mac) const {
    auto stmt = prepare(db_.get(), SELECT_ONE_SQL);
    if (!stmt) return storage_error("Cannot prepare lookup");
    bind_text(stmt.get(), 1, mac);

    int rc = ::sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) return std::optional<HostRecord>{};
    if (rc != SQLITE_ROW) return storage_error("Lookup failed for " + mac);

    auto record = read_row(stmt.get());
    if (!record) {
        return Error{ErrorCode::Storage,
                     "Corrupt record for " + mac + ": " + record.error().message};
    }
    return std::optional<HostRecord>(std::move(*record));
}

Result<std::vector<HostRecord>> HostRegistry::query_records(
    const char* sql, std::optional<int64_t> bind_value) const {

    auto stmt = prepare(db_.get(), sql);
    if (!stmt) return storage_error("Cannot prepare scan");
    if (bind_value) ::sqlite3_bind_int64(stmt.get(), 1, *bind_value);

    std::vector<HostRecord> records;
    int rc = SQLITE_ROW;
    while ((rc = ::sqlite3_step(stmt.get())) == SQLITE_ROW) {
        auto record = read_row(stmt.get());
        if (!record) {
            if (logger_) {
                logger_->warn("Skipping unreadable registry row " + row_key(stmt.get())
                              + ": " + record.error().message);
            }
            continue;
        }
        records.push_back(std::move(*record));
    }

    if (rc != SQLITE_DONE) return storage_error("Scan failed");
    return records;
}

}  // namespace lan_beacon
