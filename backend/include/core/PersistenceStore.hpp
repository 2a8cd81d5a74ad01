#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Records.hpp"

struct sqlite3;

namespace punchsync {

class StoreError : public std::runtime_error {
public:
    StoreError(int code, const std::string& message) : std::runtime_error(message), code_(code) {}
    int code() const { return code_; }

private:
    int code_;
};

struct StoreSummary {
    int64_t inserted = 0;
    // Users rows that superseded an existing (device_ip, uid) row, earlier
    // rows of the same batch included.
    int64_t replaced = 0;
    // Rows ignored by the uniqueness constraint. Neither skips nor errors.
    int64_t duplicates = 0;
    int64_t skipped = 0;
    int64_t errors = 0;

    StoreSummary& operator+=(const StoreSummary& other);
};

void to_json(nlohmann::json& j, const StoreSummary& s);

/**
 * @brief SQLite-backed idempotent store for users and attendance.
 *
 * Users are superseded per (device_ip, uid); attendance is append-only and
 * deduplicated per (device_ip, user_id, timestamp). One writer at a time.
 */
class PersistenceStore {
public:
    static constexpr std::size_t kDefaultChunkSize = 1000;

    // Opens (or creates) the database file. Throws StoreError.
    explicit PersistenceStore(const std::string& path);
    ~PersistenceStore();

    PersistenceStore(const PersistenceStore&) = delete;
    PersistenceStore& operator=(const PersistenceStore&) = delete;

    // CREATE TABLE IF NOT EXISTS for both tables. Never drops data.
    void ensure_schema();

    StoreSummary upsert_users(const std::vector<PersistedUserRow>& rows);

    // One transaction per chunk. A failing chunk is rolled back and counted
    // in `errors`; later chunks are still attempted.
    StoreSummary append_attendance(const std::vector<PersistedAttendanceRow>& rows,
                                   std::size_t chunk_size = kDefaultChunkSize);

    // Empty device_ip counts every device.
    int64_t count_users(const std::string& device_ip = {}) const;
    int64_t count_attendance(const std::string& device_ip = {}) const;

    std::optional<PersistedUserRow> find_user(const std::string& device_ip, int64_t uid) const;
    std::vector<PersistedAttendanceRow> list_attendance(const std::string& device_ip,
                                                        const std::string& user_id = {}) const;

    // Current PRAGMA synchronous level (0 OFF, 1 NORMAL, 2 FULL, 3 EXTRA).
    int synchronous_mode() const;
    // Integer value of a connection PRAGMA such as "cache_size" or "temp_store".
    int64_t pragma_value(const std::string& name) const;

    const std::string& path() const { return path_; }

private:
    void exec(const char* sql);

    sqlite3* db_ = nullptr;
    std::string path_;
};

} // namespace punchsync
