#include "core/PersistenceStore.hpp"
#include "core/ErrorCatalog.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <iostream>
#include <memory>

using json = nlohmann::json;

namespace punchsync {

namespace {

constexpr int kVerboseBatchErrors = 3;

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        sqlite3_finalize(raw);
        throw StoreError(errors::E3310_STORE_STATEMENT_FAILED,
                         errors::format_E3310_store_statement_failed(sqlite3_errmsg(db)));
    }
    return Statement(raw);
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

int64_t query_int(sqlite3* db, const std::string& sql) {
    auto stmt = prepare(db, sql.c_str());
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StoreError(errors::E3310_STORE_STATEMENT_FAILED,
                         errors::format_E3310_store_statement_failed(sql + ": " + sqlite3_errmsg(db)));
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

// Relaxes durability for a bulk load. Leaving scope restores synchronous=FULL
// and the connection's previous cache_size and temp_store.
class RelaxedSynchronous {
public:
    explicit RelaxedSynchronous(sqlite3* db)
        : db_(db),
          cache_size_(query_int(db, "PRAGMA cache_size")),
          temp_store_(query_int(db, "PRAGMA temp_store")) {
        run("PRAGMA synchronous = OFF");
        run("PRAGMA cache_size = 50000");
        run("PRAGMA temp_store = MEMORY");
    }
    ~RelaxedSynchronous() {
        run("PRAGMA synchronous = FULL");
        run("PRAGMA cache_size = " + std::to_string(cache_size_));
        run("PRAGMA temp_store = " + std::to_string(temp_store_));
    }

    RelaxedSynchronous(const RelaxedSynchronous&) = delete;
    RelaxedSynchronous& operator=(const RelaxedSynchronous&) = delete;

private:
    void run(const std::string& sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
            std::cerr << "PersistenceStore: " << sql << " failed: " << (err ? err : "unknown") << std::endl;
        }
        sqlite3_free(err);
    }

    sqlite3* db_;
    int64_t cache_size_;
    int64_t temp_store_;
};

const char* kCreateAttendance =
    "CREATE TABLE IF NOT EXISTS attendance ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " device_ip TEXT NOT NULL,"
    " uid INTEGER,"
    " user_id TEXT NOT NULL,"
    " name TEXT,"
    " timestamp TIMESTAMP,"
    " status INTEGER,"
    " punch INTEGER,"
    " imported_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,"
    " UNIQUE(device_ip, user_id, timestamp))";

const char* kCreateUsers =
    "CREATE TABLE IF NOT EXISTS users ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " device_ip TEXT NOT NULL,"
    " uid INTEGER,"
    " name TEXT,"
    " privilege TEXT,"
    " password TEXT,"
    " group_id TEXT,"
    " user_id TEXT,"
    " card TEXT,"
    " synced_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,"
    " UNIQUE(device_ip, uid))";

} // namespace

StoreSummary& StoreSummary::operator+=(const StoreSummary& other) {
    inserted += other.inserted;
    replaced += other.replaced;
    duplicates += other.duplicates;
    skipped += other.skipped;
    errors += other.errors;
    return *this;
}

void to_json(json& j, const StoreSummary& s) {
    j = json{
        {"inserted", s.inserted},
        {"replaced", s.replaced},
        {"duplicates", s.duplicates},
        {"skipped", s.skipped},
        {"errors", s.errors},
    };
}

PersistenceStore::PersistenceStore(const std::string& path) : path_(path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string detail = path + ": " + (db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError(errors::E3300_STORE_OPEN_FAILED, errors::format_E3300_store_open_failed(detail));
    }
}

PersistenceStore::~PersistenceStore() {
    if (db_) sqlite3_close(db_);
}

void PersistenceStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string detail = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw StoreError(errors::E3310_STORE_STATEMENT_FAILED, errors::format_E3310_store_statement_failed(detail));
    }
}

void PersistenceStore::ensure_schema() {
    exec(kCreateAttendance);
    exec(kCreateUsers);
}

StoreSummary PersistenceStore::upsert_users(const std::vector<PersistedUserRow>& rows) {
    StoreSummary summary;
    if (rows.empty()) return summary;

    auto lookup = prepare(db_, "SELECT 1 FROM users WHERE device_ip = ? AND uid = ?");
    auto stmt = prepare(db_,
        "INSERT OR REPLACE INTO users (device_ip, uid, name, privilege, password, group_id, user_id, card) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");

    exec("BEGIN");
    for (const auto& row : rows) {
        bind_text(lookup.get(), 1, row.device_ip);
        sqlite3_bind_int64(lookup.get(), 2, row.uid);
        const int found = sqlite3_step(lookup.get());
        sqlite3_reset(lookup.get());
        sqlite3_clear_bindings(lookup.get());
        if (found != SQLITE_ROW && found != SQLITE_DONE) {
            ++summary.errors;
            if (summary.errors <= kVerboseBatchErrors) {
                std::cerr << "PersistenceStore: user uid=" << row.uid << " on " << row.device_ip
                          << " lookup failed: " << sqlite3_errmsg(db_) << std::endl;
            }
            continue;
        }
        const bool existed = found == SQLITE_ROW;

        bind_text(stmt.get(), 1, row.device_ip);
        sqlite3_bind_int64(stmt.get(), 2, row.uid);
        bind_text(stmt.get(), 3, row.name);
        bind_text(stmt.get(), 4, row.privilege);
        bind_text(stmt.get(), 5, row.password);
        bind_text(stmt.get(), 6, row.group_id);
        bind_text(stmt.get(), 7, row.user_id);
        bind_text(stmt.get(), 8, row.card);
        if (sqlite3_step(stmt.get()) == SQLITE_DONE) {
            ++(existed ? summary.replaced : summary.inserted);
        } else {
            ++summary.errors;
            if (summary.errors <= kVerboseBatchErrors) {
                std::cerr << "PersistenceStore: user uid=" << row.uid << " on " << row.device_ip
                          << " not saved: " << sqlite3_errmsg(db_) << std::endl;
            }
        }
        sqlite3_reset(stmt.get());
        sqlite3_clear_bindings(stmt.get());
    }

    try {
        exec("COMMIT");
    } catch (const StoreError& e) {
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        std::cerr << "PersistenceStore: " << e.what() << std::endl;
        summary.errors += summary.inserted + summary.replaced;
        summary.inserted = 0;
        summary.replaced = 0;
    }
    return summary;
}

StoreSummary PersistenceStore::append_attendance(const std::vector<PersistedAttendanceRow>& rows,
                                                 std::size_t chunk_size) {
    StoreSummary summary;
    if (rows.empty()) return summary;
    if (chunk_size == 0) chunk_size = kDefaultChunkSize;

    RelaxedSynchronous relaxed(db_);
    auto stmt = prepare(db_,
        "INSERT OR IGNORE INTO attendance (device_ip, uid, user_id, name, timestamp, status, punch) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");

    int failed_chunks = 0;
    for (std::size_t start = 0; start < rows.size(); start += chunk_size) {
        const std::size_t end = std::min(rows.size(), start + chunk_size);
        const auto chunk_rows = static_cast<int64_t>(end - start);
        int64_t written = 0;
        try {
            exec("BEGIN");
            for (std::size_t i = start; i < end; ++i) {
                const auto& row = rows[i];
                bind_text(stmt.get(), 1, row.device_ip);
                sqlite3_bind_int64(stmt.get(), 2, row.uid);
                bind_text(stmt.get(), 3, row.user_id);
                bind_text(stmt.get(), 4, row.name);
                bind_text(stmt.get(), 5, row.timestamp);
                sqlite3_bind_int(stmt.get(), 6, row.status);
                sqlite3_bind_int(stmt.get(), 7, row.punch);
                if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                    throw StoreError(errors::E3320_STORE_BATCH_FAILED,
                                     errors::format_E3320_store_batch_failed(sqlite3_errmsg(db_)));
                }
                written += sqlite3_changes(db_);
                sqlite3_reset(stmt.get());
                sqlite3_clear_bindings(stmt.get());
            }
            exec("COMMIT");
            summary.inserted += written;
            summary.duplicates += chunk_rows - written;
        } catch (const StoreError& e) {
            sqlite3_reset(stmt.get());
            sqlite3_clear_bindings(stmt.get());
            if (!sqlite3_get_autocommit(db_)) sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            summary.errors += chunk_rows;
            if (++failed_chunks <= kVerboseBatchErrors) {
                std::cerr << "PersistenceStore: rows " << start << "-" << (end - 1) << " rolled back: "
                          << e.what() << std::endl;
            }
        }
    }
    return summary;
}

int64_t PersistenceStore::count_users(const std::string& device_ip) const {
    auto stmt = device_ip.empty()
        ? prepare(db_, "SELECT COUNT(*) FROM users")
        : prepare(db_, "SELECT COUNT(*) FROM users WHERE device_ip = ?");
    if (!device_ip.empty()) bind_text(stmt.get(), 1, device_ip);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) return 0;
    return sqlite3_column_int64(stmt.get(), 0);
}

int64_t PersistenceStore::count_attendance(const std::string& device_ip) const {
    auto stmt = device_ip.empty()
        ? prepare(db_, "SELECT COUNT(*) FROM attendance")
        : prepare(db_, "SELECT COUNT(*) FROM attendance WHERE device_ip = ?");
    if (!device_ip.empty()) bind_text(stmt.get(), 1, device_ip);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) return 0;
    return sqlite3_column_int64(stmt.get(), 0);
}

std::optional<PersistedUserRow> PersistenceStore::find_user(const std::string& device_ip, int64_t uid) const {
    auto stmt = prepare(db_,
        "SELECT device_ip, uid, name, privilege, password, group_id, user_id, card, synced_at "
        "FROM users WHERE device_ip = ? AND uid = ?");
    bind_text(stmt.get(), 1, device_ip);
    sqlite3_bind_int64(stmt.get(), 2, uid);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) return std::nullopt;

    PersistedUserRow row;
    row.device_ip = column_text(stmt.get(), 0);
    row.uid = sqlite3_column_int64(stmt.get(), 1);
    row.name = column_text(stmt.get(), 2);
    row.privilege = column_text(stmt.get(), 3);
    row.password = column_text(stmt.get(), 4);
    row.group_id = column_text(stmt.get(), 5);
    row.user_id = column_text(stmt.get(), 6);
    row.card = column_text(stmt.get(), 7);
    row.synced_at = column_text(stmt.get(), 8);
    return row;
}

std::vector<PersistedAttendanceRow> PersistenceStore::list_attendance(const std::string& device_ip,
                                                                      const std::string& user_id) const {
    auto stmt = user_id.empty()
        ? prepare(db_,
            "SELECT device_ip, uid, user_id, name, timestamp, status, punch, imported_at "
            "FROM attendance WHERE device_ip = ? ORDER BY timestamp, id")
        : prepare(db_,
            "SELECT device_ip, uid, user_id, name, timestamp, status, punch, imported_at "
            "FROM attendance WHERE device_ip = ? AND user_id = ? ORDER BY timestamp, id");
    bind_text(stmt.get(), 1, device_ip);
    if (!user_id.empty()) bind_text(stmt.get(), 2, user_id);

    std::vector<PersistedAttendanceRow> out;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        PersistedAttendanceRow row;
        row.device_ip = column_text(stmt.get(), 0);
        row.uid = sqlite3_column_int64(stmt.get(), 1);
        row.user_id = column_text(stmt.get(), 2);
        row.name = column_text(stmt.get(), 3);
        row.timestamp = column_text(stmt.get(), 4);
        row.status = sqlite3_column_int(stmt.get(), 5);
        row.punch = sqlite3_column_int(stmt.get(), 6);
        row.imported_at = column_text(stmt.get(), 7);
        out.push_back(std::move(row));
    }
    return out;
}

int PersistenceStore::synchronous_mode() const {
    return static_cast<int>(pragma_value("synchronous"));
}

int64_t PersistenceStore::pragma_value(const std::string& name) const {
    return query_int(db_, "PRAGMA " + name);
}

} // namespace punchsync
