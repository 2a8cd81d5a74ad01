#include <gtest/gtest.h>
#include "core/ErrorCatalog.hpp"
#include "core/PersistenceStore.hpp"
#include "test_support.hpp"

#include <sqlite3.h>

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

using namespace punchsync;
using punchsync::testing_support::temp_path;

static PersistedAttendanceRow punch_row(const std::string& ip, const std::string& user_id, const std::string& ts) {
    PersistedAttendanceRow row;
    row.device_ip = ip;
    row.uid = 1;
    row.user_id = user_id;
    row.name = "N" + user_id;
    row.timestamp = ts;
    row.status = 0;
    row.punch = 1;
    return row;
}

static std::string ts_for(int i) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "2024-01-%02d %02d:%02d:00", 1 + (i / 1440) % 28, (i / 60) % 24, i % 60);
    return buf;
}

class PersistenceStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = temp_path(std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".db");
        store_ = std::make_unique<PersistenceStore>(path_);
        store_->ensure_schema();
    }

    std::string path_;
    std::unique_ptr<PersistenceStore> store_;
};

TEST_F(PersistenceStoreTest, SchemaCreationIsRepeatable) {
    store_->append_attendance({punch_row("10.0.0.1", "1001", "2024-01-02 08:00:00")});
    store_->ensure_schema();
    EXPECT_EQ(store_->count_attendance(), 1);
}

TEST_F(PersistenceStoreTest, AttendanceAppendIsIdempotent) {
    std::vector<PersistedAttendanceRow> rows = {
        punch_row("10.0.0.1", "1001", "2024-01-02 08:00:00"),
        punch_row("10.0.0.1", "1001", "2024-01-02 17:00:00"),
        punch_row("10.0.0.1", "1002", "2024-01-02 08:00:00"),
    };
    auto first = store_->append_attendance(rows);
    EXPECT_EQ(first.inserted, 3);
    EXPECT_EQ(first.duplicates, 0);

    auto second = store_->append_attendance(rows);
    EXPECT_EQ(second.inserted, 0);
    EXPECT_EQ(second.duplicates, 3);
    EXPECT_EQ(second.errors, 0);
    EXPECT_EQ(store_->count_attendance(), 3);
}

TEST_F(PersistenceStoreTest, DuplicateInsideOneBatchCountsOnce) {
    std::vector<PersistedAttendanceRow> rows;
    for (int i = 0; i < 999; ++i) rows.push_back(punch_row("10.0.0.1", "1001", ts_for(i)));
    rows.push_back(rows.front());

    auto summary = store_->append_attendance(rows);
    EXPECT_EQ(summary.inserted, 999);
    EXPECT_EQ(summary.duplicates, 1);
    EXPECT_EQ(summary.errors, 0);
    EXPECT_EQ(summary.skipped, 0);
    EXPECT_EQ(store_->count_attendance("10.0.0.1"), 999);
}

TEST_F(PersistenceStoreTest, SamePunchOnTwoDevicesIsTwoRows) {
    store_->append_attendance({punch_row("10.0.0.1", "1001", "2024-01-02 08:00:00"),
                               punch_row("10.0.0.2", "1001", "2024-01-02 08:00:00")});
    EXPECT_EQ(store_->count_attendance(), 2);
    EXPECT_EQ(store_->count_attendance("10.0.0.2"), 1);
}

TEST_F(PersistenceStoreTest, DurabilityRestoredAfterBulkLoad) {
    store_->append_attendance({punch_row("10.0.0.1", "1001", "2024-01-02 08:00:00")});
    EXPECT_EQ(store_->synchronous_mode(), 2);
}

TEST_F(PersistenceStoreTest, BulkLoadLeavesCacheAndTempStoreAsFound) {
    const int64_t cache_before = store_->pragma_value("cache_size");
    const int64_t temp_before = store_->pragma_value("temp_store");
    ASSERT_NE(cache_before, 50000);

    store_->append_attendance({punch_row("10.0.0.1", "1001", "2024-01-02 08:00:00"),
                               punch_row("10.0.0.1", "1002", "2024-01-02 08:00:00")});
    EXPECT_EQ(store_->pragma_value("cache_size"), cache_before);
    EXPECT_EQ(store_->pragma_value("temp_store"), temp_before);
}

TEST_F(PersistenceStoreTest, FailingChunkIsRolledBackAlone) {
    {
        sqlite3* raw = nullptr;
        ASSERT_EQ(sqlite3_open(path_.c_str(), &raw), SQLITE_OK);
        ASSERT_EQ(sqlite3_exec(raw,
                               "CREATE TRIGGER reject_boom BEFORE INSERT ON attendance "
                               "WHEN NEW.user_id = 'boom' BEGIN SELECT RAISE(ABORT, 'forced'); END",
                               nullptr, nullptr, nullptr),
                  SQLITE_OK);
        sqlite3_close(raw);
    }

    std::vector<PersistedAttendanceRow> rows;
    for (int i = 0; i < 25; ++i) rows.push_back(punch_row("10.0.0.1", i == 12 ? "boom" : "1001", ts_for(i)));

    auto summary = store_->append_attendance(rows, 10);
    EXPECT_EQ(summary.inserted, 15);
    EXPECT_EQ(summary.errors, 10);
    EXPECT_EQ(summary.duplicates, 0);
    EXPECT_EQ(store_->count_attendance(), 15);

    auto stored = store_->list_attendance("10.0.0.1");
    ASSERT_EQ(stored.size(), 15u);
    EXPECT_EQ(stored[9].timestamp, ts_for(9));
    EXPECT_EQ(stored[10].timestamp, ts_for(20));
    EXPECT_EQ(store_->synchronous_mode(), 2);
}

TEST_F(PersistenceStoreTest, LatestUserSyncSupersedes) {
    UserRecord alice;
    alice.uid = 1;
    alice.user_id = "1001";
    alice.name = "Alice";
    store_->upsert_users({to_persisted("10.0.0.1", alice)});

    alice.name = "Alicia";
    alice.privilege = Privilege::Admin;
    auto summary = store_->upsert_users({to_persisted("10.0.0.1", alice)});
    EXPECT_EQ(summary.inserted, 0);
    EXPECT_EQ(summary.replaced, 1);
    EXPECT_EQ(summary.errors, 0);

    EXPECT_EQ(store_->count_users("10.0.0.1"), 1);
    auto row = store_->find_user("10.0.0.1", 1);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->name, "Alicia");
    EXPECT_EQ(row->privilege, "Admin");
    EXPECT_EQ(row->card, "");
    EXPECT_FALSE(row->synced_at.empty());
}

TEST_F(PersistenceStoreTest, RepeatedUidInOneUserBatchCountsAsReplaced) {
    UserRecord first;
    first.uid = 4;
    first.user_id = "1004";
    first.name = "Dee";
    UserRecord second = first;
    second.name = "Dee Dee";

    auto summary = store_->upsert_users({to_persisted("10.0.0.1", first), to_persisted("10.0.0.1", second)});
    EXPECT_EQ(summary.inserted, 1);
    EXPECT_EQ(summary.replaced, 1);
    EXPECT_EQ(summary.errors, 0);
    EXPECT_EQ(store_->count_users(), 1);
    EXPECT_EQ(store_->find_user("10.0.0.1", 4)->name, "Dee Dee");
}

TEST_F(PersistenceStoreTest, UsersAreKeyedPerDevice) {
    UserRecord u;
    u.uid = 7;
    u.user_id = "7";
    u.name = "Gus";
    u.card = 123456;
    store_->upsert_users({to_persisted("10.0.0.1", u), to_persisted("10.0.0.2", u)});
    EXPECT_EQ(store_->count_users(), 2);
    auto row = store_->find_user("10.0.0.2", 7);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->card, "123456");
    EXPECT_EQ(row->privilege, "User");
    EXPECT_FALSE(store_->find_user("10.0.0.3", 7).has_value());
}

TEST_F(PersistenceStoreTest, EmptyBatchesAreNoOps) {
    auto a = store_->append_attendance({});
    auto u = store_->upsert_users({});
    EXPECT_EQ(a.inserted + a.duplicates + a.errors + a.skipped, 0);
    EXPECT_EQ(u.inserted + u.replaced + u.errors, 0);
}

TEST(PersistenceStore, OpenFailureIsReported) {
    try {
        PersistenceStore store("/nonexistent_punchsync_dir/zkteco.db");
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.code(), errors::E3300_STORE_OPEN_FAILED);
    }
}
