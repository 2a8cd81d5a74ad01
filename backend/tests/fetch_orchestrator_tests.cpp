#include <gtest/gtest.h>
#include "core/FetchOrchestrator.hpp"
#include "simulator/Simulator.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using nlohmann::json;
using namespace punchsync;
using punchsync::testing_support::temp_path;

static DeviceDescriptor descriptor(const std::string& ip, const std::string& name) {
    DeviceDescriptor d;
    d.ip = ip;
    d.name = name;
    return d;
}

static UserRecordRaw raw_user(json uid, const std::string& user_id, const std::string& name) {
    return UserRecordRaw::from_json({{"uid", uid}, {"user_id", user_id}, {"name", name}, {"privilege", 0}});
}

static AttendanceEventRaw raw_punch(json uid, json user_id, json timestamp) {
    return AttendanceEventRaw::from_json(
        {{"uid", uid}, {"user_id", user_id}, {"timestamp", timestamp}, {"status", 1}, {"punch", 0}});
}

static SimulatedDeviceScript roster_script() {
    SimulatedDeviceScript s;
    s.users = {raw_user(1, "1001", "Ann"), raw_user(2, "1002", "Ben")};
    s.attendance = {raw_punch(1, "1001", "2024-03-01 08:00:00"), raw_punch(2, "1002", "2024-03-01 08:05:00")};
    return s;
}

static std::vector<std::string> journal_of(const Simulator& sim, const std::string& ip) {
    return sim.device(ip)->journal;
}

class FetchOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = temp_path(std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".db");
        store_ = std::make_unique<PersistenceStore>(path_);
        store_->ensure_schema();
        orchestrator_ = std::make_unique<FetchOrchestrator>(sim_, *store_);
    }

    Simulator sim_;
    std::string path_;
    std::unique_ptr<PersistenceStore> store_;
    std::unique_ptr<FetchOrchestrator> orchestrator_;
};

TEST_F(FetchOrchestratorTest, UserSyncKeepsMalformedUidAsZero) {
    SimulatedDeviceScript s;
    s.users = {raw_user(1, "1001", "Ann"), raw_user(2, "1002", "Ben"), raw_user("abc", "1003", "Carol")};
    sim_.add_device("10.0.0.1", s);

    auto report = orchestrator_->run_fleet({descriptor("10.0.0.1", "Gate")}, SyncKind::Users);
    EXPECT_EQ(report.attempted, 1);
    EXPECT_EQ(report.succeeded, 1);
    EXPECT_EQ(report.total_records, 3);
    EXPECT_EQ(report.store.inserted, 3);
    EXPECT_EQ(report.store.skipped, 0);
    EXPECT_EQ(report.store.errors, 0);

    auto carol = store_->find_user("10.0.0.1", 0);
    ASSERT_TRUE(carol.has_value());
    EXPECT_EQ(carol->name, "Carol");
    EXPECT_EQ(carol->user_id, "1003");
}

TEST_F(FetchOrchestratorTest, UnreachableDeviceDoesNotStopTheFleet) {
    sim_.add_device("10.0.0.1", roster_script());
    SimulatedDeviceScript down = roster_script();
    down.failures["connect"] = DeviceErrorKind::Unreachable;
    sim_.add_device("10.0.0.2", down);
    sim_.add_device("10.0.0.3", roster_script());

    auto report = orchestrator_->run_fleet(
        {descriptor("10.0.0.1", "A"), descriptor("10.0.0.2", "B"), descriptor("10.0.0.3", "C")},
        SyncKind::Attendance);

    EXPECT_EQ(report.attempted, 3);
    EXPECT_EQ(report.succeeded, 2);
    ASSERT_EQ(report.failed_devices.size(), 1u);
    EXPECT_EQ(report.failed_devices[0].ip, "10.0.0.2");
    EXPECT_EQ(report.failed_devices[0].name, "B");
    EXPECT_EQ(report.failed_devices[0].error.kind, DeviceErrorKind::Unreachable);

    std::vector<std::string> expected = {"10.0.0.1", "10.0.0.2", "10.0.0.3"};
    EXPECT_EQ(sim_.connect_attempts(), expected);
    EXPECT_EQ(store_->count_attendance("10.0.0.3"), 2);
    EXPECT_EQ(store_->count_attendance("10.0.0.2"), 0);
    EXPECT_EQ(report.total_records, 4);
}

TEST_F(FetchOrchestratorTest, UnknownDeviceFailsAsUnreachable) {
    auto result = orchestrator_->sync_users(descriptor("10.9.9.9", "Ghost"));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, DeviceErrorKind::Unreachable);
    EXPECT_TRUE(result.records.empty());
}

TEST_F(FetchOrchestratorTest, FetchFailureStillReleasesTheDevice) {
    SimulatedDeviceScript s = roster_script();
    s.failures["get_users"] = DeviceErrorKind::Timeout;
    sim_.add_device("10.0.0.1", s);

    auto result = orchestrator_->sync_users(descriptor("10.0.0.1", "Gate"));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, DeviceErrorKind::Timeout);

    std::vector<std::string> expected = {"connect", "disable", "get_users", "enable", "disconnect"};
    EXPECT_EQ(journal_of(sim_, "10.0.0.1"), expected);
    EXPECT_EQ(sim_.device("10.0.0.1")->open_sessions, 0);
    EXPECT_EQ(store_->count_users(), 0);
}

TEST_F(FetchOrchestratorTest, DisableFailureStillReleasesTheDevice) {
    SimulatedDeviceScript s = roster_script();
    s.failures["disable"] = DeviceErrorKind::Rejected;
    sim_.add_device("10.0.0.1", s);

    auto result = orchestrator_->sync_users(descriptor("10.0.0.1", "Gate"));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, DeviceErrorKind::Rejected);

    std::vector<std::string> expected = {"connect", "disable", "enable", "disconnect"};
    EXPECT_EQ(journal_of(sim_, "10.0.0.1"), expected);
    EXPECT_EQ(sim_.device("10.0.0.1")->open_sessions, 0);
}

TEST_F(FetchOrchestratorTest, ReleaseFailuresDoNotChangeTheOutcome) {
    SimulatedDeviceScript s = roster_script();
    s.failures["enable"] = DeviceErrorKind::Timeout;
    s.failures["disconnect"] = DeviceErrorKind::Protocol;
    sim_.add_device("10.0.0.1", s);

    auto result = orchestrator_->sync_users(descriptor("10.0.0.1", "Gate"));
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.records.size(), 2u);
    EXPECT_EQ(store_->count_users("10.0.0.1"), 2);

    auto journal = journal_of(sim_, "10.0.0.1");
    ASSERT_GE(journal.size(), 2u);
    EXPECT_EQ(journal[journal.size() - 2], "enable");
    EXPECT_EQ(journal.back(), "disconnect");
}

TEST_F(FetchOrchestratorTest, AttendanceIsNamedAndBadRecordsAreCounted) {
    SimulatedDeviceScript s;
    s.users = {raw_user(1, "100", "Ann")};
    s.attendance = {
        raw_punch(1, "100", "2024-03-01 08:00:00"),
        raw_punch("x", "100", "2024-03-01 17:00:00"),
        raw_punch(3, nullptr, "2024-03-01 09:00:00"),
        raw_punch(4, json{{"nested", true}}, "2024-03-01 10:00:00"),
    };
    sim_.add_device("10.0.0.1", s);

    auto report = orchestrator_->run_fleet({descriptor("10.0.0.1", "Gate")}, SyncKind::Attendance);
    EXPECT_EQ(report.succeeded, 1);
    EXPECT_EQ(report.total_records, 2);
    EXPECT_EQ(report.store.inserted, 2);
    EXPECT_EQ(report.store.skipped, 1);
    EXPECT_EQ(report.store.errors, 1);

    auto rows = store_->list_attendance("10.0.0.1");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].name, "Ann");
    EXPECT_EQ(rows[1].name, "Ann");
    EXPECT_EQ(rows[1].uid, 0);
    EXPECT_EQ(rows[0].status, 1);

    std::vector<std::string> expected = {"connect", "disable", "get_users", "get_attendance", "enable", "disconnect"};
    EXPECT_EQ(journal_of(sim_, "10.0.0.1"), expected);
}

TEST_F(FetchOrchestratorTest, RepeatedAttendanceRunAddsNothing) {
    sim_.add_device("10.0.0.1", roster_script());
    auto devices = std::vector<DeviceDescriptor>{descriptor("10.0.0.1", "Gate")};

    auto first = orchestrator_->run_fleet(devices, SyncKind::Attendance);
    auto second = orchestrator_->run_fleet(devices, SyncKind::Attendance);
    EXPECT_EQ(first.store.inserted, 2);
    EXPECT_EQ(second.store.inserted, 0);
    EXPECT_EQ(second.store.duplicates, 2);
    EXPECT_EQ(second.total_records, 2);
    EXPECT_EQ(store_->count_attendance(), 2);
}

TEST_F(FetchOrchestratorTest, LatestRosterSupersedesStoredUsers) {
    SimulatedDeviceScript s;
    s.users = {raw_user(1, "1001", "Alice")};
    sim_.add_device("10.0.0.1", s);
    auto gate = descriptor("10.0.0.1", "Gate");

    ASSERT_TRUE(orchestrator_->sync_users(gate).ok());
    sim_.device("10.0.0.1")->script.users = {raw_user(1, "1001", "Alicia")};
    ASSERT_TRUE(orchestrator_->sync_users(gate).ok());

    EXPECT_EQ(store_->count_users("10.0.0.1"), 1);
    EXPECT_EQ(store_->find_user("10.0.0.1", 1)->name, "Alicia");
}

TEST_F(FetchOrchestratorTest, EmptyDeviceStillSucceeds) {
    sim_.add_device("10.0.0.1", SimulatedDeviceScript{});
    auto report = orchestrator_->run_fleet({descriptor("10.0.0.1", "Gate")}, SyncKind::Attendance);
    EXPECT_EQ(report.succeeded, 1);
    EXPECT_EQ(report.total_records, 0);
    EXPECT_TRUE(report.failed_devices.empty());
}

TEST_F(FetchOrchestratorTest, SetUserReturnsRefreshedRoster) {
    sim_.add_device("10.0.0.1", roster_script());
    UserRecord dana;
    dana.uid = 3;
    dana.user_id = "1003";
    dana.name = "Dana";
    dana.privilege = Privilege::Admin;

    auto result = orchestrator_->set_user(descriptor("10.0.0.1", "Gate"), dana);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.records.size(), 3u);
    auto it = std::find_if(result.records.begin(), result.records.end(),
                           [](const UserRecord& u) { return u.uid == 3; });
    ASSERT_NE(it, result.records.end());
    EXPECT_EQ(it->name, "Dana");
    EXPECT_EQ(it->privilege, Privilege::Admin);

    std::vector<std::string> expected = {"connect", "disable", "set_user", "get_users", "enable", "disconnect"};
    EXPECT_EQ(journal_of(sim_, "10.0.0.1"), expected);
    EXPECT_EQ(store_->count_users(), 0);
}

TEST_F(FetchOrchestratorTest, DeleteUserReturnsRefreshedRoster) {
    sim_.add_device("10.0.0.1", roster_script());
    auto result = orchestrator_->delete_user(descriptor("10.0.0.1", "Gate"), 1);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0].uid, 2);
}

TEST_F(FetchOrchestratorTest, RejectedCommandIsReported) {
    SimulatedDeviceScript s = roster_script();
    s.failures["delete_user"] = DeviceErrorKind::Rejected;
    sim_.add_device("10.0.0.1", s);

    auto result = orchestrator_->delete_user(descriptor("10.0.0.1", "Gate"), 1);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, DeviceErrorKind::Rejected);
    EXPECT_EQ(sim_.device("10.0.0.1")->open_sessions, 0);
}

TEST_F(FetchOrchestratorTest, PerDevicePasswordOverridesDefault) {
    SimulatedDeviceScript locked = roster_script();
    locked.password = 1234;
    sim_.add_device("10.0.0.1", locked);
    SimulatedDeviceScript other = roster_script();
    other.password = 99;
    sim_.add_device("10.0.0.2", other);

    auto with_key = descriptor("10.0.0.1", "Locked");
    with_key.password = 1234;
    EXPECT_TRUE(orchestrator_->fetch_users(with_key).ok());

    auto without_key = orchestrator_->fetch_users(descriptor("10.0.0.2", "Other"));
    ASSERT_FALSE(without_key.ok());
    EXPECT_EQ(without_key.error->kind, DeviceErrorKind::AuthFailed);
}

TEST_F(FetchOrchestratorTest, OptionsForAppliesDeviceOverrides) {
    auto d = descriptor("10.0.0.1", "Gate");
    d.port = 4371;
    auto opts = orchestrator_->options_for(d);
    EXPECT_EQ(opts.port, 4371);
    EXPECT_EQ(opts.password, 0);
    EXPECT_EQ(opts.timeout, std::chrono::seconds(30));
}

TEST_F(FetchOrchestratorTest, LiveCaptureNamesEventsFromTheRoster) {
    SimulatedDeviceScript s = roster_script();
    s.live = {CaptureItem::timeout(), CaptureItem::of(raw_punch(json("1002"), "1002", "2024-03-01 12:00:00"))};
    sim_.add_device("10.0.0.1", s);

    CancellationToken cancel;
    std::vector<CapturedEvent> seen;
    auto result = orchestrator_->capture_live(descriptor("10.0.0.1", "Gate"), cancel,
                                              [&](const CapturedEvent& e) { seen.push_back(e); },
                                              std::chrono::seconds(1));
    ASSERT_FALSE(result.error.has_value());
    EXPECT_EQ(result.summary.end, CaptureEnd::StreamClosed);
    EXPECT_EQ(result.summary.timeouts, 1);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].name, "Ben");
    EXPECT_EQ(seen[0].sequence, 1);
    EXPECT_EQ(store_->count_attendance(), 0);

    std::vector<std::string> expected = {"connect", "disable", "get_users", "live_capture", "enable", "disconnect"};
    EXPECT_EQ(journal_of(sim_, "10.0.0.1"), expected);
}

TEST_F(FetchOrchestratorTest, SyncAttendanceUsesTheSuppliedNames) {
    SimulatedDeviceScript s = roster_script();
    s.users = {raw_user(1, "1001", "Roster Ann")};
    sim_.add_device("10.0.0.1", s);

    UserRecord ann;
    ann.uid = 1;
    ann.user_id = "1001";
    ann.name = "Ann";
    auto names = NameResolver::build({ann});

    auto result = orchestrator_->sync_attendance(descriptor("10.0.0.1", "Gate"), names);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.records.size(), 2u);
    EXPECT_EQ(result.store.inserted, 2);

    auto rows = store_->list_attendance("10.0.0.1");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].name, "Ann");
    EXPECT_EQ(rows[1].name, "");

    std::vector<std::string> expected = {"connect", "disable", "get_attendance", "enable", "disconnect"};
    EXPECT_EQ(journal_of(sim_, "10.0.0.1"), expected);
}

TEST_F(FetchOrchestratorTest, SyncAttendanceFailureReleasesTheDevice) {
    SimulatedDeviceScript s = roster_script();
    s.failures["get_attendance"] = DeviceErrorKind::Timeout;
    sim_.add_device("10.0.0.1", s);

    auto result = orchestrator_->sync_attendance(descriptor("10.0.0.1", "Gate"), NameResolver{});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, DeviceErrorKind::Timeout);
    EXPECT_TRUE(result.records.empty());

    std::vector<std::string> expected = {"connect", "disable", "get_attendance", "enable", "disconnect"};
    EXPECT_EQ(journal_of(sim_, "10.0.0.1"), expected);
    EXPECT_EQ(sim_.device("10.0.0.1")->open_sessions, 0);
    EXPECT_EQ(store_->count_attendance(), 0);
}

TEST_F(FetchOrchestratorTest, UidBeyondSixteenBitsIsRejectedBeforeSending) {
    sim_.add_device("10.0.0.1", roster_script());
    auto gate = descriptor("10.0.0.1", "Gate");

    UserRecord wide;
    wide.uid = 70000;
    wide.user_id = "70000";
    wide.name = "Wide";
    auto set = orchestrator_->set_user(gate, wide);
    ASSERT_FALSE(set.ok());
    EXPECT_EQ(set.error->kind, DeviceErrorKind::Rejected);

    auto removed = orchestrator_->delete_user(gate, -1);
    ASSERT_FALSE(removed.ok());
    EXPECT_EQ(removed.error->kind, DeviceErrorKind::Rejected);

    auto journal = journal_of(sim_, "10.0.0.1");
    EXPECT_EQ(std::count(journal.begin(), journal.end(), "set_user"), 0);
    EXPECT_EQ(std::count(journal.begin(), journal.end(), "delete_user"), 0);
    EXPECT_EQ(sim_.device("10.0.0.1")->script.users.size(), 2u);
    EXPECT_EQ(sim_.device("10.0.0.1")->open_sessions, 0);
}

TEST_F(FetchOrchestratorTest, FindUsersFiltersTheRoster) {
    SimulatedDeviceScript s = roster_script();
    s.users.push_back(UserRecordRaw::from_json({{"uid", 3}, {"user_id", "1003"}, {"name", "Annika"}, {"privilege", 14}}));
    sim_.add_device("10.0.0.1", s);
    auto gate = descriptor("10.0.0.1", "Gate");

    auto by_name = orchestrator_->find_users(gate, UserQuery::by_name("ANN"));
    ASSERT_TRUE(by_name.ok());
    ASSERT_EQ(by_name.records.size(), 2u);
    EXPECT_EQ(by_name.records[0].name, "Ann");
    EXPECT_EQ(by_name.records[1].name, "Annika");

    auto admins = orchestrator_->find_users(gate, UserQuery::admins());
    ASSERT_EQ(admins.records.size(), 1u);
    EXPECT_EQ(admins.records[0].uid, 3);

    auto by_id = orchestrator_->find_users(gate, UserQuery::by_user_id("1002"));
    ASSERT_EQ(by_id.records.size(), 1u);
    EXPECT_EQ(by_id.records[0].name, "Ben");

    EXPECT_TRUE(orchestrator_->find_users(gate, UserQuery::by_user_id("9999")).records.empty());
    EXPECT_EQ(store_->count_users(), 0);
}

TEST_F(FetchOrchestratorTest, AttendanceViewFiltersWithoutSaving) {
    sim_.add_device("10.0.0.1", roster_script());

    AttendanceQuery query;
    query.user_id = "1002";
    auto view = orchestrator_->view_attendance(descriptor("10.0.0.1", "Gate"), query);
    ASSERT_TRUE(view.ok());
    EXPECT_EQ(view.fetched, 2);
    ASSERT_EQ(view.rows.size(), 1u);
    EXPECT_EQ(view.rows[0].name, "Ben");
    EXPECT_EQ(view.rows[0].timestamp, "2024-03-01 08:05:00");
    EXPECT_FALSE(view.saved.has_value());
    EXPECT_EQ(store_->count_attendance(), 0);
}

TEST_F(FetchOrchestratorTest, AttendanceViewSavesTheWholeLog) {
    sim_.add_device("10.0.0.1", roster_script());
    auto gate = descriptor("10.0.0.1", "Gate");

    AttendanceQuery query;
    query.user_id = "1001";
    query.save = true;
    auto view = orchestrator_->view_attendance(gate, query);
    ASSERT_TRUE(view.ok());
    EXPECT_EQ(view.rows.size(), 1u);
    ASSERT_TRUE(view.saved.has_value());
    EXPECT_EQ(view.saved->inserted, 2);
    EXPECT_EQ(store_->count_attendance("10.0.0.1"), 2);

    auto again = orchestrator_->view_attendance(gate, query);
    ASSERT_TRUE(again.saved.has_value());
    EXPECT_EQ(again.saved->inserted, 0);
    EXPECT_EQ(again.saved->duplicates, 2);
}

TEST_F(FetchOrchestratorTest, SnapshotReportsIdentityAndDrift) {
    SimulatedDeviceScript s = roster_script();
    s.clock = "2024-03-15 08:30:45";
    s.info.serial_number = "CKJ1234";
    s.info.platform = "ZMM220_TFT";
    s.info.pin_width = 9;
    sim_.add_device("10.0.0.1", s);
    auto gate = descriptor("10.0.0.1", "Gate");

    auto close = orchestrator_->snapshot(gate, "2024-03-15 08:29:45");
    ASSERT_TRUE(close.ok());
    EXPECT_EQ(close.info.serial_number, "CKJ1234");
    EXPECT_EQ(close.info.pin_width, 9);
    EXPECT_EQ(close.device_time, "2024-03-15 08:30:45");
    ASSERT_TRUE(close.drift_seconds.has_value());
    EXPECT_EQ(*close.drift_seconds, 60);
    EXPECT_FALSE(close.clock_out_of_sync());
    EXPECT_FALSE(close.clock_set);

    auto behind = orchestrator_->snapshot(gate, "2024-03-16 08:30:45");
    ASSERT_TRUE(behind.ok());
    EXPECT_EQ(*behind.drift_seconds, -86400);
    EXPECT_TRUE(behind.clock_out_of_sync());
    EXPECT_EQ(sim_.device("10.0.0.1")->open_sessions, 0);
}

TEST_F(FetchOrchestratorTest, SnapshotCanSetTheClockFirst) {
    SimulatedDeviceScript s = roster_script();
    s.clock = "2023-01-01 00:00:00";
    sim_.add_device("10.0.0.1", s);

    auto snap = orchestrator_->snapshot(descriptor("10.0.0.1", "Gate"), "2024-03-15 08:30:45", true);
    ASSERT_TRUE(snap.ok());
    EXPECT_TRUE(snap.clock_set);
    EXPECT_EQ(snap.device_time, "2024-03-15 08:30:45");
    EXPECT_EQ(*snap.drift_seconds, 0);

    std::vector<std::string> expected = {"connect", "disable", "set_time", "get_info", "get_time", "enable", "disconnect"};
    EXPECT_EQ(journal_of(sim_, "10.0.0.1"), expected);
}

TEST_F(FetchOrchestratorTest, SnapshotFailureClearsPartialReadings) {
    SimulatedDeviceScript s = roster_script();
    s.info.serial_number = "CKJ1234";
    s.failures["get_time"] = DeviceErrorKind::Timeout;
    sim_.add_device("10.0.0.1", s);

    auto snap = orchestrator_->snapshot(descriptor("10.0.0.1", "Gate"), "2024-03-15 08:30:45");
    ASSERT_FALSE(snap.ok());
    EXPECT_EQ(snap.error->kind, DeviceErrorKind::Timeout);
    EXPECT_TRUE(snap.info.serial_number.empty());
    EXPECT_FALSE(snap.drift_seconds.has_value());
    EXPECT_EQ(sim_.device("10.0.0.1")->open_sessions, 0);
}
