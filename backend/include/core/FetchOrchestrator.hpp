#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "DeviceSession.hpp"
#include "core/LiveCaptureConsumer.hpp"
#include "core/NameResolver.hpp"
#include "core/PersistenceStore.hpp"
#include "core/RecordNormalizer.hpp"
#include "core/Records.hpp"
#include "core/UserQuery.hpp"

namespace punchsync {

enum class SyncKind { Users, Attendance };

std::string to_string(SyncKind kind);

template <typename Record>
struct SyncResult {
    std::vector<Record> records;
    StoreSummary store;
    std::optional<DeviceError> error;

    bool ok() const { return !error.has_value(); }
};

struct FailedDevice {
    std::string name;
    std::string ip;
    DeviceError error;
};

struct FleetReport {
    SyncKind kind = SyncKind::Users;
    int attempted = 0;
    // Devices that finished without error, including those that had no records.
    int succeeded = 0;
    std::vector<FailedDevice> failed_devices;
    // Records fetched and normalized across successful devices.
    int64_t total_records = 0;
    StoreSummary store;
    double elapsed_seconds = 0.0;
};

struct AttendanceQuery {
    // Restricts the returned rows; saving always covers the whole device log.
    std::optional<std::string> user_id;
    bool save = false;
};

struct AttendanceView {
    // Named punches that passed the user_id filter, in device order.
    std::vector<PersistedAttendanceRow> rows;
    // Punches read and normalized before filtering.
    int64_t fetched = 0;
    // Set only when the query asked to save.
    std::optional<StoreSummary> saved;
    std::optional<DeviceError> error;

    bool ok() const { return !error.has_value(); }
};

// Device clocks further than this from the host are out of sync.
inline constexpr int64_t kClockDriftWarnSeconds = 120;

struct DeviceSnapshot {
    DeviceDescriptor device;
    DeviceInfo info;
    std::string device_time;
    // Device clock minus host clock; nullopt when either side is unreadable.
    std::optional<int64_t> drift_seconds;
    bool clock_set = false;
    std::optional<DeviceError> error;

    bool ok() const { return !error.has_value(); }
    bool clock_out_of_sync() const;
};

struct LiveCaptureResult {
    CaptureSummary summary;
    std::optional<DeviceError> error;
};

void to_json(nlohmann::json& j, const FailedDevice& f);
void to_json(nlohmann::json& j, const FleetReport& r);
void to_json(nlohmann::json& j, const DeviceSnapshot& s);

/**
 * @brief Drives devices one at a time: connect, disable, fetch, normalize,
 * store, and always enable + disconnect afterwards.
 *
 * Per-device failures are returned as values; nothing escapes run_fleet.
 */
class FetchOrchestrator {
public:
    FetchOrchestrator(DeviceConnector& connector, PersistenceStore& store, ConnectOptions defaults = {});

    void set_chunk_size(std::size_t chunk_size) { chunk_size_ = chunk_size; }

    SyncResult<UserRecord> sync_users(const DeviceDescriptor& device);
    SyncResult<AttendanceEvent> sync_attendance(const DeviceDescriptor& device, const NameResolver& names);
    // Names come from the device's own roster, read in the same session.
    SyncResult<AttendanceEvent> sync_attendance(const DeviceDescriptor& device);
    FleetReport run_fleet(const std::vector<DeviceDescriptor>& devices, SyncKind kind);

    // Roster only; nothing is written to the store.
    SyncResult<UserRecord> fetch_users(const DeviceDescriptor& device);
    // Apply the command, then return the refreshed roster (not persisted).
    SyncResult<UserRecord> set_user(const DeviceDescriptor& device, const UserRecord& user);
    SyncResult<UserRecord> delete_user(const DeviceDescriptor& device, int64_t uid);
    // Roster filtered by `query`; nothing is written to the store.
    SyncResult<UserRecord> find_users(const DeviceDescriptor& device, const UserQuery& query);

    // One device's punch log, named from its roster, optionally saved.
    AttendanceView view_attendance(const DeviceDescriptor& device, const AttendanceQuery& query);

    // Identity, clock and drift against `host_time` ("YYYY-MM-DD HH:MM:SS").
    // With `set_clock` the device clock is first set to `host_time`.
    DeviceSnapshot snapshot(const DeviceDescriptor& device, const std::string& host_time, bool set_clock = false);

    // Names come from the device's own roster, read in the same session.
    LiveCaptureResult capture_live(const DeviceDescriptor& device, const CancellationToken& cancel,
                                   LiveCaptureConsumer::EventHandler on_event,
                                   std::chrono::seconds read_timeout, int64_t idle_limit = 0);

    ConnectOptions options_for(const DeviceDescriptor& device) const;

private:
    template <typename Fn>
    std::optional<DeviceError> with_session(const DeviceDescriptor& device, Fn&& fn);

    struct NamedAttendance {
        AttendanceBatch batch;
        std::vector<PersistedAttendanceRow> rows;
    };

    StoreSummary store_users(const DeviceDescriptor& device, const std::vector<UserRecord>& users);
    // A null `names` resolves from the session's own roster.
    NamedAttendance read_attendance(DeviceSession& session, const DeviceDescriptor& device, const NameResolver* names);
    StoreSummary store_attendance(const NamedAttendance& named);
    SyncResult<AttendanceEvent> attendance_sync(const DeviceDescriptor& device, const NameResolver* names);

    DeviceConnector& connector_;
    PersistenceStore& store_;
    ConnectOptions defaults_;
    std::size_t chunk_size_ = PersistenceStore::kDefaultChunkSize;
};

} // namespace punchsync
