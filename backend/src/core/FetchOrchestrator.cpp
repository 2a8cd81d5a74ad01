#include "core/FetchOrchestrator.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/RecordNormalizer.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>

using json = nlohmann::json;

namespace punchsync {

namespace {

// Connected session in maintenance mode. Leaving scope re-enables the
// terminal and disconnects; failures there are logged, never thrown.
class SessionLease {
public:
    SessionLease(std::unique_ptr<DeviceSession> session, std::string label)
        : session_(std::move(session)), label_(std::move(label)) {}

    ~SessionLease() {
        if (!session_) return;
        try {
            session_->enable();
        } catch (const std::exception& e) {
            std::cerr << "FetchOrchestrator: " << label_ << ": enable failed during release: " << e.what() << std::endl;
        }
        try {
            session_->disconnect();
        } catch (const std::exception& e) {
            std::cerr << "FetchOrchestrator: " << label_ << ": disconnect failed during release: " << e.what() << std::endl;
        }
    }

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    DeviceSession& session() { return *session_; }

private:
    std::unique_ptr<DeviceSession> session_;
    std::string label_;
};

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

std::string to_string(SyncKind kind) {
    return kind == SyncKind::Users ? "users" : "attendance";
}

void to_json(json& j, const FailedDevice& f) {
    j = json{{"name", f.name}, {"ip", f.ip}, {"error", f.error}};
}

void to_json(json& j, const DeviceSnapshot& s) {
    j = json{
        {"device", s.device},
        {"info", s.info},
        {"device_time", s.device_time},
        {"drift_seconds", s.drift_seconds ? json(*s.drift_seconds) : json()},
        {"clock_out_of_sync", s.clock_out_of_sync()},
        {"clock_set", s.clock_set},
    };
    if (s.error) j["error"] = *s.error;
}

void to_json(json& j, const FleetReport& r) {
    j = json{
        {"kind", to_string(r.kind)},
        {"attempted", r.attempted},
        {"succeeded", r.succeeded},
        {"failed_devices", r.failed_devices},
        {"total_records", r.total_records},
        {"store", r.store},
        {"elapsed_seconds", r.elapsed_seconds},
    };
}

FetchOrchestrator::FetchOrchestrator(DeviceConnector& connector, PersistenceStore& store, ConnectOptions defaults)
    : connector_(connector), store_(store), defaults_(defaults) {}

ConnectOptions FetchOrchestrator::options_for(const DeviceDescriptor& device) const {
    ConnectOptions opts = defaults_;
    if (device.port) opts.port = *device.port;
    if (device.password) opts.password = *device.password;
    return opts;
}

template <typename Fn>
std::optional<DeviceError> FetchOrchestrator::with_session(const DeviceDescriptor& device, Fn&& fn) {
    try {
        SessionLease lease(connector_.connect(device.ip, options_for(device)), device.label());
        lease.session().disable();
        fn(lease.session());
        return std::nullopt;
    } catch (const DeviceException& e) {
        return e.error();
    } catch (const StoreError& e) {
        return DeviceError{DeviceErrorKind::Aborted, e.code(), e.what()};
    } catch (const std::exception& e) {
        return DeviceError{DeviceErrorKind::Aborted, errors::E3250_SYNC_ABORTED,
                           errors::format_E3250_sync_aborted(e.what())};
    }
}

StoreSummary FetchOrchestrator::store_users(const DeviceDescriptor& device, const std::vector<UserRecord>& users) {
    std::vector<PersistedUserRow> rows;
    rows.reserve(users.size());
    for (const auto& u : users) rows.push_back(to_persisted(device.ip, u));
    return store_.upsert_users(rows);
}

FetchOrchestrator::NamedAttendance FetchOrchestrator::read_attendance(DeviceSession& session,
                                                                     const DeviceDescriptor& device,
                                                                     const NameResolver* names) {
    NameResolver roster;
    if (!names) {
        roster = NameResolver::build(RecordNormalizer::normalize_users(session.get_users()));
        names = &roster;
    }

    NamedAttendance named;
    named.batch = RecordNormalizer::normalize_attendance_batch(session.get_attendance(), device.label());
    named.rows.reserve(named.batch.events.size());
    for (const auto& ev : named.batch.events) {
        named.rows.push_back(to_persisted(device.ip, ev, names->resolve(ev.uid, ev.user_id)));
    }
    return named;
}

StoreSummary FetchOrchestrator::store_attendance(const NamedAttendance& named) {
    StoreSummary summary = store_.append_attendance(named.rows, chunk_size_);
    summary.skipped += named.batch.skipped;
    summary.errors += named.batch.errored;
    return summary;
}

SyncResult<AttendanceEvent> FetchOrchestrator::attendance_sync(const DeviceDescriptor& device, const NameResolver* names) {
    SyncResult<AttendanceEvent> result;
    result.error = with_session(device, [&](DeviceSession& session) {
        auto named = read_attendance(session, device, names);
        result.store = store_attendance(named);
        result.records = std::move(named.batch.events);
    });
    if (result.error) result.records.clear();
    return result;
}

SyncResult<UserRecord> FetchOrchestrator::sync_users(const DeviceDescriptor& device) {
    SyncResult<UserRecord> result;
    result.error = with_session(device, [&](DeviceSession& session) {
        result.records = RecordNormalizer::normalize_users(session.get_users());
        result.store = store_users(device, result.records);
    });
    if (result.error) result.records.clear();
    return result;
}

SyncResult<AttendanceEvent> FetchOrchestrator::sync_attendance(const DeviceDescriptor& device, const NameResolver& names) {
    return attendance_sync(device, &names);
}

SyncResult<AttendanceEvent> FetchOrchestrator::sync_attendance(const DeviceDescriptor& device) {
    return attendance_sync(device, nullptr);
}

FleetReport FetchOrchestrator::run_fleet(const std::vector<DeviceDescriptor>& devices, SyncKind kind) {
    FleetReport report;
    report.kind = kind;
    const auto run_started = std::chrono::steady_clock::now();

    for (std::size_t i = 0; i < devices.size(); ++i) {
        const auto& device = devices[i];
        const auto started = std::chrono::steady_clock::now();
        ++report.attempted;
        std::cout << "[" << (i + 1) << "/" << devices.size() << "] " << device.label()
                  << ": syncing " << to_string(kind) << std::endl;

        std::optional<DeviceError> error;
        int64_t fetched = 0;
        StoreSummary summary;
        if (kind == SyncKind::Users) {
            auto r = sync_users(device);
            error = r.error;
            fetched = static_cast<int64_t>(r.records.size());
            summary = r.store;
        } else {
            auto r = sync_attendance(device);
            error = r.error;
            fetched = static_cast<int64_t>(r.records.size());
            summary = r.store;
        }

        if (error) {
            std::cerr << "FetchOrchestrator: " << device.label() << " failed: " << error->message << std::endl;
            report.failed_devices.push_back(FailedDevice{device.name, device.ip, *error});
            continue;
        }
        ++report.succeeded;
        report.total_records += fetched;
        report.store += summary;
        std::cout << "FetchOrchestrator: " << device.label() << ": " << fetched << " records, "
                  << summary.inserted << " new, " << summary.replaced << " replaced, "
                  << summary.duplicates << " already stored, "
                  << summary.skipped << " skipped, " << summary.errors << " errors ("
                  << std::fixed << std::setprecision(2) << seconds_since(started) << "s)"
                  << std::defaultfloat << std::endl;
    }

    report.elapsed_seconds = seconds_since(run_started);
    return report;
}

SyncResult<UserRecord> FetchOrchestrator::fetch_users(const DeviceDescriptor& device) {
    SyncResult<UserRecord> result;
    result.error = with_session(device, [&](DeviceSession& session) {
        result.records = RecordNormalizer::normalize_users(session.get_users());
    });
    if (result.error) result.records.clear();
    return result;
}

SyncResult<UserRecord> FetchOrchestrator::set_user(const DeviceDescriptor& device, const UserRecord& user) {
    SyncResult<UserRecord> result;
    result.error = with_session(device, [&](DeviceSession& session) {
        session.set_user(user);
        result.records = RecordNormalizer::normalize_users(session.get_users());
    });
    if (result.error) result.records.clear();
    return result;
}

SyncResult<UserRecord> FetchOrchestrator::delete_user(const DeviceDescriptor& device, int64_t uid) {
    SyncResult<UserRecord> result;
    result.error = with_session(device, [&](DeviceSession& session) {
        session.delete_user(uid);
        result.records = RecordNormalizer::normalize_users(session.get_users());
    });
    if (result.error) result.records.clear();
    return result;
}

SyncResult<UserRecord> FetchOrchestrator::find_users(const DeviceDescriptor& device, const UserQuery& query) {
    SyncResult<UserRecord> result;
    result.error = with_session(device, [&](DeviceSession& session) {
        result.records = filter_users(RecordNormalizer::normalize_users(session.get_users()), query);
    });
    if (result.error) result.records.clear();
    return result;
}

AttendanceView FetchOrchestrator::view_attendance(const DeviceDescriptor& device, const AttendanceQuery& query) {
    AttendanceView view;
    view.error = with_session(device, [&](DeviceSession& session) {
        auto named = read_attendance(session, device, nullptr);
        view.fetched = static_cast<int64_t>(named.rows.size());
        if (query.save) view.saved = store_attendance(named);
        if (!query.user_id) {
            view.rows = std::move(named.rows);
            return;
        }
        for (auto& row : named.rows) {
            if (row.user_id == *query.user_id) view.rows.push_back(std::move(row));
        }
    });
    if (view.error) view.rows.clear();
    return view;
}

bool DeviceSnapshot::clock_out_of_sync() const {
    return drift_seconds && (*drift_seconds > kClockDriftWarnSeconds || *drift_seconds < -kClockDriftWarnSeconds);
}

DeviceSnapshot FetchOrchestrator::snapshot(const DeviceDescriptor& device, const std::string& host_time, bool set_clock) {
    DeviceSnapshot snap;
    snap.device = device;
    snap.error = with_session(device, [&](DeviceSession& session) {
        if (set_clock) {
            session.set_time(host_time);
            snap.clock_set = true;
        }
        snap.info = session.get_info();
        snap.device_time = session.get_time();
    });
    if (snap.error) {
        snap.info = DeviceInfo{};
        snap.device_time.clear();
        return snap;
    }

    auto device_seconds = RecordNormalizer::timestamp_seconds(snap.device_time);
    auto host_seconds = RecordNormalizer::timestamp_seconds(host_time);
    if (device_seconds && host_seconds) snap.drift_seconds = *device_seconds - *host_seconds;
    if (snap.clock_out_of_sync()) {
        std::cerr << "FetchOrchestrator: " << device.label() << ": clock is " << *snap.drift_seconds
                  << "s off host time " << host_time << std::endl;
    }
    return snap;
}

LiveCaptureResult FetchOrchestrator::capture_live(const DeviceDescriptor& device, const CancellationToken& cancel,
                                                  LiveCaptureConsumer::EventHandler on_event,
                                                  std::chrono::seconds read_timeout, int64_t idle_limit) {
    LiveCaptureResult result;
    result.error = with_session(device, [&](DeviceSession& session) {
        auto names = NameResolver::build(RecordNormalizer::normalize_users(session.get_users()));
        auto stream = session.live_capture(read_timeout);
        LiveCaptureConsumer consumer(names, std::move(on_event));
        consumer.set_idle_timeout_limit(idle_limit);
        result.summary = consumer.run(*stream, cancel);
    });
    return result;
}

} // namespace punchsync
