#pragma once
#include "DeviceSession.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace punchsync {

// Scripted behaviour of one simulated terminal.
struct SimulatedDeviceScript {
    std::vector<UserRecordRaw> users;
    std::vector<AttendanceEventRaw> attendance;
    std::vector<CaptureItem> live;
    // Stream throws a Protocol error instead of closing once `live` is exhausted.
    bool live_fails_at_end = false;
    // When set, connect() requires this password.
    std::optional<int> password;
    // Device wall clock; set_time() overwrites it.
    std::string clock = "2024-01-01 00:00:00";
    DeviceInfo info;
    // Operation name ("connect", "disable", "get_users", ...) -> failure to raise.
    std::map<std::string, DeviceErrorKind> failures;
};

// Script plus everything observed while serving it.
struct SimulatedDeviceState {
    std::string ip;
    SimulatedDeviceScript script;
    std::vector<std::string> journal;
    std::size_t live_pulls = 0;
    int open_sessions = 0;
};

class SimulatedSession : public DeviceSession {
public:
    explicit SimulatedSession(std::shared_ptr<SimulatedDeviceState> state);
    ~SimulatedSession() override;

    void disable() override;
    void enable() override;
    std::vector<UserRecordRaw> get_users() override;
    std::vector<AttendanceEventRaw> get_attendance() override;
    std::unique_ptr<LiveEventStream> live_capture(std::chrono::seconds timeout) override;
    void set_user(const UserRecord& user) override;
    void delete_user(int64_t uid) override;
    std::string get_time() override;
    void set_time(const std::string& local_time) override;
    DeviceInfo get_info() override;
    void disconnect() override;

private:
    void step(const std::string& op);

    std::shared_ptr<SimulatedDeviceState> state_;
    bool connected_ = true;
};

} // namespace punchsync
