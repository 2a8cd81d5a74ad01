#include "simulator/SimulatedSession.hpp"
#include "core/RecordNormalizer.hpp"
#include "devices/ZkProtocol.hpp"

#include <algorithm>

using nlohmann::json;

namespace punchsync {

namespace {

class SimulatedLiveStream : public LiveEventStream {
public:
    explicit SimulatedLiveStream(std::shared_ptr<SimulatedDeviceState> state) : state_(std::move(state)) {}

    CaptureItem next() override {
        ++state_->live_pulls;
        if (closed_) return CaptureItem::closed();
        const auto& script = state_->script.live;
        if (pos_ < script.size()) {
            CaptureItem item = script[pos_++];
            if (item.signal == CaptureSignal::Closed) closed_ = true;
            return item;
        }
        closed_ = true;
        if (state_->script.live_fails_at_end) {
            throw device_failure(DeviceErrorKind::Protocol, "simulated live stream failure on " + state_->ip);
        }
        return CaptureItem::closed();
    }

private:
    std::shared_ptr<SimulatedDeviceState> state_;
    std::size_t pos_ = 0;
    bool closed_ = false;
};

UserRecordRaw to_raw(const UserRecord& user) {
    UserRecordRaw raw;
    raw.uid = user.uid;
    raw.user_id = user.user_id;
    raw.name = user.name;
    raw.privilege = user.privilege == Privilege::Admin ? kAdminPrivilegeLevel : 0;
    raw.password = user.password;
    raw.group_id = user.group_id;
    raw.card = user.card;
    return raw;
}

} // namespace

SimulatedSession::SimulatedSession(std::shared_ptr<SimulatedDeviceState> state) : state_(std::move(state)) {
    ++state_->open_sessions;
}

SimulatedSession::~SimulatedSession() {
    if (connected_) --state_->open_sessions;
}

void SimulatedSession::step(const std::string& op) {
    state_->journal.push_back(op);
    auto it = state_->script.failures.find(op);
    if (it != state_->script.failures.end()) {
        throw device_failure(it->second, "simulated " + op + " failure on " + state_->ip);
    }
}

void SimulatedSession::disable() { step("disable"); }

void SimulatedSession::enable() { step("enable"); }

std::vector<UserRecordRaw> SimulatedSession::get_users() {
    step("get_users");
    return state_->script.users;
}

std::vector<AttendanceEventRaw> SimulatedSession::get_attendance() {
    step("get_attendance");
    return state_->script.attendance;
}

std::unique_ptr<LiveEventStream> SimulatedSession::live_capture(std::chrono::seconds /*timeout*/) {
    step("live_capture");
    return std::make_unique<SimulatedLiveStream>(state_);
}

void SimulatedSession::set_user(const UserRecord& user) {
    require_device_uid(user.uid);
    step("set_user");
    auto& users = state_->script.users;
    auto it = std::find_if(users.begin(), users.end(), [&](const UserRecordRaw& r) {
        return RecordNormalizer::coerce_int(r.uid) == user.uid;
    });
    if (it != users.end()) {
        *it = to_raw(user);
    } else {
        users.push_back(to_raw(user));
    }
}

void SimulatedSession::delete_user(int64_t uid) {
    require_device_uid(uid);
    step("delete_user");
    auto& users = state_->script.users;
    users.erase(std::remove_if(users.begin(), users.end(), [&](const UserRecordRaw& r) {
        return RecordNormalizer::coerce_int(r.uid) == uid;
    }), users.end());
}

std::string SimulatedSession::get_time() {
    step("get_time");
    return state_->script.clock;
}

void SimulatedSession::set_time(const std::string& local_time) {
    if (!zk::encode_time(local_time)) {
        throw device_failure(DeviceErrorKind::Rejected, state_->ip + ": cannot encode time '" + local_time + "'");
    }
    step("set_time");
    state_->script.clock = local_time;
}

DeviceInfo SimulatedSession::get_info() {
    step("get_info");
    return state_->script.info;
}

void SimulatedSession::disconnect() {
    if (connected_) {
        connected_ = false;
        --state_->open_sessions;
    }
    step("disconnect");
}

} // namespace punchsync
