#include "core/Records.hpp"

using json = nlohmann::json;

namespace punchsync {

static json field(const json& j, const char* key) {
    if (!j.is_object()) return json();
    auto it = j.find(key);
    if (it == j.end()) return json();
    return *it;
}

PunchStatus punch_status_from_code(int code) {
    switch (code) {
        case 0: return PunchStatus::CheckIn;
        case 1: return PunchStatus::CheckOut;
        case 2: return PunchStatus::BreakOut;
        case 3: return PunchStatus::BreakIn;
        case 4: return PunchStatus::OTIn;
        case 5: return PunchStatus::OTOut;
        default: return PunchStatus::Unknown;
    }
}

std::string to_string(PunchStatus status) {
    switch (status) {
        case PunchStatus::CheckIn: return "Check-In";
        case PunchStatus::CheckOut: return "Check-Out";
        case PunchStatus::BreakOut: return "Break-Out";
        case PunchStatus::BreakIn: return "Break-In";
        case PunchStatus::OTIn: return "OT-In";
        case PunchStatus::OTOut: return "OT-Out";
        case PunchStatus::Unknown: break;
    }
    return "Unknown";
}

std::string to_string(Privilege privilege) {
    return privilege == Privilege::Admin ? "Admin" : "User";
}

std::string DeviceDescriptor::label() const {
    return name + " (" + ip + ")";
}

UserRecordRaw UserRecordRaw::from_json(const json& j) {
    UserRecordRaw r;
    r.uid = field(j, "uid");
    r.user_id = field(j, "user_id");
    r.name = field(j, "name");
    r.privilege = field(j, "privilege");
    r.password = field(j, "password");
    r.group_id = field(j, "group_id");
    r.card = field(j, "card");
    return r;
}

AttendanceEventRaw AttendanceEventRaw::from_json(const json& j) {
    AttendanceEventRaw r;
    r.uid = field(j, "uid");
    r.user_id = field(j, "user_id");
    r.timestamp = field(j, "timestamp");
    r.status = field(j, "status");
    r.punch = field(j, "punch");
    return r;
}

PersistedUserRow to_persisted(const std::string& device_ip, const UserRecord& user) {
    PersistedUserRow row;
    row.device_ip = device_ip;
    row.uid = user.uid;
    row.name = user.name;
    row.privilege = to_string(user.privilege);
    row.password = user.password;
    row.group_id = user.group_id;
    row.user_id = user.user_id;
    row.card = user.card != 0 ? std::to_string(user.card) : std::string();
    return row;
}

PersistedAttendanceRow to_persisted(const std::string& device_ip, const AttendanceEvent& event, const std::string& name) {
    PersistedAttendanceRow row;
    row.device_ip = device_ip;
    row.uid = event.uid;
    row.user_id = event.user_id;
    row.name = name;
    row.timestamp = event.timestamp;
    row.status = event.status;
    row.punch = event.punch;
    return row;
}

void to_json(json& j, const DeviceDescriptor& d) {
    j = json{
        {"ip", d.ip},
        {"name", d.name},
        {"location", d.location},
        {"status", d.status},
        {"date_installed", d.date_installed},
        {"date_expired", d.date_expired},
        {"notes", d.notes},
    };
    if (d.port) j["port"] = *d.port;
    if (d.password) j["password"] = *d.password;
}

void to_json(json& j, const UserRecord& u) {
    j = json{
        {"uid", u.uid},
        {"user_id", u.user_id},
        {"name", u.name},
        {"privilege", to_string(u.privilege)},
        {"password", u.password},
        {"group_id", u.group_id},
        {"card", u.card},
    };
}

void to_json(json& j, const AttendanceEvent& e) {
    j = json{
        {"uid", e.uid},
        {"user_id", e.user_id},
        {"timestamp", e.timestamp},
        {"status", e.status},
        {"status_label", to_string(punch_status_from_code(e.status))},
        {"punch", e.punch},
    };
}

} // namespace punchsync
