#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace punchsync {

// Device privilege values at or above this level are administrators.
inline constexpr int kAdminPrivilegeLevel = 14;

enum class Privilege { Default, Admin };

enum class PunchStatus { CheckIn, CheckOut, BreakOut, BreakIn, OTIn, OTOut, Unknown };

PunchStatus punch_status_from_code(int code);
std::string to_string(PunchStatus status);
// "Admin" or "User", as stored in the users table and the CSV export.
std::string to_string(Privilege privilege);

struct DeviceDescriptor {
    std::string ip;
    std::string name;
    std::string location;
    std::string status;
    std::string date_installed;
    std::string date_expired;
    std::string notes;
    // Per-device overrides of the run's connection defaults.
    std::optional<int> port;
    std::optional<int> password;

    // "name (ip)" as shown in reports.
    std::string label() const;
};

/**
 * @brief User record exactly as a device reported it.
 *
 * Members are loosely typed; a null value means the device did not send the field.
 */
struct UserRecordRaw {
    nlohmann::json uid;
    nlohmann::json user_id;
    nlohmann::json name;
    nlohmann::json privilege;
    nlohmann::json password;
    nlohmann::json group_id;
    nlohmann::json card;

    static UserRecordRaw from_json(const nlohmann::json& j);
};

/** @brief Attendance punch exactly as a device reported it (null = absent). */
struct AttendanceEventRaw {
    nlohmann::json uid;
    nlohmann::json user_id;
    nlohmann::json timestamp;
    nlohmann::json status;
    nlohmann::json punch;

    static AttendanceEventRaw from_json(const nlohmann::json& j);
};

struct UserRecord {
    int64_t uid = 0;
    std::string user_id;
    std::string name;
    Privilege privilege = Privilege::Default;
    std::string password;
    std::string group_id;
    int64_t card = 0;
};

struct AttendanceEvent {
    int64_t uid = 0;
    std::string user_id;
    // Device-local wall clock, "YYYY-MM-DD HH:MM:SS", no timezone.
    std::string timestamp;
    int status = 0;
    int punch = 0;
};

struct PersistedUserRow {
    std::string device_ip;
    int64_t uid = 0;
    std::string name;
    std::string privilege;
    std::string password;
    std::string group_id;
    std::string user_id;
    std::string card;
    std::string synced_at;
};

struct PersistedAttendanceRow {
    std::string device_ip;
    int64_t uid = 0;
    std::string user_id;
    std::string name;
    std::string timestamp;
    int status = 0;
    int punch = 0;
    std::string imported_at;
};

PersistedUserRow to_persisted(const std::string& device_ip, const UserRecord& user);
PersistedAttendanceRow to_persisted(const std::string& device_ip, const AttendanceEvent& event, const std::string& name);

void to_json(nlohmann::json& j, const DeviceDescriptor& d);
void to_json(nlohmann::json& j, const UserRecord& u);
void to_json(nlohmann::json& j, const AttendanceEvent& e);

} // namespace punchsync
