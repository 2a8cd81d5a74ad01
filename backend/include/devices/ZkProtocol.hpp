#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/Records.hpp"

// Wire format of ZK-family attendance terminals over TCP (port 4370).
namespace punchsync::zk {

using Bytes = std::vector<uint8_t>;

inline constexpr uint16_t CMD_CONNECT = 1000;
inline constexpr uint16_t CMD_EXIT = 1001;
inline constexpr uint16_t CMD_ENABLEDEVICE = 1002;
inline constexpr uint16_t CMD_DISABLEDEVICE = 1003;
inline constexpr uint16_t CMD_REFRESHDATA = 1013;
inline constexpr uint16_t CMD_AUTH = 1102;
inline constexpr uint16_t CMD_GET_VERSION = 1100;
inline constexpr uint16_t CMD_USER_WRQ = 8;
inline constexpr uint16_t CMD_USERTEMP_RRQ = 9;
inline constexpr uint16_t CMD_OPTIONS_RRQ = 11;
inline constexpr uint16_t CMD_ATTLOG_RRQ = 13;
inline constexpr uint16_t CMD_DELETE_USER = 18;
inline constexpr uint16_t CMD_GET_FREE_SIZES = 50;
inline constexpr uint16_t CMD_STARTVERIFY = 60;
inline constexpr uint16_t CMD_CANCELCAPTURE = 62;
inline constexpr uint16_t CMD_GET_TIME = 201;
inline constexpr uint16_t CMD_SET_TIME = 202;
inline constexpr uint16_t CMD_REG_EVENT = 500;
inline constexpr uint16_t CMD_PREPARE_DATA = 1500;
inline constexpr uint16_t CMD_DATA = 1501;
inline constexpr uint16_t CMD_FREE_DATA = 1502;
inline constexpr uint16_t CMD_PREPARE_BUFFER = 1503;
inline constexpr uint16_t CMD_READ_BUFFER = 1504;

inline constexpr uint16_t CMD_ACK_OK = 2000;
inline constexpr uint16_t CMD_ACK_ERROR = 2001;
inline constexpr uint16_t CMD_ACK_DATA = 2002;
inline constexpr uint16_t CMD_ACK_UNAUTH = 2005;

inline constexpr uint32_t EF_ATTLOG = 1;
inline constexpr uint32_t FCT_USER = 5;

inline constexpr uint16_t MACHINE_PREPARE_DATA_1 = 0x5050;
inline constexpr uint16_t MACHINE_PREPARE_DATA_2 = 0x7D82;
inline constexpr uint32_t MAX_CHUNK = 0xFFC0;
inline constexpr uint32_t USHRT_MAX_VALUE = 65535;

struct PacketHeader {
    uint16_t command = 0;
    uint16_t checksum = 0;
    uint16_t session_id = 0;
    uint16_t reply_id = 0;
};

struct FreeSizes {
    int32_t users = 0;
    int32_t records = 0;
};

struct UserTable {
    std::vector<UserRecordRaw> users;
    // 28 or 72 depending on firmware; 0 when the table was empty.
    std::size_t record_size = 0;
};

uint16_t read_u16(const uint8_t* p);
uint32_t read_u32(const uint8_t* p);
void append_u16(Bytes& out, uint16_t v);
void append_u32(Bytes& out, uint32_t v);

uint16_t checksum(const Bytes& data);

// 8-byte header plus payload. The checksum covers `reply_id`, which is then
// advanced (wrapping at 65535) and written into the header.
Bytes make_header(uint16_t command, uint16_t session_id, uint16_t& reply_id, const Bytes& payload = {});

// Prefixes the TCP envelope: 0x5050, 0x7D82, uint32 length.
Bytes make_tcp_frame(const Bytes& packet);

// Length announced by an 8-byte TCP envelope, or nullopt for a bad prefix.
std::optional<uint32_t> tcp_payload_length(const uint8_t* top);

PacketHeader parse_header(const Bytes& packet);

Bytes make_comm_key(uint32_t key, uint16_t session_id, uint8_t ticks = 50);

// Packed device time: seconds since 2000-01-01 on a 31-day month / 12-month year calendar.
std::string decode_time(uint32_t packed);
// Inverse of decode_time for "YYYY-MM-DD HH:MM:SS" in 2000..2099; nullopt otherwise.
std::optional<uint32_t> encode_time(const std::string& local_time);
// Six bytes: year-2000, month, day, hour, minute, second.
std::string decode_time_hex(const uint8_t* six);

// Bytes up to the first NUL, invalid UTF-8 dropped.
std::string decode_text(const uint8_t* p, std::size_t len);

FreeSizes parse_free_sizes(const Bytes& payload);

// Option read request: "<name>\0".
Bytes pack_option_request(const std::string& name);
// Value of a "~Name=value\0" option reply; the whole text when no '=' is present.
std::string parse_option_value(const Bytes& payload);

// `data` starts with the uint32 total size as returned by a buffered read.
UserTable parse_users(const Bytes& data, int32_t user_count);
std::vector<AttendanceEventRaw> parse_attendance(const Bytes& data, int32_t record_count,
                                                 const std::vector<UserRecordRaw>& users);
std::vector<AttendanceEventRaw> parse_live_events(const Bytes& payload, const std::vector<UserRecordRaw>& users);

// Throws a Rejected DeviceException when `user.uid` does not fit the 16-bit field.
Bytes pack_user(const UserRecord& user, std::size_t record_size);
Bytes pack_read_buffer_request(uint16_t command, uint32_t fct, uint32_t ext);

} // namespace punchsync::zk
