#pragma once

#include <string>
#include <string_view>

namespace punchsync::errors {

// 3100-3199: device registry (fatal for a run)
// 3200-3299: device session (isolated to one device)
// 3300-3399: persistence store

inline constexpr int E3100_REGISTRY_UNAVAILABLE = 3100;

inline constexpr int E3200_DEVICE_UNREACHABLE = 3200;
inline constexpr int E3210_DEVICE_AUTH_FAILED = 3210;
inline constexpr int E3220_DEVICE_TIMEOUT = 3220;
inline constexpr int E3230_DEVICE_PROTOCOL = 3230;
inline constexpr int E3240_DEVICE_COMMAND_REJECTED = 3240;
inline constexpr int E3250_SYNC_ABORTED = 3250;

inline constexpr int E3300_STORE_OPEN_FAILED = 3300;
inline constexpr int E3310_STORE_STATEMENT_FAILED = 3310;
inline constexpr int E3320_STORE_BATCH_FAILED = 3320;

inline constexpr const char* MSG_E3100_REGISTRY_UNAVAILABLE_PREFIX = "Error 3100: Device registry unavailable: ";
inline constexpr const char* MSG_E3200_DEVICE_UNREACHABLE_PREFIX = "Error 3200: Device unreachable: ";
inline constexpr const char* MSG_E3210_DEVICE_AUTH_FAILED_PREFIX = "Error 3210: Device rejected credentials: ";
inline constexpr const char* MSG_E3220_DEVICE_TIMEOUT_PREFIX = "Error 3220: Device timed out: ";
inline constexpr const char* MSG_E3230_DEVICE_PROTOCOL_PREFIX = "Error 3230: Device protocol error: ";
inline constexpr const char* MSG_E3240_DEVICE_COMMAND_REJECTED_PREFIX = "Error 3240: Device rejected command: ";
inline constexpr const char* MSG_E3250_SYNC_ABORTED_PREFIX = "Error 3250: Sync aborted: ";
inline constexpr const char* MSG_E3300_STORE_OPEN_FAILED_PREFIX = "Error 3300: Cannot open store: ";
inline constexpr const char* MSG_E3310_STORE_STATEMENT_FAILED_PREFIX = "Error 3310: Store statement failed: ";
inline constexpr const char* MSG_E3320_STORE_BATCH_FAILED_PREFIX = "Error 3320: Store batch failed: ";

// Registry details.
inline constexpr const char* D3100_OPEN_FAILED = "cannot open registry file";
inline constexpr const char* D3100_PARSE_FAILED = "registry is not valid JSON";
inline constexpr const char* D3100_NO_DEVICE_LIST = "registry must be a list or an object with devices[]";
inline constexpr const char* D3100_ENTRY_NOT_OBJECT = "registry entry is not an object";
inline constexpr const char* D3100_ENTRY_MISSING_IP = "registry entry missing ip";
inline constexpr const char* D3100_DUPLICATE_IP = "duplicate device ip";

// Device details.
inline constexpr const char* D3200_NOT_CONNECTED = "session not connected";
inline constexpr const char* D3230_BAD_MAGIC = "bad packet prefix";
inline constexpr const char* D3230_SHORT_PACKET = "truncated packet";
inline constexpr const char* D3230_UNEXPECTED_REPLY = "unexpected reply";
inline constexpr const char* D3230_SHORT_BUFFER = "buffered read returned fewer bytes than announced";

// Record details.
inline constexpr const char* D3400_FIELD_NOT_TEXT = "field cannot be read as text";

namespace detail {
inline std::string with_prefix(const char* prefix, std::string_view detail) {
    std::string out;
    out.reserve(std::char_traits<char>::length(prefix) + detail.size());
    out.append(prefix);
    out.append(detail.data(), detail.size());
    return out;
}
} // namespace detail

inline std::string format_E3100_registry_unavailable(std::string_view detail) {
    return detail::with_prefix(MSG_E3100_REGISTRY_UNAVAILABLE_PREFIX, detail);
}

inline std::string format_E3200_device_unreachable(std::string_view detail) {
    return detail::with_prefix(MSG_E3200_DEVICE_UNREACHABLE_PREFIX, detail);
}

inline std::string format_E3210_device_auth_failed(std::string_view detail) {
    return detail::with_prefix(MSG_E3210_DEVICE_AUTH_FAILED_PREFIX, detail);
}

inline std::string format_E3220_device_timeout(std::string_view detail) {
    return detail::with_prefix(MSG_E3220_DEVICE_TIMEOUT_PREFIX, detail);
}

inline std::string format_E3230_device_protocol(std::string_view detail) {
    return detail::with_prefix(MSG_E3230_DEVICE_PROTOCOL_PREFIX, detail);
}

inline std::string format_E3240_device_command_rejected(std::string_view detail) {
    return detail::with_prefix(MSG_E3240_DEVICE_COMMAND_REJECTED_PREFIX, detail);
}

inline std::string format_E3250_sync_aborted(std::string_view detail) {
    return detail::with_prefix(MSG_E3250_SYNC_ABORTED_PREFIX, detail);
}

inline std::string format_E3300_store_open_failed(std::string_view detail) {
    return detail::with_prefix(MSG_E3300_STORE_OPEN_FAILED_PREFIX, detail);
}

inline std::string format_E3310_store_statement_failed(std::string_view detail) {
    return detail::with_prefix(MSG_E3310_STORE_STATEMENT_FAILED_PREFIX, detail);
}

inline std::string format_E3320_store_batch_failed(std::string_view detail) {
    return detail::with_prefix(MSG_E3320_STORE_BATCH_FAILED_PREFIX, detail);
}

} // namespace punchsync::errors
