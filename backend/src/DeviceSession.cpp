#include "DeviceSession.hpp"
#include "core/ErrorCatalog.hpp"

namespace punchsync {

std::string to_string(DeviceErrorKind kind) {
    switch (kind) {
        case DeviceErrorKind::Unreachable: return "unreachable";
        case DeviceErrorKind::AuthFailed: return "auth_failed";
        case DeviceErrorKind::Timeout: return "timeout";
        case DeviceErrorKind::Protocol: return "protocol";
        case DeviceErrorKind::Rejected: return "rejected";
        case DeviceErrorKind::Aborted: return "aborted";
    }
    return "unknown";
}

DeviceException device_failure(DeviceErrorKind kind, const std::string& detail) {
    switch (kind) {
        case DeviceErrorKind::Unreachable:
            return DeviceException(kind, errors::E3200_DEVICE_UNREACHABLE, errors::format_E3200_device_unreachable(detail));
        case DeviceErrorKind::AuthFailed:
            return DeviceException(kind, errors::E3210_DEVICE_AUTH_FAILED, errors::format_E3210_device_auth_failed(detail));
        case DeviceErrorKind::Timeout:
            return DeviceException(kind, errors::E3220_DEVICE_TIMEOUT, errors::format_E3220_device_timeout(detail));
        case DeviceErrorKind::Rejected:
            return DeviceException(kind, errors::E3240_DEVICE_COMMAND_REJECTED, errors::format_E3240_device_command_rejected(detail));
        case DeviceErrorKind::Aborted:
            return DeviceException(kind, errors::E3250_SYNC_ABORTED, errors::format_E3250_sync_aborted(detail));
        case DeviceErrorKind::Protocol:
            break;
    }
    return DeviceException(DeviceErrorKind::Protocol, errors::E3230_DEVICE_PROTOCOL, errors::format_E3230_device_protocol(detail));
}

void require_device_uid(int64_t uid) {
    if (uid < 0 || uid > kMaxDeviceUid) {
        throw device_failure(DeviceErrorKind::Rejected,
                             "uid " + std::to_string(uid) + " outside 0.." + std::to_string(kMaxDeviceUid));
    }
}

void to_json(nlohmann::json& j, const DeviceInfo& info) {
    j = nlohmann::json{
        {"serial_number", info.serial_number},
        {"platform", info.platform},
        {"device_name", info.device_name},
        {"firmware_version", info.firmware_version},
        {"mac", info.mac},
        {"ip_address", info.ip_address},
        {"netmask", info.netmask},
        {"gateway", info.gateway},
        {"pin_width", info.pin_width},
    };
}

void to_json(nlohmann::json& j, const DeviceError& e) {
    j = nlohmann::json{
        {"kind", to_string(e.kind)},
        {"code", e.code},
        {"message", e.message},
    };
}

} // namespace punchsync
