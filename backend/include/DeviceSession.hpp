#pragma once

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Records.hpp"

namespace punchsync {

enum class DeviceErrorKind { Unreachable, AuthFailed, Timeout, Protocol, Rejected, Aborted };

std::string to_string(DeviceErrorKind kind);

struct DeviceError {
    DeviceErrorKind kind = DeviceErrorKind::Protocol;
    int code = 0;
    std::string message;
};

void to_json(nlohmann::json& j, const DeviceError& e);

/** @brief Failure talking to one device. Never fatal for a fleet run. */
class DeviceException : public std::runtime_error {
public:
    DeviceException(DeviceErrorKind kind, int code, const std::string& message)
        : std::runtime_error(message), error_{kind, code, message} {}

    const DeviceError& error() const { return error_; }
    DeviceErrorKind kind() const { return error_.kind; }

private:
    DeviceError error_;
};

// Builds the exception with the catalogued code and message for `kind`.
DeviceException device_failure(DeviceErrorKind kind, const std::string& detail);

// Terminals address users by an unsigned 16-bit uid.
inline constexpr int64_t kMaxDeviceUid = 65535;

// Throws a Rejected DeviceException for a uid outside 0..kMaxDeviceUid.
void require_device_uid(int64_t uid);

// Identity and network settings read from the terminal's option table.
struct DeviceInfo {
    std::string serial_number;
    std::string platform;
    std::string device_name;
    std::string firmware_version;
    std::string mac;
    std::string ip_address;
    std::string netmask;
    std::string gateway;
    int pin_width = 0;
};

void to_json(nlohmann::json& j, const DeviceInfo& info);

enum class CaptureSignal { Event, Timeout, Closed };

struct CaptureItem {
    CaptureSignal signal = CaptureSignal::Closed;
    // Meaningful only for CaptureSignal::Event.
    AttendanceEventRaw event;

    static CaptureItem of(AttendanceEventRaw raw) { return {CaptureSignal::Event, std::move(raw)}; }
    static CaptureItem timeout() { return {CaptureSignal::Timeout, {}}; }
    static CaptureItem closed() { return {CaptureSignal::Closed, {}}; }
};

/**
 * @brief Pull-based live punch stream bound to one session.
 *
 * next() blocks up to the capture timeout. After Closed every later call
 * returns Closed; a new stream needs a new live_capture() call. Transport
 * failures are thrown as DeviceException. The owning session must outlive
 * the stream.
 */
class LiveEventStream {
public:
    virtual ~LiveEventStream() = default;
    virtual CaptureItem next() = 0;
};

/**
 * @brief One connected device.
 *
 * To add a new transport:
 *  1. Inherit from DeviceSession and implement every pure virtual method.
 *  2. Provide a DeviceConnector that opens it.
 *  3. Throw DeviceException (never a bare runtime_error) for device failures.
 */
class DeviceSession {
public:
    virtual ~DeviceSession() = default;

    /** @brief Put the terminal in maintenance mode (keypad and sensor locked) */
    virtual void disable() = 0;
    /** @brief Leave maintenance mode */
    virtual void enable() = 0;
    virtual std::vector<UserRecordRaw> get_users() = 0;
    virtual std::vector<AttendanceEventRaw> get_attendance() = 0;
    virtual std::unique_ptr<LiveEventStream> live_capture(std::chrono::seconds timeout) = 0;
    /** @brief Create or overwrite the user with `user.uid` */
    virtual void set_user(const UserRecord& user) = 0;
    virtual void delete_user(int64_t uid) = 0;
    /** @brief Device wall clock as "YYYY-MM-DD HH:MM:SS" */
    virtual std::string get_time() = 0;
    virtual void set_time(const std::string& local_time) = 0;
    virtual DeviceInfo get_info() = 0;
    virtual void disconnect() = 0;
};

struct ConnectOptions {
    int port = 4370;
    std::chrono::seconds timeout{30};
    int password = 0;
};

class DeviceConnector {
public:
    virtual ~DeviceConnector() = default;
    // Throws DeviceException when the device cannot be reached or rejects the session.
    virtual std::unique_ptr<DeviceSession> connect(const std::string& ip, const ConnectOptions& options) = 0;
};

} // namespace punchsync
