#include "simulator/Simulator.hpp"
#include "core/RecordNormalizer.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

using nlohmann::json;

namespace punchsync {

static DeviceErrorKind parse_error_kind(const std::string& s) {
    if (s == "unreachable") return DeviceErrorKind::Unreachable;
    if (s == "auth_failed") return DeviceErrorKind::AuthFailed;
    if (s == "timeout") return DeviceErrorKind::Timeout;
    if (s == "rejected") return DeviceErrorKind::Rejected;
    if (s == "aborted") return DeviceErrorKind::Aborted;
    return DeviceErrorKind::Protocol;
}

static SimulatedDeviceScript parse_script(const json& node) {
    SimulatedDeviceScript script;
    if (node.contains("users")) {
        for (const auto& u : node["users"]) script.users.push_back(UserRecordRaw::from_json(u));
    }
    if (node.contains("attendance")) {
        for (const auto& a : node["attendance"]) script.attendance.push_back(AttendanceEventRaw::from_json(a));
    }
    if (node.contains("live")) {
        for (const auto& item : node["live"]) {
            if (item.is_object() && item.value("timeout", false)) {
                script.live.push_back(CaptureItem::timeout());
            } else if (item.is_object() && item.value("closed", false)) {
                script.live.push_back(CaptureItem::closed());
            } else {
                script.live.push_back(CaptureItem::of(AttendanceEventRaw::from_json(item)));
            }
        }
    }
    script.live_fails_at_end = node.value("live_end", std::string("closed")) == "error";
    if (node.contains("password") && !node["password"].is_null()) {
        script.password = static_cast<int>(RecordNormalizer::coerce_int(node["password"]));
    }
    if (node.contains("clock") && node["clock"].is_string()) script.clock = node["clock"].get<std::string>();
    if (node.contains("info") && node["info"].is_object()) {
        const auto& info = node["info"];
        script.info.serial_number = info.value("serial_number", std::string());
        script.info.platform = info.value("platform", std::string());
        script.info.device_name = info.value("device_name", std::string());
        script.info.firmware_version = info.value("firmware_version", std::string());
        script.info.mac = info.value("mac", std::string());
        script.info.ip_address = info.value("ip_address", std::string());
        script.info.netmask = info.value("netmask", std::string());
        script.info.gateway = info.value("gateway", std::string());
        script.info.pin_width = info.value("pin_width", 0);
    }
    if (node.contains("fail") && node["fail"].is_object()) {
        for (auto it = node["fail"].begin(); it != node["fail"].end(); ++it) {
            script.failures[it.key()] = parse_error_kind(it.value().get<std::string>());
        }
    }
    return script;
}

void Simulator::add_device(const std::string& ip, SimulatedDeviceScript script) {
    auto state = std::make_shared<SimulatedDeviceState>();
    state->ip = ip;
    state->script = std::move(script);
    devices_[ip] = std::move(state);
}

void Simulator::load_from_json(const json& fixture) {
    if (!fixture.is_object() || !fixture.contains("devices") || !fixture["devices"].is_object()) {
        throw std::invalid_argument("simulator fixture must contain a devices{} object");
    }
    for (auto it = fixture["devices"].begin(); it != fixture["devices"].end(); ++it) {
        add_device(it.key(), parse_script(it.value()));
    }
}

bool Simulator::load_from_fixture(const std::string& path) {
    try {
        std::ifstream f(path);
        if (!f) {
            std::cerr << "Simulator: unable to open fixture: " << path << std::endl;
            return false;
        }
        load_from_json(json::parse(f));
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Simulator load error: " << e.what() << std::endl;
        return false;
    }
}

std::shared_ptr<SimulatedDeviceState> Simulator::device(const std::string& ip) const {
    auto it = devices_.find(ip);
    return it == devices_.end() ? nullptr : it->second;
}

std::unique_ptr<DeviceSession> Simulator::connect(const std::string& ip, const ConnectOptions& options) {
    connect_attempts_.push_back(ip);
    auto state = device(ip);
    if (!state) {
        throw device_failure(DeviceErrorKind::Unreachable, "no simulated device at " + ip);
    }
    state->journal.push_back("connect");
    auto fail = state->script.failures.find("connect");
    if (fail != state->script.failures.end()) {
        throw device_failure(fail->second, "simulated connect failure on " + ip);
    }
    if (state->script.password && *state->script.password != options.password) {
        throw device_failure(DeviceErrorKind::AuthFailed, ip);
    }
    return std::make_unique<SimulatedSession>(state);
}

} // namespace punchsync
