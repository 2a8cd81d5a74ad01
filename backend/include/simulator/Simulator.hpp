#pragma once
#include "DeviceSession.hpp"
#include "simulator/SimulatedSession.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace punchsync {

/**
 * @brief Connector that serves scripted terminals instead of real hardware.
 *
 * Fixture format:
 *   {"devices": {"<ip>": {"users": [...], "attendance": [...], "live": [...],
 *                         "password": 0, "fail": {"get_users": "timeout"},
 *                         "clock": "YYYY-MM-DD HH:MM:SS", "info": {"serial_number": ...},
 *                         "live_end": "closed" | "error"}}}
 * A live item {"timeout": true} is a read timeout; any other object is a punch.
 */
class Simulator : public DeviceConnector {
public:
    Simulator() = default;

    void add_device(const std::string& ip, SimulatedDeviceScript script);

    // Returns false (and logs) when the fixture cannot be read.
    bool load_from_fixture(const std::string& path);
    void load_from_json(const nlohmann::json& fixture);

    std::shared_ptr<SimulatedDeviceState> device(const std::string& ip) const;
    const std::vector<std::string>& connect_attempts() const { return connect_attempts_; }

    std::unique_ptr<DeviceSession> connect(const std::string& ip, const ConnectOptions& options) override;

private:
    std::map<std::string, std::shared_ptr<SimulatedDeviceState>> devices_;
    std::vector<std::string> connect_attempts_;
};

} // namespace punchsync
