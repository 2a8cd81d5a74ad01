#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/Records.hpp"

namespace punchsync {

// Registry unreadable or structurally invalid. Fatal for a run.
class RegistryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DeviceRegistry {
public:
    DeviceRegistry();

    // Accepts {"devices": [...]} or a bare list. Throws RegistryError.
    static DeviceRegistry load_from_file(const std::string& path);
    static DeviceRegistry load_from_json(const nlohmann::json& doc);

    // Throws RegistryError on a duplicate ip.
    void register_device(DeviceDescriptor device);

    // Apply a function to each registered device, in file order (thread-safe)
    void for_each_device(const std::function<void(const DeviceDescriptor&)>& fn) const;

    std::optional<DeviceDescriptor> get_device(const std::string& ip) const;

    std::vector<DeviceDescriptor> devices() const;
    std::size_t size() const;

    // Descriptor list for display
    nlohmann::json get_descriptor_graph() const;

    DeviceRegistry(DeviceRegistry&& other) noexcept;
    DeviceRegistry& operator=(DeviceRegistry&&) = delete;

private:
    std::vector<DeviceDescriptor> devices_;
    mutable std::mutex registry_mutex;
};

} // namespace punchsync
