#include "DeviceRegistry.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/RecordNormalizer.hpp"

#include <fstream>

using json = nlohmann::json;

namespace punchsync {

static std::string text_field(const json& entry, const char* key) {
    auto it = entry.find(key);
    if (it == entry.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

static std::optional<int> int_field(const json& entry, const char* key) {
    auto it = entry.find(key);
    if (it == entry.end() || it->is_null()) return std::nullopt;
    if (it->is_string() && RecordNormalizer::trim(it->get<std::string>()).empty()) return std::nullopt;
    return static_cast<int>(RecordNormalizer::coerce_int(*it));
}

static DeviceDescriptor parse_entry(const json& entry, std::size_t index) {
    if (!entry.is_object()) {
        throw RegistryError(errors::format_E3100_registry_unavailable(
            std::string(errors::D3100_ENTRY_NOT_OBJECT) + " (#" + std::to_string(index) + ")"));
    }
    DeviceDescriptor d;
    d.ip = RecordNormalizer::trim(text_field(entry, "ip"));
    if (d.ip.empty()) {
        throw RegistryError(errors::format_E3100_registry_unavailable(
            std::string(errors::D3100_ENTRY_MISSING_IP) + " (#" + std::to_string(index) + ")"));
    }
    d.name = text_field(entry, "name");
    d.location = text_field(entry, "location");
    d.status = text_field(entry, "status");
    d.date_installed = text_field(entry, "date_installed");
    d.date_expired = text_field(entry, "date_expired");
    d.notes = text_field(entry, "notes");
    d.port = int_field(entry, "port");
    d.password = int_field(entry, "password");
    return d;
}

DeviceRegistry::DeviceRegistry() {}

DeviceRegistry::DeviceRegistry(DeviceRegistry&& other) noexcept {
    std::lock_guard<std::mutex> lock(other.registry_mutex);
    devices_ = std::move(other.devices_);
}

DeviceRegistry DeviceRegistry::load_from_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw RegistryError(errors::format_E3100_registry_unavailable(
            std::string(errors::D3100_OPEN_FAILED) + ": " + path));
    }
    json doc;
    try {
        doc = json::parse(f);
    } catch (const json::parse_error& e) {
        throw RegistryError(errors::format_E3100_registry_unavailable(
            std::string(errors::D3100_PARSE_FAILED) + ": " + e.what()));
    }
    return load_from_json(doc);
}

DeviceRegistry DeviceRegistry::load_from_json(const json& doc) {
    const json* list = nullptr;
    if (doc.is_array()) {
        list = &doc;
    } else if (doc.is_object() && doc.contains("devices") && doc["devices"].is_array()) {
        list = &doc["devices"];
    } else {
        throw RegistryError(errors::format_E3100_registry_unavailable(errors::D3100_NO_DEVICE_LIST));
    }

    DeviceRegistry registry;
    std::size_t index = 0;
    for (const auto& entry : *list) {
        registry.register_device(parse_entry(entry, index++));
    }
    return registry;
}

void DeviceRegistry::register_device(DeviceDescriptor device) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    for (const auto& d : devices_) {
        if (d.ip == device.ip) {
            throw RegistryError(errors::format_E3100_registry_unavailable(
                std::string(errors::D3100_DUPLICATE_IP) + ": " + device.ip));
        }
    }
    devices_.push_back(std::move(device));
}

void DeviceRegistry::for_each_device(const std::function<void(const DeviceDescriptor&)>& fn) const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    for (const auto& d : devices_) fn(d);
}

std::optional<DeviceDescriptor> DeviceRegistry::get_device(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    for (const auto& d : devices_) {
        if (d.ip == ip) return d;
    }
    return std::nullopt;
}

std::vector<DeviceDescriptor> DeviceRegistry::devices() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return devices_;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return devices_.size();
}

json DeviceRegistry::get_descriptor_graph() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    json graph = json::array();
    for (const auto& d : devices_) graph.push_back(d);
    return graph;
}

} // namespace punchsync
