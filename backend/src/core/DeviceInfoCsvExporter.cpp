#include "core/DeviceInfoCsvExporter.hpp"
#include "core/UserCsvExporter.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace punchsync {

std::string DeviceInfoCsvExporter::default_path(const std::string& export_dir) {
    return (std::filesystem::path(export_dir) / kDefaultFileName).string();
}

void DeviceInfoCsvExporter::write(const std::vector<DeviceSnapshot>& snapshots, std::ostream& out) {
    const auto esc = &UserCsvExporter::escape_field;
    out << "ip,name,location,status,date_installed,date_expired,notes,error,"
           "Device Time,Clock Drift,Firmware Version,Platform,Device Name,Serial Number,MAC,"
           "IP Address,Subnet Mask,Gateway,Pin Width\r\n";
    for (const auto& s : snapshots) {
        const auto& d = s.device;
        out << esc(d.ip) << ',' << esc(d.name) << ',' << esc(d.location) << ',' << esc(d.status) << ','
            << esc(d.date_installed) << ',' << esc(d.date_expired) << ',' << esc(d.notes) << ','
            << esc(s.error ? s.error->message : std::string()) << ',';
        if (s.error) {
            out << ",,,,,,,,,,\r\n";
            continue;
        }
        const auto& i = s.info;
        out << esc(s.device_time) << ','
            << (s.drift_seconds ? std::to_string(*s.drift_seconds) : std::string()) << ','
            << esc(i.firmware_version) << ',' << esc(i.platform) << ',' << esc(i.device_name) << ','
            << esc(i.serial_number) << ',' << esc(i.mac) << ',' << esc(i.ip_address) << ','
            << esc(i.netmask) << ',' << esc(i.gateway) << ',' << i.pin_width << "\r\n";
    }
}

void DeviceInfoCsvExporter::write_file(const std::vector<DeviceSnapshot>& snapshots, const std::string& path) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) throw std::runtime_error("cannot create export directory " + p.parent_path().string() + ": " + ec.message());
    }
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("cannot open export file " + path);
    write(snapshots, f);
    f.flush();
    if (!f) throw std::runtime_error("failed writing export file " + path);
}

} // namespace punchsync
