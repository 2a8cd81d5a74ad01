#include "core/UserCsvExporter.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace punchsync {

std::string UserCsvExporter::default_path(const std::string& export_dir, const std::string& device_ip,
                                          std::chrono::system_clock::time_point now) {
    std::string ip = device_ip;
    std::replace(ip.begin(), ip.end(), '.', '_');

    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream name;
    name << "users_export_" << ip << "_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".csv";

    return (std::filesystem::path(export_dir) / name.str()).string();
}

std::string UserCsvExporter::escape_field(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void UserCsvExporter::write(const std::vector<UserRecord>& users, std::ostream& out) {
    out << "UID,Name,Privilege,Password,Group ID,User ID,Card\r\n";
    for (const auto& u : users) {
        out << u.uid << ','
            << escape_field(u.name) << ','
            << to_string(u.privilege) << ','
            << escape_field(u.password) << ','
            << escape_field(u.group_id) << ','
            << escape_field(u.user_id) << ','
            << (u.card != 0 ? std::to_string(u.card) : std::string()) << "\r\n";
    }
}

void UserCsvExporter::write_file(const std::vector<UserRecord>& users, const std::string& path) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) throw std::runtime_error("cannot create export directory " + p.parent_path().string() + ": " + ec.message());
    }
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("cannot open export file " + path);
    write(users, f);
    f.flush();
    if (!f) throw std::runtime_error("failed writing export file " + path);
}

} // namespace punchsync
