#pragma once

#include <chrono>
#include <ostream>
#include <string>
#include <vector>

#include "core/Records.hpp"

namespace punchsync {

class UserCsvExporter {
public:
    // <dir>/users_export_<ip with '.' as '_'>_<YYYYmmdd_HHMMSS>.csv (local time)
    static std::string default_path(const std::string& export_dir, const std::string& device_ip,
                                    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    static void write(const std::vector<UserRecord>& users, std::ostream& out);

    // Creates parent directories. Throws std::runtime_error when the file cannot be written.
    static void write_file(const std::vector<UserRecord>& users, const std::string& path);

    static std::string escape_field(const std::string& field);
};

} // namespace punchsync
