#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "core/FetchOrchestrator.hpp"

namespace punchsync {

// One row per registry device: descriptor columns, the error (if any),
// then what the terminal reported about itself.
class DeviceInfoCsvExporter {
public:
    static constexpr const char* kDefaultFileName = "devices_export.csv";

    static std::string default_path(const std::string& export_dir);

    static void write(const std::vector<DeviceSnapshot>& snapshots, std::ostream& out);

    // Creates parent directories. Throws std::runtime_error when the file cannot be written.
    static void write_file(const std::vector<DeviceSnapshot>& snapshots, const std::string& path);
};

} // namespace punchsync
