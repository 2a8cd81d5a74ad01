#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "DeviceSession.hpp"
#include "core/PersistenceStore.hpp"

namespace punchsync {

struct SyncConfig {
    std::string devices_path;
    std::string db_path;
    std::string export_dir;
    ConnectOptions connect;
    std::size_t chunk_size = PersistenceStore::kDefaultChunkSize;

    // Defaults overridden by PUNCHSYNC_DEVICES_FILE, PUNCHSYNC_DB_PATH and PUNCHSYNC_EXPORT_DIR.
    static SyncConfig from_env();
};

void to_json(nlohmann::json& j, const SyncConfig& c);

} // namespace punchsync
