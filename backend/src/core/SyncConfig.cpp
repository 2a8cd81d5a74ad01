#include "core/SyncConfig.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace punchsync {

static std::filesystem::path find_repo_root() {
    // Heuristic: walk up a few levels looking for shared/config.
    std::error_code ec;
    auto p = std::filesystem::current_path(ec);
    if (ec) return {};
    const auto start = p;
    for (int i = 0; i < 6; ++i) {
        auto candidate = p / "shared" / "config";
        if (std::filesystem::is_directory(candidate, ec)) return p;
        if (!p.has_parent_path() || p.parent_path() == p) break;
        p = p.parent_path();
    }
    return start;
}

static std::string env_or(const char* name, const std::string& fallback) {
    const char* env = std::getenv(name);
    if (env && *env) return std::string(env);
    return fallback;
}

SyncConfig SyncConfig::from_env() {
    SyncConfig c;
    c.devices_path = env_or("PUNCHSYNC_DEVICES_FILE", (find_repo_root() / "shared" / "config" / "devices.json").string());
    c.db_path = env_or("PUNCHSYNC_DB_PATH", "zkteco.db");
    c.export_dir = env_or("PUNCHSYNC_EXPORT_DIR", "Output");
    return c;
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = nlohmann::json{
        {"devices_path", c.devices_path},
        {"db_path", c.db_path},
        {"export_dir", c.export_dir},
        {"port", c.connect.port},
        {"timeout_s", c.connect.timeout.count()},
        {"chunk_size", c.chunk_size},
    };
}

} // namespace punchsync
