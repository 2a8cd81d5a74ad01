#include <gtest/gtest.h>
#include "core/SyncConfig.hpp"

#include <cstdlib>
#include <string>

using namespace punchsync;

TEST(SyncConfig, EnvironmentOverridesDefaults) {
    ::setenv("PUNCHSYNC_DEVICES_FILE", "/etc/punchsync/devices.json", 1);
    ::setenv("PUNCHSYNC_DB_PATH", "/var/lib/punchsync/zk.db", 1);
    ::setenv("PUNCHSYNC_EXPORT_DIR", "/tmp/exports", 1);
    auto c = SyncConfig::from_env();
    ::unsetenv("PUNCHSYNC_DEVICES_FILE");
    ::unsetenv("PUNCHSYNC_DB_PATH");
    ::unsetenv("PUNCHSYNC_EXPORT_DIR");

    EXPECT_EQ(c.devices_path, "/etc/punchsync/devices.json");
    EXPECT_EQ(c.db_path, "/var/lib/punchsync/zk.db");
    EXPECT_EQ(c.export_dir, "/tmp/exports");
}

TEST(SyncConfig, Defaults) {
    ::unsetenv("PUNCHSYNC_DEVICES_FILE");
    ::unsetenv("PUNCHSYNC_DB_PATH");
    ::unsetenv("PUNCHSYNC_EXPORT_DIR");
    auto c = SyncConfig::from_env();

    EXPECT_EQ(c.db_path, "zkteco.db");
    EXPECT_EQ(c.export_dir, "Output");
    const std::string suffix = "shared/config/devices.json";
    ASSERT_GE(c.devices_path.size(), suffix.size());
    EXPECT_EQ(c.devices_path.substr(c.devices_path.size() - suffix.size()), suffix);
    EXPECT_EQ(c.connect.port, 4370);
    EXPECT_EQ(c.connect.timeout, std::chrono::seconds(30));
    EXPECT_EQ(c.chunk_size, PersistenceStore::kDefaultChunkSize);

    nlohmann::json j = c;
    EXPECT_EQ(j["port"], 4370);
}
