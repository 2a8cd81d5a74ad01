#include <gtest/gtest.h>
#include "core/UserCsvExporter.hpp"
#include "test_support.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace punchsync;
using punchsync::testing_support::temp_path;

static std::vector<UserRecord> sample_users() {
    UserRecord ann;
    ann.uid = 1;
    ann.user_id = "1001";
    ann.name = "Ann";
    ann.privilege = Privilege::Admin;
    ann.password = "123";
    ann.group_id = "1";
    ann.card = 4455;

    UserRecord odd;
    odd.uid = 2;
    odd.user_id = "1002";
    odd.name = "Smith, \"Jo\"";
    return {ann, odd};
}

TEST(UserCsvExporter, WritesHeaderAndRows) {
    std::ostringstream out;
    UserCsvExporter::write(sample_users(), out);
    EXPECT_EQ(out.str(),
              "UID,Name,Privilege,Password,Group ID,User ID,Card\r\n"
              "1,Ann,Admin,123,1,1001,4455\r\n"
              "2,\"Smith, \"\"Jo\"\"\",User,,,1002,\r\n");
}

TEST(UserCsvExporter, EscapesOnlyWhenNeeded) {
    EXPECT_EQ(UserCsvExporter::escape_field("plain"), "plain");
    EXPECT_EQ(UserCsvExporter::escape_field("a,b"), "\"a,b\"");
    EXPECT_EQ(UserCsvExporter::escape_field("line\nbreak"), "\"line\nbreak\"");
}

TEST(UserCsvExporter, DefaultPathUsesIpAndLocalTime) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 2;
    tm.tm_mday = 15;
    tm.tm_hour = 8;
    tm.tm_min = 30;
    tm.tm_sec = 45;
    tm.tm_isdst = -1;
    auto when = std::chrono::system_clock::from_time_t(std::mktime(&tm));

    EXPECT_EQ(UserCsvExporter::default_path("Output", "192.168.1.201", when),
              "Output/users_export_192_168_1_201_20240315_083045.csv");
}

TEST(UserCsvExporter, WriteFileCreatesDirectories) {
    auto dir = temp_path("csv_export");
    auto path = (std::filesystem::path(dir) / "nested" / "users.csv").string();
    UserCsvExporter::write_file(sample_users(), path);

    std::ifstream f(path, std::ios::binary);
    ASSERT_TRUE(f.good());
    std::string header;
    std::getline(f, header);
    EXPECT_EQ(header, "UID,Name,Privilege,Password,Group ID,User ID,Card\r");
}
