#include "DeviceRegistry.hpp"
#include "DeviceSession.hpp"
#include "core/BuildInfo.hpp"
#include "core/DeviceInfoCsvExporter.hpp"
#include "core/FetchOrchestrator.hpp"
#include "core/LiveCaptureConsumer.hpp"
#include "core/PersistenceStore.hpp"
#include "core/RecordNormalizer.hpp"
#include "core/SyncConfig.hpp"
#include "core/UserCsvExporter.hpp"
#include "devices/ZkSession.hpp"
#include "simulator/Simulator.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

namespace ps = punchsync;

enum class RunOutcome { Ok, UsageError, RegistryUnavailable, StoreUnavailable, DeviceFailures, ExportFailed };

enum class Command {
    None, List, ShowConfig, SyncUsers, SyncAttendance, ExportUsers, ExportDevices, Attendance, FindUsers,
    DeviceInfo, Live, SetUser, DeleteUser, Version, Help
};

struct CliOptions {
    ps::SyncConfig config;
    Command command = Command::None;
    std::string target_ip;
    std::string user_json;
    int64_t uid = 0;
    std::string sim_fixture;
    int64_t max_idle = 0;
    std::optional<std::string> user_id;
    std::optional<std::string> name;
    bool admins = false;
    bool save = false;
    bool set_time = false;
    bool json_output = false;
    std::string output_path;
};

static std::atomic<ps::CancellationToken*> g_live_cancel{nullptr};

extern "C" void on_sigint(int) {
    if (auto* cancel = g_live_cancel.load()) cancel->request_cancel();
}

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] <command>\n"
              << "Commands:\n"
              << "  --list                    Show the device registry\n"
              << "  --show-config             Print the effective configuration as JSON\n"
              << "  --sync-users              Pull user rosters from every device into the database\n"
              << "  --sync-attendance         Pull attendance logs from every device into the database\n"
              << "  --export-users IP         Write one device's users to CSV\n"
              << "  --export-devices          Write identity and clock of every device to CSV\n"
              << "  --attendance IP           Show one device's punches [--user-id X] [--save]\n"
              << "  --find-users IP           Look up users by --user-id X, --name TEXT or --admins\n"
              << "  --device-info IP          Show device identity and clock drift [--set-time]\n"
              << "  --live IP                 Stream punches from one device (q + Enter or Ctrl-C to stop)\n"
              << "  --set-user IP JSON        Create/overwrite a user, e.g. '{\"uid\":5,\"name\":\"Ann\",\"user_id\":\"5\"}'\n"
              << "  --delete-user IP UID      Remove a user from a device\n"
              << "  --version                 Print build information\n"
              << "Options:\n"
              << "  -h, --help                Show this help message and exit\n"
              << "  -d, --devices FILE        Device registry JSON (env PUNCHSYNC_DEVICES_FILE)\n"
              << "      --db FILE             SQLite database (env PUNCHSYNC_DB_PATH, default zkteco.db)\n"
              << "      --export-dir DIR      CSV output directory (env PUNCHSYNC_EXPORT_DIR, default Output)\n"
              << "  -s, --sim FIXTURE         Use simulated devices from a fixture instead of the network\n"
              << "  -p, --port PORT           Device TCP port (default 4370)\n"
              << "  -T, --timeout SEC         Device timeout in seconds (default 30)\n"
              << "  -P, --password N          Device comm password (default 0)\n"
              << "      --max-idle N          Stop live capture after N consecutive timeouts\n"
              << "      --user-id X           User ID filter for --attendance and --find-users\n"
              << "      --name TEXT           Case-insensitive name fragment for --find-users\n"
              << "      --admins              Only administrators for --find-users\n"
              << "      --save                Store the punches shown by --attendance\n"
              << "      --set-time            Set the device clock to host time before --device-info\n"
              << "  -o, --output FILE         CSV path for --export-devices (default <export-dir>/devices_export.csv)\n"
              << "      --json                JSON output for --live, --find-users and --device-info\n"
              << std::flush;
}

static bool parse_integer(const std::string& text, int64_t& out) {
    try {
        std::size_t pos = 0;
        long long v = std::stoll(text, &pos, 10);
        if (pos != text.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static std::optional<CliOptions> parse_args(int argc, char** argv) {
    CliOptions opts;
    opts.config = ps::SyncConfig::from_env();

    auto set_command = [&](Command c) {
        if (opts.command != Command::None && opts.command != c) {
            std::cerr << "Only one command may be given" << std::endl;
            return false;
        }
        opts.command = c;
        return true;
    };
    auto value = [&](int& i, const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            std::cerr << flag << " requires a value" << std::endl;
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "-h" || a == "--help") {
            opts.command = Command::Help;
            return opts;
        }
        if (a == "--version") {
            if (!set_command(Command::Version)) return std::nullopt;
        } else if (a == "--list") {
            if (!set_command(Command::List)) return std::nullopt;
        } else if (a == "--sync-users") {
            if (!set_command(Command::SyncUsers)) return std::nullopt;
        } else if (a == "--sync-attendance") {
            if (!set_command(Command::SyncAttendance)) return std::nullopt;
        } else if (a == "--show-config") {
            if (!set_command(Command::ShowConfig)) return std::nullopt;
        } else if (a == "--export-devices") {
            if (!set_command(Command::ExportDevices)) return std::nullopt;
        } else if (a == "--export-users" || a == "--live" || a == "--set-user" || a == "--delete-user" ||
                   a == "--attendance" || a == "--find-users" || a == "--device-info") {
            Command c = a == "--export-users" ? Command::ExportUsers
                      : a == "--live" ? Command::Live
                      : a == "--set-user" ? Command::SetUser
                      : a == "--attendance" ? Command::Attendance
                      : a == "--find-users" ? Command::FindUsers
                      : a == "--device-info" ? Command::DeviceInfo
                      : Command::DeleteUser;
            if (!set_command(c)) return std::nullopt;
            auto ip = value(i, a);
            if (!ip) return std::nullopt;
            opts.target_ip = *ip;
            if (c == Command::SetUser) {
                auto body = value(i, a);
                if (!body) return std::nullopt;
                opts.user_json = *body;
            } else if (c == Command::DeleteUser) {
                auto uid = value(i, a);
                if (!uid || !parse_integer(*uid, opts.uid)) {
                    std::cerr << "--delete-user needs an integer UID" << std::endl;
                    return std::nullopt;
                }
            }
        } else if (a == "--user-id" || a == "--name" || a == "-o" || a == "--output") {
            auto v = value(i, a);
            if (!v) return std::nullopt;
            if (a == "--user-id") opts.user_id = *v;
            else if (a == "--name") opts.name = *v;
            else opts.output_path = *v;
        } else if (a == "--admins") {
            opts.admins = true;
        } else if (a == "--save") {
            opts.save = true;
        } else if (a == "--set-time") {
            opts.set_time = true;
        } else if (a == "--json") {
            opts.json_output = true;
        } else if (a == "-d" || a == "--devices") {
            auto v = value(i, a);
            if (!v) return std::nullopt;
            opts.config.devices_path = *v;
        } else if (a == "--db") {
            auto v = value(i, a);
            if (!v) return std::nullopt;
            opts.config.db_path = *v;
        } else if (a == "--export-dir") {
            auto v = value(i, a);
            if (!v) return std::nullopt;
            opts.config.export_dir = *v;
        } else if (a == "-s" || a == "--sim") {
            auto v = value(i, a);
            if (!v) return std::nullopt;
            opts.sim_fixture = *v;
        } else if (a == "-p" || a == "--port" || a == "-T" || a == "--timeout" || a == "-P" ||
                   a == "--password" || a == "--max-idle") {
            auto v = value(i, a);
            int64_t n = 0;
            if (!v || !parse_integer(*v, n) || n < 0) {
                std::cerr << a << " needs a non-negative integer" << std::endl;
                return std::nullopt;
            }
            if (a == "-p" || a == "--port") opts.config.connect.port = static_cast<int>(n);
            else if (a == "-T" || a == "--timeout") opts.config.connect.timeout = std::chrono::seconds(n);
            else if (a == "-P" || a == "--password") opts.config.connect.password = static_cast<int>(n);
            else opts.max_idle = n;
        } else {
            std::cerr << "Unknown argument: " << a << std::endl;
            return std::nullopt;
        }
    }

    if (opts.command == Command::FindUsers) {
        const int selectors = (opts.user_id ? 1 : 0) + (opts.name ? 1 : 0) + (opts.admins ? 1 : 0);
        if (selectors != 1) {
            std::cerr << "--find-users needs exactly one of --user-id, --name or --admins" << std::endl;
            return std::nullopt;
        }
        if ((opts.user_id && opts.user_id->empty()) || (opts.name && opts.name->empty())) {
            std::cerr << "--find-users needs a non-empty search value" << std::endl;
            return std::nullopt;
        }
    }
    return opts;
}

// Host wall clock in the devices' "YYYY-MM-DD HH:MM:SS" form.
static std::string local_timestamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

static void print_users(const std::vector<ps::UserRecord>& users) {
    std::cout << std::left << std::setw(6) << "UID" << std::setw(24) << "Name" << std::setw(10) << "Privilege"
              << std::setw(10) << "Group" << std::setw(12) << "User ID" << "Card" << "\n";
    for (const auto& u : users) {
        std::cout << std::left << std::setw(6) << u.uid << std::setw(24) << u.name << std::setw(10)
                  << ps::to_string(u.privilege) << std::setw(10) << u.group_id << std::setw(12) << u.user_id
                  << (u.card ? std::to_string(u.card) : std::string()) << "\n";
    }
    std::cout << users.size() << " users" << std::endl;
}

static void print_attendance(const std::vector<ps::PersistedAttendanceRow>& rows) {
    std::cout << std::left << std::setw(6) << "UID" << std::setw(12) << "User ID" << std::setw(24) << "Name"
              << std::setw(21) << "Timestamp" << std::setw(11) << "Status" << "Punch" << "\n";
    for (const auto& r : rows) {
        std::cout << std::left << std::setw(6) << r.uid << std::setw(12) << r.user_id << std::setw(24)
                  << (r.name.empty() ? "-" : r.name) << std::setw(21) << r.timestamp << std::setw(11)
                  << ps::to_string(ps::punch_status_from_code(r.status)) << r.punch << "\n";
    }
    std::cout << std::flush;
}

static void print_snapshot(const ps::DeviceSnapshot& snap) {
    const auto& i = snap.info;
    const std::pair<const char*, std::string> rows[] = {
        {"Device Time", snap.device_time},
        {"Clock Drift", snap.drift_seconds ? std::to_string(*snap.drift_seconds) + "s" : std::string("unknown")},
        {"Firmware Version", i.firmware_version},
        {"Platform", i.platform},
        {"Device Name", i.device_name},
        {"Serial Number", i.serial_number},
        {"MAC", i.mac},
        {"IP Address", i.ip_address},
        {"Subnet Mask", i.netmask},
        {"Gateway", i.gateway},
        {"Pin Width", std::to_string(i.pin_width)},
    };
    std::cout << "==== " << snap.device.label() << " ====\n";
    for (const auto& row : rows) std::cout << std::left << std::setw(18) << row.first << row.second << "\n";
    if (snap.clock_set) std::cout << "Device clock was set to host time\n";
    if (snap.clock_out_of_sync()) {
        std::cout << "WRN: device clock is out of sync with this host; use --set-time to update\n";
    }
    std::cout << std::flush;
}

static void print_report(const ps::FleetReport& report) {
    std::cout << "\n==== " << ps::to_string(report.kind) << " sync: " << report.succeeded << "/"
              << report.attempted << " devices succeeded ====\n"
              << "records fetched: " << report.total_records << "\n"
              << "inserted: " << report.store.inserted << ", replaced: " << report.store.replaced
              << ", already stored: " << report.store.duplicates
              << ", skipped: " << report.store.skipped << ", errors: " << report.store.errors << "\n";
    if (!report.failed_devices.empty()) {
        std::cout << "failed devices:\n";
        for (const auto& f : report.failed_devices) {
            std::cout << "  - " << f.name << " (" << f.ip << "): " << f.error.message << "\n";
        }
    }
    std::cout << std::flush;
}

static ps::DeviceDescriptor resolve_target(const ps::DeviceRegistry& registry, const std::string& ip) {
    if (auto d = registry.get_device(ip)) return *d;
    // Devices outside the registry can still be addressed by IP.
    ps::DeviceDescriptor d;
    d.ip = ip;
    d.name = ip;
    return d;
}

static RunOutcome run_live(ps::FetchOrchestrator& orchestrator, const ps::DeviceDescriptor& device,
                           const CliOptions& opts) {
    ps::CancellationToken cancel;
    g_live_cancel.store(&cancel);
    auto previous = std::signal(SIGINT, on_sigint);

    // Only watch stdin when it is a TTY; detached runs rely on Ctrl-C or --max-idle.
    std::optional<ps::QuitKeyWatcher> quit_key;
    if (isatty(STDIN_FILENO)) quit_key.emplace(STDIN_FILENO, cancel);

    std::cout << "Live capture on " << device.label() << " (q + Enter to stop)" << std::endl;
    const bool as_json = opts.json_output;
    auto result = orchestrator.capture_live(device, cancel, [as_json](const ps::CapturedEvent& e) {
        if (as_json) {
            std::cout << nlohmann::json(e).dump() << std::endl;
            return;
        }
        std::cout << "[" << e.sequence << "] " << e.event.timestamp << "  " << std::left << std::setw(10)
                  << e.event.user_id << std::setw(24) << (e.name.empty() ? "-" : e.name)
                  << ps::to_string(ps::punch_status_from_code(e.event.status)) << std::endl;
    }, opts.config.connect.timeout, opts.max_idle);

    quit_key.reset();
    std::signal(SIGINT, previous);
    g_live_cancel.store(nullptr);

    if (result.error) {
        std::cerr << "Live capture failed: " << result.error->message << std::endl;
        return RunOutcome::DeviceFailures;
    }
    const auto& s = result.summary;
    std::cout << "Capture ended (" << ps::to_string(s.end) << "): " << s.events << " events, " << s.timeouts
              << " timeouts, " << s.skipped << " skipped, " << s.errored << " rejected" << std::endl;
    return s.end == ps::CaptureEnd::StreamError ? RunOutcome::DeviceFailures : RunOutcome::Ok;
}

static RunOutcome run(const CliOptions& opts) {
    if (opts.command == Command::Version) {
        std::cout << "punchsync " << ps::buildinfo::version() << " (" << ps::buildinfo::git_commit() << ", built "
                  << ps::buildinfo::build_time_utc_approx() << ")" << std::endl;
        return RunOutcome::Ok;
    }

    if (opts.command == Command::ShowConfig) {
        std::cout << nlohmann::json(opts.config).dump(2) << std::endl;
        return RunOutcome::Ok;
    }

    std::optional<ps::DeviceRegistry> registry;
    try {
        registry.emplace(ps::DeviceRegistry::load_from_file(opts.config.devices_path));
    } catch (const ps::RegistryError& e) {
        std::cerr << e.what() << std::endl;
        return RunOutcome::RegistryUnavailable;
    }

    if (opts.command == Command::List) {
        std::cout << registry->get_descriptor_graph().dump(2) << std::endl;
        return RunOutcome::Ok;
    }

    std::unique_ptr<ps::DeviceConnector> connector;
    if (!opts.sim_fixture.empty()) {
        auto sim = std::make_unique<ps::Simulator>();
        if (!sim->load_from_fixture(opts.sim_fixture)) return RunOutcome::UsageError;
        connector = std::move(sim);
    } else {
        connector = std::make_unique<ps::ZkConnector>();
    }

    std::optional<ps::PersistenceStore> store;
    try {
        store.emplace(opts.config.db_path);
        store->ensure_schema();
    } catch (const ps::StoreError& e) {
        std::cerr << e.what() << std::endl;
        return RunOutcome::StoreUnavailable;
    }

    ps::FetchOrchestrator orchestrator(*connector, *store, opts.config.connect);
    orchestrator.set_chunk_size(opts.config.chunk_size);

    switch (opts.command) {
        case Command::SyncUsers:
        case Command::SyncAttendance: {
            auto kind = opts.command == Command::SyncUsers ? ps::SyncKind::Users : ps::SyncKind::Attendance;
            auto report = orchestrator.run_fleet(registry->devices(), kind);
            print_report(report);
            return report.failed_devices.empty() ? RunOutcome::Ok : RunOutcome::DeviceFailures;
        }
        case Command::ExportUsers: {
            auto device = resolve_target(*registry, opts.target_ip);
            auto result = orchestrator.fetch_users(device);
            if (!result.ok()) {
                std::cerr << "Export failed: " << result.error->message << std::endl;
                return RunOutcome::DeviceFailures;
            }
            auto path = ps::UserCsvExporter::default_path(opts.config.export_dir, device.ip);
            try {
                ps::UserCsvExporter::write_file(result.records, path);
            } catch (const std::runtime_error& e) {
                std::cerr << "Export failed: " << e.what() << std::endl;
                return RunOutcome::ExportFailed;
            }
            std::cout << "Exported " << result.records.size() << " users to " << path << std::endl;
            return RunOutcome::Ok;
        }
        case Command::ExportDevices: {
            std::vector<ps::DeviceSnapshot> snapshots;
            int failed = 0;
            for (const auto& device : registry->devices()) {
                snapshots.push_back(orchestrator.snapshot(device, local_timestamp()));
                if (!snapshots.back().ok()) {
                    ++failed;
                    std::cerr << "Device info failed for " << device.label() << ": "
                              << snapshots.back().error->message << std::endl;
                }
            }
            auto path = opts.output_path.empty() ? ps::DeviceInfoCsvExporter::default_path(opts.config.export_dir)
                                                 : opts.output_path;
            try {
                ps::DeviceInfoCsvExporter::write_file(snapshots, path);
            } catch (const std::runtime_error& e) {
                std::cerr << "Export failed: " << e.what() << std::endl;
                return RunOutcome::ExportFailed;
            }
            std::cout << "Exported " << snapshots.size() << " devices to " << path << std::endl;
            return failed == 0 ? RunOutcome::Ok : RunOutcome::DeviceFailures;
        }
        case Command::Attendance: {
            auto device = resolve_target(*registry, opts.target_ip);
            ps::AttendanceQuery query;
            query.user_id = opts.user_id;
            query.save = opts.save;
            auto view = orchestrator.view_attendance(device, query);
            if (!view.ok()) {
                std::cerr << "Attendance read failed: " << view.error->message << std::endl;
                return RunOutcome::DeviceFailures;
            }
            std::cout << "Total attendance records: " << view.fetched << std::endl;
            if (opts.user_id) std::cout << "--- Attendance for User ID " << *opts.user_id << " ---" << std::endl;
            if (view.rows.empty()) {
                std::cout << "No attendance records found." << std::endl;
            } else {
                print_attendance(view.rows);
            }
            if (view.saved) {
                std::cout << "Saved: " << view.saved->inserted << " new, " << view.saved->duplicates
                          << " already stored, " << view.saved->skipped << " skipped, " << view.saved->errors
                          << " errors" << std::endl;
            }
            return RunOutcome::Ok;
        }
        case Command::FindUsers: {
            auto device = resolve_target(*registry, opts.target_ip);
            auto query = opts.user_id ? ps::UserQuery::by_user_id(*opts.user_id)
                       : opts.name ? ps::UserQuery::by_name(*opts.name)
                       : ps::UserQuery::admins();
            auto result = orchestrator.find_users(device, query);
            if (!result.ok()) {
                std::cerr << "User lookup failed: " << result.error->message << std::endl;
                return RunOutcome::DeviceFailures;
            }
            if (opts.json_output) {
                std::cout << nlohmann::json(result.records).dump(2) << std::endl;
            } else if (result.records.empty()) {
                std::cout << "No users found with " << query.describe() << "." << std::endl;
            } else {
                std::cout << "Found " << result.records.size() << " result(s) with " << query.describe() << ":\n";
                print_users(result.records);
            }
            return RunOutcome::Ok;
        }
        case Command::DeviceInfo: {
            auto snap = orchestrator.snapshot(resolve_target(*registry, opts.target_ip), local_timestamp(),
                                              opts.set_time);
            if (!snap.ok()) {
                std::cerr << "Device info failed: " << snap.error->message << std::endl;
                return RunOutcome::DeviceFailures;
            }
            if (opts.json_output) {
                std::cout << nlohmann::json(snap).dump(2) << std::endl;
            } else {
                print_snapshot(snap);
            }
            return RunOutcome::Ok;
        }
        case Command::Live:
            return run_live(orchestrator, resolve_target(*registry, opts.target_ip), opts);
        case Command::SetUser:
        case Command::DeleteUser: {
            auto device = resolve_target(*registry, opts.target_ip);
            ps::SyncResult<ps::UserRecord> result;
            if (opts.command == Command::SetUser) {
                nlohmann::json body;
                try {
                    body = nlohmann::json::parse(opts.user_json);
                } catch (const nlohmann::json::parse_error& e) {
                    std::cerr << "--set-user: invalid JSON: " << e.what() << std::endl;
                    return RunOutcome::UsageError;
                }
                auto user = ps::RecordNormalizer::normalize_user(ps::UserRecordRaw::from_json(body));
                result = orchestrator.set_user(device, user);
            } else {
                result = orchestrator.delete_user(device, opts.uid);
            }
            if (!result.ok()) {
                std::cerr << "User command failed: " << result.error->message << std::endl;
                return RunOutcome::DeviceFailures;
            }
            print_users(result.records);
            return RunOutcome::Ok;
        }
        default:
            return RunOutcome::UsageError;
    }
}

static int exit_code(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::Ok: return 0;
        case RunOutcome::DeviceFailures: return 1;
        case RunOutcome::UsageError: return 2;
        case RunOutcome::RegistryUnavailable: return 3;
        case RunOutcome::StoreUnavailable: return 4;
        case RunOutcome::ExportFailed: return 5;
    }
    return 1;
}

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return exit_code(RunOutcome::UsageError);
    }
    if (opts->command == Command::Help) {
        print_usage(argv[0]);
        return 0;
    }
    if (opts->command == Command::None) {
        std::cerr << "No command given" << std::endl;
        print_usage(argv[0]);
        return exit_code(RunOutcome::UsageError);
    }
    return exit_code(run(*opts));
}
