#include <iostream>
#include <filesystem>
#include <fstream>
#include "DeviceRegistry.hpp"
#include "core/FetchOrchestrator.hpp"
#include "simulator/Simulator.hpp"
#include <nlohmann/json.hpp>

using nlohmann::json;
using namespace punchsync;

static std::string write_temp(const std::string& name, const json& j) {
    auto p = std::filesystem::temp_directory_path() / name;
    std::ofstream f(p);
    f << j.dump(2);
    f.close();
    return p.string();
}

int main() {
    std::cout << "Fleet CI-less tests starting...\n";
    try {
        json devices = {{"devices", json::array({
            {{"ip", "10.1.0.1"}, {"name", "Front"}},
            {{"ip", "10.1.0.2"}, {"name", "Dock"}},
            {{"ip", "10.1.0.3"}, {"name", "Yard"}},
        })}};
        json fixture = {{"devices", {
            {"10.1.0.1", {
                {"users", json::array({{{"uid", 1}, {"user_id", "1001"}, {"name", "Ann"}}})},
                {"attendance", json::array({
                    {{"uid", 1}, {"user_id", "1001"}, {"timestamp", "2024-03-01 08:00:00"}, {"status", 1}, {"punch", 0}},
                    {{"uid", 1}, {"user_id", "1001"}, {"timestamp", "2024-03-01 17:00:00"}, {"status", 1}, {"punch", 1}},
                })},
            }},
            {"10.1.0.2", {{"fail", {{"connect", "unreachable"}}}}},
            {"10.1.0.3", {
                {"users", json::array({{{"uid", 5}, {"user_id", "2005"}, {"name", "Eve"}}})},
                {"attendance", json::array({
                    {{"uid", 5}, {"user_id", "2005"}, {"timestamp", "2024-03-01 09:00:00"}, {"status", 1}, {"punch", 0}},
                })},
            }},
        }}};

        auto registry = DeviceRegistry::load_from_file(write_temp("fleet_citest_devices.json", devices));
        Simulator sim;
        if (!sim.load_from_fixture(write_temp("fleet_citest_sim.json", fixture))) {
            std::cerr << "Simulator failed to load fixture\n";
            return 2;
        }

        auto db = std::filesystem::temp_directory_path() / "fleet_citest.db";
        std::filesystem::remove(db);
        PersistenceStore store(db.string());
        store.ensure_schema();
        FetchOrchestrator orchestrator(sim, store);

        auto report = orchestrator.run_fleet(registry.devices(), SyncKind::Attendance);
        if (report.attempted != 3 || report.succeeded != 2 || report.failed_devices.size() != 1) {
            std::cerr << "Unexpected fleet report: " << json(report).dump() << "\n";
            return 3;
        }

        auto again = orchestrator.run_fleet(registry.devices(), SyncKind::Attendance);
        if (again.store.inserted != 0 || again.store.duplicates != 3 || store.count_attendance() != 3) {
            std::cerr << "Second run was not idempotent: " << json(again).dump() << "\n";
            return 4;
        }

        std::cout << "Fleet CI-less tests passed\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "exception: " << e.what() << std::endl;
        return 1;
    }
}
