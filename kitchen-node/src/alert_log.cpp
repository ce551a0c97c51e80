#include "alert_log.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace kitchen {

namespace {
// Existing day file as a JSON array. Missing or corrupt files read as empty.
nlohmann::json read_day(const std::string& path) {
    std::ifstream f(path);
    if (!f) return nlohmann::json::array();
    nlohmann::json logs = nlohmann::json::parse(f, nullptr, false);
    if (logs.is_discarded() || !logs.is_array()) {
        std::cerr << "[WARN] Alert log is not a JSON array, starting a new one: " << path << std::endl;
        return nlohmann::json::array();
    }
    return logs;
}
}  // namespace

AlertLog::AlertLog(const std::string& dir) : dir_(dir) {}

std::string AlertLog::path_for(Clock::time_point day) const {
    const std::tm tm = local_time(day);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y%m%d", &tm);
    return (std::filesystem::path(dir_) / ("alerts_" + std::string(buf) + ".json")).string();
}

void AlertLog::append(const std::vector<Alert>& alerts, Clock::time_point now) {
    if (alerts.empty()) return;

    std::lock_guard<std::mutex> lock(mu_);
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        std::cerr << "[WARN] Unable to create alert log directory " << dir_ << ": " << ec.message() << std::endl;
    }

    const std::string path = path_for(now);
    nlohmann::json logs = read_day(path);
    for (const auto& a : alerts) logs.push_back(to_json(a));

    std::ofstream f(path, std::ios::trunc);
    if (!f) {
        std::cerr << "[WARN] Unable to open alerts file: " << path << std::endl;
        return;
    }
    f << logs.dump(2) << '\n';
}

AlertSummary AlertLog::summary(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mu_);
    AlertSummary s;
    const nlohmann::json logs = read_day(path_for(now));
    for (const auto& entry : logs) {
        if (!entry.is_object()) continue;
        s.total++;
        s.by_type[entry.value("type", std::string("UNKNOWN"))]++;
        s.by_severity[entry.value("severity", std::string("UNKNOWN"))]++;
    }
    return s;
}

}  // namespace kitchen
