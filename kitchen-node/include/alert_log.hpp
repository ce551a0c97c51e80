#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "alert.hpp"
#include "safety_checker.hpp"

namespace kitchen {

struct AlertSummary {
    std::size_t total{0};
    std::map<std::string, std::size_t> by_type;
    std::map<std::string, std::size_t> by_severity;
};

// Append-only daily alert record: <dir>/alerts_YYYYMMDD.json holding one JSON
// array per calendar day.
class AlertLog {
public:
    explicit AlertLog(const std::string& dir);

    void append(const std::vector<Alert>& alerts, Clock::time_point now = Clock::now());
    AlertSummary summary(Clock::time_point now = Clock::now()) const;

    std::string path_for(Clock::time_point day) const;
    const std::string& dir() const { return dir_; }

private:
    std::string dir_;
    mutable std::mutex mu_;
};

}  // namespace kitchen
