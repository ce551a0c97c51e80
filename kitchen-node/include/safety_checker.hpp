#pragma once

#include <chrono>
#include <ctime>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "alert.hpp"
#include "config.hpp"
#include "frame_types.hpp"

namespace kitchen {

using Clock = std::chrono::system_clock;

// Last emission instant per alert type. Only evaluate() touches it.
class CooldownState {
public:
    // True if `type` may be emitted at `now`; records the emission when it is.
    bool should_emit(AlertType type, Clock::time_point now, std::chrono::duration<double> cooldown);
    std::size_t size() const { return last_emitted_.size(); }

private:
    std::map<AlertType, Clock::time_point> last_emitted_;
};

// Broken-down local time. localtime_s on Windows, localtime_r elsewhere.
std::tm local_time(Clock::time_point t);

// ISO-8601 local time with microseconds.
std::string format_timestamp(Clock::time_point t);

// Runs every hazard rule in priority order: fire/smoke, pan overheating,
// stove unattended, knife unattended. Unstamped, no cooldown.
std::vector<Alert> run_rules(const DetectionBatch& detections,
                             const ClassificationBatch& classifications,
                             const SafetyConfig& cfg);

/*
 * Evaluates one frame: runs the rules, stamps timestamp and frame number,
 * then drops alerts whose type is still cooling down. Pass a null
 * `cooldown` to disable suppression. Throws InputError if the batch breaks
 * the detection invariants; no partial result is produced in that case.
 */
std::vector<Alert> evaluate(const DetectionBatch& detections,
                            const ClassificationBatch& classifications,
                            const SafetyConfig& cfg,
                            CooldownState* cooldown,
                            Clock::time_point now);

// Long-lived orchestrator. Owns the cooldown state and serializes callers
// so that at most one emission per alert type happens per cooldown window.
class SafetyMonitor {
public:
    explicit SafetyMonitor(const SafetyConfig& cfg, bool cooldown_enabled = true);

    std::vector<Alert> evaluate(const DetectionBatch& detections,
                                const ClassificationBatch& classifications,
                                Clock::time_point now = Clock::now());

    const SafetyConfig& config() const { return cfg_; }
    bool cooldown_enabled() const { return cooldown_enabled_; }
    std::vector<Alert> history() const;

private:
    SafetyConfig cfg_;
    bool cooldown_enabled_{true};
    CooldownState cooldown_;
    std::vector<Alert> history_;
    mutable std::mutex mu_;
};

}  // namespace kitchen
