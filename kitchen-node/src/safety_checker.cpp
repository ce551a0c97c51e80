#include "safety_checker.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

#include "batch_parser.hpp"
#include "hazard_rules.hpp"

namespace kitchen {

bool CooldownState::should_emit(AlertType type, Clock::time_point now, std::chrono::duration<double> cooldown) {
    auto it = last_emitted_.find(type);
    if (it != last_emitted_.end()) {
        const std::chrono::duration<double> elapsed = now - it->second;
        if (elapsed < cooldown) return false;
    }
    last_emitted_[type] = now;
    return true;
}

std::tm local_time(Clock::time_point t) {
    const std::time_t secs = Clock::to_time_t(t);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &secs);
#else
    localtime_r(&secs, &tm);
#endif
    return tm;
}

std::string format_timestamp(Clock::time_point t) {
    const std::tm tm = local_time(t);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count() % 1000000;

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0')
        << (micros < 0 ? micros + 1000000 : micros);
    return oss.str();
}

std::vector<Alert> run_rules(const DetectionBatch& detections,
                             const ClassificationBatch& classifications,
                             const SafetyConfig& cfg) {
    const auto& dets = detections.detections;
    const auto& cls = classifications.classifications;

    std::vector<Alert> alerts;
    if (auto a = check_fire_smoke(dets, cfg)) alerts.push_back(std::move(*a));
    if (auto a = check_pan_overheating(dets, cls, cfg)) alerts.push_back(std::move(*a));
    if (auto a = check_stove_unattended(dets, cls, cfg)) alerts.push_back(std::move(*a));
    if (auto a = check_knife_unattended(dets, cls, cfg)) alerts.push_back(std::move(*a));
    return alerts;
}

std::vector<Alert> evaluate(const DetectionBatch& detections,
                            const ClassificationBatch& classifications,
                            const SafetyConfig& cfg,
                            CooldownState* cooldown,
                            Clock::time_point now) {
    validate_batch(detections);
    validate_batch(classifications);

    std::vector<Alert> alerts = run_rules(detections, classifications, cfg);

    const std::string stamp = format_timestamp(now);
    std::vector<Alert> emitted;
    emitted.reserve(alerts.size());
    for (auto& a : alerts) {
        a.timestamp = stamp;
        a.frame_number = detections.frame_number;
        if (cooldown && !cooldown->should_emit(a.type, now, cfg.alert_cooldown)) continue;
        emitted.push_back(std::move(a));
    }
    return emitted;
}

SafetyMonitor::SafetyMonitor(const SafetyConfig& cfg, bool cooldown_enabled)
    : cfg_(cfg), cooldown_enabled_(cooldown_enabled) {
    validate(cfg_);
}

std::vector<Alert> SafetyMonitor::evaluate(const DetectionBatch& detections,
                                           const ClassificationBatch& classifications,
                                           Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mu_);
    auto alerts = kitchen::evaluate(detections, classifications, cfg_,
                                    cooldown_enabled_ ? &cooldown_ : nullptr, now);
    history_.insert(history_.end(), alerts.begin(), alerts.end());
    return alerts;
}

std::vector<Alert> SafetyMonitor::history() const {
    std::lock_guard<std::mutex> lock(mu_);
    return history_;
}

}  // namespace kitchen
