#include "console_notifier.hpp"

#include <string>

namespace kitchen {

namespace {
const char* kReset = "\033[0m";

const char* color_for(Severity s) {
    switch (s) {
        case Severity::CRITICAL: return "\033[91m";
        case Severity::HIGH:
        case Severity::MEDIUM: return "\033[93m";
        default: return "\033[94m";
    }
}

std::string value_text(const nlohmann::json& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
}
}  // namespace

ConsoleNotifier::ConsoleNotifier(std::ostream& out, bool audio_enabled)
    : out_(out), audio_enabled_(audio_enabled) {}

int ConsoleNotifier::bell_count(Severity severity) {
    switch (severity) {
        case Severity::CRITICAL: return 3;
        case Severity::HIGH:
        case Severity::MEDIUM: return 2;
        default: return 1;
    }
}

void ConsoleNotifier::notify(const std::vector<Alert>& alerts) {
    if (alerts.empty()) {
        out_ << "\n[OK] No hazards detected. Kitchen is safe!\n";
        return;
    }
    out_ << "\n[!] SAFETY ALERT: " << alerts.size() << " hazard(s) detected!\n";
    for (const auto& a : alerts) {
        print_alert(a);
        if (audio_enabled_) ring(a.severity);
    }
    out_.flush();
}

void ConsoleNotifier::print_alert(const Alert& alert) {
    const char* color = color_for(alert.severity);
    const std::string rule(70, '=');
    out_ << '\n' << color << rule << kReset << '\n';
    out_ << color << '[' << severity_to_string(alert.severity) << "] " << alert_type_to_string(alert.type) << kReset << '\n';
    out_ << color << alert.message << kReset << '\n';
    out_ << color << "Time: " << (alert.timestamp.empty() ? "N/A" : alert.timestamp) << kReset << '\n';
    out_ << color << "Frame: " << (alert.frame_number ? std::to_string(*alert.frame_number) : "unknown") << kReset << '\n';
    if (!alert.details.empty()) {
        out_ << color << "Details:" << kReset << '\n';
        for (auto it = alert.details.begin(); it != alert.details.end(); ++it) {
            out_ << "  - " << it.key() << ": " << value_text(it.value()) << '\n';
        }
    }
    out_ << color << rule << kReset << '\n';
}

void ConsoleNotifier::print_status(const KitchenStatus& status) {
    out_ << "[STATUS] " << status.status << " (" << status.color << ", " << status.alert_count
         << " alert(s)): " << status.message << '\n';
}

void ConsoleNotifier::print_summary(const AlertSummary& summary) {
    const std::string rule(60, '=');
    out_ << '\n' << rule << '\n' << "[SUMMARY] DAILY ALERT SUMMARY\n" << rule << '\n';
    out_ << "Total Alerts Today: " << summary.total << '\n';
    if (summary.total > 0) {
        out_ << "\nBy Type:\n";
        for (const auto& kv : summary.by_type) out_ << "  - " << kv.first << ": " << kv.second << '\n';
        out_ << "\nBy Severity:\n";
        for (const auto& kv : summary.by_severity) out_ << "  - " << kv.first << ": " << kv.second << '\n';
    } else {
        out_ << "[OK] No alerts today - Kitchen has been safe!\n";
    }
    out_ << rule << '\n';
}

void ConsoleNotifier::ring(Severity severity) {
    for (int i = 0; i < bell_count(severity); ++i) out_ << '\a';
    out_.flush();
}

}  // namespace kitchen
