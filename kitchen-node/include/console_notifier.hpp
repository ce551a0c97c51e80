#pragma once

#include <iostream>
#include <ostream>
#include <vector>

#include "alert.hpp"
#include "alert_log.hpp"

namespace kitchen {

// Terminal rendering of alert batches: colored banners and a bell per alert.
class ConsoleNotifier {
public:
    explicit ConsoleNotifier(std::ostream& out = std::cout, bool audio_enabled = true);

    void notify(const std::vector<Alert>& alerts);
    void print_alert(const Alert& alert);
    void print_status(const KitchenStatus& status);
    void print_summary(const AlertSummary& summary);

    // Three bells for CRITICAL, two for HIGH/MEDIUM, one otherwise.
    static int bell_count(Severity severity);

private:
    void ring(Severity severity);

    std::ostream& out_;
    bool audio_enabled_{true};
};

}  // namespace kitchen
