#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "alert_log.hpp"
#include "batch_parser.hpp"
#include "config.hpp"
#include "console_notifier.hpp"
#include "errors.hpp"
#include "frame_buffer.hpp"
#include "frame_watcher.hpp"
#include "safety_checker.hpp"

namespace {

kitchen::FrameWatcher* g_watcher = nullptr;

void handle_signal(int) {
    if (g_watcher) g_watcher->request_stop();
}

struct Sinks {
    kitchen::ConsoleNotifier console;
    std::unique_ptr<kitchen::AlertLog> log;
};

void process_frame(kitchen::SafetyMonitor& monitor, Sinks& sinks, const kitchen::AppConfig& cfg,
                   const std::string& detections_path, const std::string& classifications_path) {
    // Both documents are parsed before any rule runs.
    kitchen::DetectionBatch dets = kitchen::load_detection_batch(detections_path);
    kitchen::ClassificationBatch cls = kitchen::load_classification_batch(classifications_path);

    auto alerts = monitor.evaluate(dets, cls);
    sinks.console.notify(alerts);
    if (sinks.log) sinks.log->append(alerts);
    if (cfg.print_status) sinks.console.print_status(kitchen::overall_status(alerts));
}

int run_watch(kitchen::SafetyMonitor& monitor, Sinks& sinks, const kitchen::AppConfig& cfg) {
    kitchen::FrameBuffer<kitchen::FramePair> buffer(4);
    kitchen::FrameWatcher watcher(cfg.watch_dir, buffer, cfg.poll_ms);
    g_watcher = &watcher;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::cout << "[INFO] Watching " << cfg.watch_dir << " every " << cfg.poll_ms << " ms (Ctrl+C to stop)\n";
    watcher.start();

    kitchen::FramePair pair;
    size_t frames = 0;
    while (buffer.pop(pair)) {
        try {
            process_frame(monitor, sinks, cfg, pair.detections_path, pair.classifications_path);
            frames++;
        } catch (const kitchen::InputError& e) {
            if (watcher.retry(pair)) {
                std::cerr << "[WARN] Frame " << pair.stem << " not readable yet, will retry: " << e.what() << std::endl;
            } else {
                std::cerr << "[WARN] Skipping frame " << pair.stem << " after "
                          << kitchen::FrameWatcher::kMaxRetries << " retries: " << e.what() << std::endl;
            }
        }
    }

    watcher.stop();
    g_watcher = nullptr;
    std::cout << "[INFO] Stopped monitoring after " << frames << " frame(s)\n";
    if (sinks.log) sinks.console.print_summary(sinks.log->summary());
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    kitchen::AppConfig cfg = kitchen::parse_args(argc, argv);

    try {
        kitchen::SafetyConfig safety;
        if (!cfg.config_path.empty()) {
            safety = kitchen::load_safety_config(cfg.config_path);
        }

        kitchen::SafetyMonitor monitor(safety, cfg.cooldown_enabled);
        const kitchen::SafetyConfig& active = monitor.config();

        std::cout << "[INFO] Kitchen guard initialized\n";
        std::cout << "       safe distance : " << active.safe_distance_threshold << "px\n";
        std::cout << "       confidence    : " << active.confidence_threshold << "\n";
        std::cout << "       cooldown      : ";
        if (monitor.cooldown_enabled()) {
            std::cout << active.alert_cooldown.count() << "s\n";
        } else {
            std::cout << "disabled\n";
        }
        std::cout << "       knife distance: " << active.knife_danger_distance << "px\n";

        Sinks sinks{kitchen::ConsoleNotifier(std::cout, cfg.audio_enabled), nullptr};
        if (cfg.logging_enabled) sinks.log = std::make_unique<kitchen::AlertLog>(cfg.log_dir);

        if (!cfg.watch_dir.empty()) {
            return run_watch(monitor, sinks, cfg);
        }

        if (cfg.detections_path.empty() || cfg.classifications_path.empty()) {
            std::cerr << "[ERROR] --detections and --classifications are required (or use --watch <dir>)\n";
            return 2;
        }

        process_frame(monitor, sinks, cfg, cfg.detections_path, cfg.classifications_path);
        if (sinks.log) {
            std::cout << "\n[LOG] Alerts logged to: " << sinks.log->dir() << "\n";
            if (cfg.print_summary) sinks.console.print_summary(sinks.log->summary());
        }
    } catch (const kitchen::InputError& e) {
        std::cerr << "[ERROR] Malformed input batch: " << e.what() << std::endl;
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
