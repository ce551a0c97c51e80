#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "frame_buffer.hpp"

namespace kitchen {

// One frame's worth of upstream output: <stem>.detections.json plus
// <stem>.classifications.json in the watched directory.
struct FramePair {
    std::string stem;
    std::string detections_path;
    std::string classifications_path;
};

// Polls a directory for complete frame pairs and feeds them, in stem order,
// to a FrameBuffer. A pair is handed out once both files have kept the same
// size and mtime across two consecutive polls, and then only once unless the
// consumer sends it back with retry().
class FrameWatcher {
public:
    static constexpr int kMaxRetries = 3;

    FrameWatcher(const std::string& dir, FrameBuffer<FramePair>& buffer, int poll_ms);
    ~FrameWatcher();

    void start();
    void stop();
    // Only flips the running flag, so it is safe from a signal handler.
    void request_stop() { running_ = false; }

    // One polling pass. Returns settled pairs not delivered before, sorted by stem.
    std::vector<FramePair> scan();

    // Puts a pair that failed to parse back in line. It is delivered again once
    // its files settle. Returns false when the pair has used up its retries.
    bool retry(const FramePair& pair);

private:
    struct FileStamp {
        std::uintmax_t size{0};
        std::filesystem::file_time_type mtime{};
        bool operator==(const FileStamp& o) const { return size == o.size && mtime == o.mtime; }
    };
    struct PairStamp {
        FileStamp detections;
        FileStamp classifications;
        bool operator==(const PairStamp& o) const {
            return detections == o.detections && classifications == o.classifications;
        }
    };

    void run();

    std::string dir_;
    FrameBuffer<FramePair>& buffer_;
    int poll_ms_{1000};
    std::thread worker_;
    std::atomic<bool> running_{false};

    std::mutex mu_;
    std::set<std::string> seen_;                 // delivered stems still on disk
    std::map<std::string, PairStamp> pending_;   // stamp from the previous poll
    std::map<std::string, int> retries_;
};

}  // namespace kitchen
