#include "frame_watcher.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <iterator>
#include <utility>

namespace kitchen {

namespace fs = std::filesystem;

namespace {
const std::string kDetectionsSuffix = ".detections.json";
const std::string kClassificationsSuffix = ".classifications.json";

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

template <typename Map>
void erase_missing(Map& m, const std::set<std::string>& present) {
    for (auto it = m.begin(); it != m.end();) {
        it = present.count(it->first) ? std::next(it) : m.erase(it);
    }
}
}  // namespace

FrameWatcher::FrameWatcher(const std::string& dir, FrameBuffer<FramePair>& buffer, int poll_ms)
    : dir_(dir), buffer_(buffer), poll_ms_(poll_ms > 0 ? poll_ms : 1000) {}

FrameWatcher::~FrameWatcher() {
    stop();
}

void FrameWatcher::start() {
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&FrameWatcher::run, this);
}

void FrameWatcher::stop() {
    running_ = false;
    buffer_.stop();
    if (worker_.joinable()) worker_.join();
}

std::vector<FramePair> FrameWatcher::scan() {
    std::vector<FramePair> found;

    std::error_code ec;
    fs::directory_iterator it(dir_, ec);
    if (ec) {
        std::cerr << "[WARN] Unable to read watch directory " << dir_ << ": " << ec.message() << std::endl;
        return found;
    }

    std::lock_guard<std::mutex> lock(mu_);
    std::set<std::string> present;
    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (!ends_with(name, kDetectionsSuffix)) continue;
        const std::string stem = name.substr(0, name.size() - kDetectionsSuffix.size());
        if (stem.empty()) continue;
        present.insert(stem);
        if (seen_.count(stem)) continue;

        // Wait for the classifier to finish the same frame.
        const fs::path cls_path = fs::path(dir_) / (stem + kClassificationsSuffix);
        PairStamp stamp;
        stamp.detections.size = fs::file_size(entry.path(), ec);
        if (ec) continue;
        stamp.detections.mtime = fs::last_write_time(entry.path(), ec);
        if (ec) continue;
        stamp.classifications.size = fs::file_size(cls_path, ec);
        if (ec) continue;
        stamp.classifications.mtime = fs::last_write_time(cls_path, ec);
        if (ec) continue;

        // Either file may still be being written until it holds still for a poll.
        auto prev = pending_.find(stem);
        if (prev == pending_.end() || !(prev->second == stamp)) {
            pending_[stem] = stamp;
            continue;
        }
        pending_.erase(prev);
        found.push_back(FramePair{stem, entry.path().string(), cls_path.string()});
    }

    std::sort(found.begin(), found.end(),
              [](const FramePair& a, const FramePair& b) { return a.stem < b.stem; });
    for (const auto& p : found) seen_.insert(p.stem);

    // Forget frames the upstream stages have cleaned up.
    for (auto s = seen_.begin(); s != seen_.end();) {
        s = present.count(*s) ? std::next(s) : seen_.erase(s);
    }
    erase_missing(pending_, present);
    erase_missing(retries_, present);
    return found;
}

bool FrameWatcher::retry(const FramePair& pair) {
    std::lock_guard<std::mutex> lock(mu_);
    int& attempts = retries_[pair.stem];
    if (attempts >= kMaxRetries) return false;
    attempts++;
    seen_.erase(pair.stem);
    pending_.erase(pair.stem);
    return true;
}

void FrameWatcher::run() {
    const auto step = std::chrono::milliseconds(std::min(poll_ms_, 100));
    while (running_) {
        for (auto& pair : scan()) {
            if (!buffer_.push(std::move(pair))) {
                running_ = false;
                break;
            }
        }

        // Sleep in short steps so request_stop() is honoured promptly.
        auto waited = std::chrono::milliseconds(0);
        while (running_ && waited < std::chrono::milliseconds(poll_ms_)) {
            std::this_thread::sleep_for(step);
            waited += step;
        }
    }
    buffer_.stop();
}

}  // namespace kitchen
