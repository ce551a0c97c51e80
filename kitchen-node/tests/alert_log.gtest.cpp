#include "alert_log.hpp"
#include "console_notifier.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace kitchen {
namespace gtest {

namespace fs = std::filesystem;

namespace {
Alert stamped(AlertType type, const std::string& message) {
    Alert a = make_alert(type, message, "voice", {{"confidence", 0.9}});
    a.timestamp = "2026-10-19T08:30:00.000000";
    a.frame_number = 12;
    return a;
}
}  // namespace

class AlertLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "kitchen_guard_alert_log";
        fs::remove_all(dir_);
    }
    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
    Clock::time_point now_{Clock::now()};
};

TEST_F(AlertLogTest, PathFor_DailyFileName) {
    AlertLog log(dir_.string());
    const std::string name = fs::path(log.path_for(now_)).filename().string();
    ASSERT_EQ(name.size(), std::string("alerts_YYYYMMDD.json").size());
    EXPECT_EQ(name.rfind("alerts_", 0), 0u);
    EXPECT_EQ(name.substr(name.size() - 5), ".json");
    EXPECT_EQ(fs::path(log.path_for(now_)).parent_path(), dir_);
}

TEST_F(AlertLogTest, PathFor_SameDayAsAlertTimestamp) {
    AlertLog log(dir_.string());
    const std::string stamp = format_timestamp(now_);
    const std::string day = stamp.substr(0, 4) + stamp.substr(5, 2) + stamp.substr(8, 2);
    EXPECT_EQ(fs::path(log.path_for(now_)).filename().string(), "alerts_" + day + ".json");

    const std::tm tm = local_time(now_);
    EXPECT_EQ(tm.tm_year + 1900, std::stoi(stamp.substr(0, 4)));
    EXPECT_EQ(tm.tm_mon + 1, std::stoi(stamp.substr(5, 2)));
    EXPECT_EQ(tm.tm_mday, std::stoi(stamp.substr(8, 2)));
}

TEST_F(AlertLogTest, Append_AccumulatesAcrossBatches) {
    AlertLog log(dir_.string());
    log.append({stamped(AlertType::FIRE_DETECTED, "fire")}, now_);
    log.append({stamped(AlertType::KNIFE_UNATTENDED, "knife"), stamped(AlertType::FIRE_DETECTED, "fire")}, now_);

    std::ifstream f(log.path_for(now_));
    ASSERT_TRUE(f.good());
    nlohmann::json logs = nlohmann::json::parse(f);
    ASSERT_TRUE(logs.is_array());
    ASSERT_EQ(logs.size(), 3u);
    EXPECT_EQ(logs[0]["type"], "FIRE_DETECTED");
    EXPECT_EQ(logs[1]["type"], "KNIFE_UNATTENDED");
    EXPECT_EQ(logs[1]["frame_number"], 12);
    EXPECT_EQ(logs[1]["voice_alert"], "voice");
}

TEST_F(AlertLogTest, Summary_CountsByTypeAndSeverity) {
    AlertLog log(dir_.string());
    log.append({stamped(AlertType::FIRE_DETECTED, "fire"), stamped(AlertType::SMOKE_DETECTED, "smoke"),
                stamped(AlertType::STOVE_TOO_FAR, "far")},
               now_);

    AlertSummary s = log.summary(now_);
    EXPECT_EQ(s.total, 3u);
    EXPECT_EQ(s.by_type["FIRE_DETECTED"], 1u);
    EXPECT_EQ(s.by_type["SMOKE_DETECTED"], 1u);
    EXPECT_EQ(s.by_severity["CRITICAL"], 2u);
    EXPECT_EQ(s.by_severity["MEDIUM"], 1u);
}

TEST_F(AlertLogTest, EmptyBatch_WritesNothing) {
    AlertLog log(dir_.string());
    log.append({}, now_);
    EXPECT_FALSE(fs::exists(log.path_for(now_)));
    EXPECT_EQ(log.summary(now_).total, 0u);
}

TEST_F(AlertLogTest, CorruptFile_StartsOver) {
    AlertLog log(dir_.string());
    fs::create_directories(dir_);
    std::ofstream(log.path_for(now_)) << "{ truncated";

    log.append({stamped(AlertType::PAN_OVERHEATING, "pan")}, now_);
    AlertSummary s = log.summary(now_);
    EXPECT_EQ(s.total, 1u);
    EXPECT_EQ(s.by_type["PAN_OVERHEATING"], 1u);
}

TEST(ConsoleNotifierTest, BellCountBySeverity) {
    EXPECT_EQ(ConsoleNotifier::bell_count(Severity::CRITICAL), 3);
    EXPECT_EQ(ConsoleNotifier::bell_count(Severity::HIGH), 2);
    EXPECT_EQ(ConsoleNotifier::bell_count(Severity::MEDIUM), 2);
    EXPECT_EQ(ConsoleNotifier::bell_count(Severity::LOW), 1);
}

TEST(ConsoleNotifierTest, Notify_SafeFrame) {
    std::ostringstream out;
    ConsoleNotifier notifier(out, true);
    notifier.notify({});
    EXPECT_NE(out.str().find("No hazards detected"), std::string::npos);
    EXPECT_EQ(out.str().find('\a'), std::string::npos);
}

TEST(ConsoleNotifierTest, Notify_PrintsBannerAndRings) {
    std::ostringstream out;
    ConsoleNotifier notifier(out, true);
    notifier.notify({stamped(AlertType::FIRE_DETECTED, "FIRE DETECTED in kitchen!")});

    const std::string text = out.str();
    EXPECT_NE(text.find("1 hazard(s) detected"), std::string::npos);
    EXPECT_NE(text.find("[CRITICAL] FIRE_DETECTED"), std::string::npos);
    EXPECT_NE(text.find("FIRE DETECTED in kitchen!"), std::string::npos);
    EXPECT_NE(text.find("Frame: 12"), std::string::npos);
    EXPECT_EQ(std::count(text.begin(), text.end(), '\a'), 3);
}

TEST(ConsoleNotifierTest, Notify_MutedWhenAudioDisabled) {
    std::ostringstream out;
    ConsoleNotifier notifier(out, false);
    notifier.notify({stamped(AlertType::STOVE_UNATTENDED, "stove")});
    EXPECT_EQ(out.str().find('\a'), std::string::npos);
}

TEST(ConsoleNotifierTest, PrintSummary_NoAlerts) {
    std::ostringstream out;
    ConsoleNotifier notifier(out, false);
    notifier.print_summary(AlertSummary{});
    EXPECT_NE(out.str().find("Total Alerts Today: 0"), std::string::npos);
    EXPECT_NE(out.str().find("No alerts today"), std::string::npos);
}

}  // namespace gtest
}  // namespace kitchen
