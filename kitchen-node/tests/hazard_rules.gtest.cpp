#include "hazard_rules.hpp"
#include "test_frames.hpp"

#include <gtest/gtest.h>

namespace kitchen {
namespace gtest {

class HazardRules : public ::testing::Test {
protected:
    SafetyConfig cfg;
    ClassificationBatch cls;
    std::vector<Detection> dets;
};

TEST_F(HazardRules, FireSmoke_FireWinsOverSmoke) {
    dets = {make_detection("smoke", 0.9, 10, 10), make_detection("fire", 0.8, 50, 60)};
    auto a = check_fire_smoke(dets, cfg);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->type, AlertType::FIRE_DETECTED);
    EXPECT_EQ(a->severity, Severity::CRITICAL);
    EXPECT_EQ(a->details["location"], nlohmann::json::array({50, 60}));
}

TEST_F(HazardRules, FireSmoke_SmokeAlone) {
    dets = {make_detection("smoke", 0.9, 10, 10)};
    auto a = check_fire_smoke(dets, cfg);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->type, AlertType::SMOKE_DETECTED);
    EXPECT_EQ(a->severity, Severity::CRITICAL);
}

TEST_F(HazardRules, FireSmoke_LowConfidenceIgnored) {
    dets = {make_detection("fire", 0.5, 10, 10), make_detection("smoke", 0.69, 10, 10)};
    EXPECT_FALSE(check_fire_smoke(dets, cfg).has_value());
}

TEST_F(HazardRules, Stove_OnWithoutPerson_High) {
    dets = {make_detection("stove", 0.9, 100, 100, "stove.jpg")};
    classify(cls, "stove.jpg", "ON");
    auto a = check_stove_unattended(dets, cls.classifications, cfg);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->type, AlertType::STOVE_UNATTENDED);
    EXPECT_EQ(a->severity, Severity::HIGH);
    EXPECT_EQ(a->details["person_detected"], false);
}

TEST_F(HazardRules, Stove_PersonTooFar_Medium) {
    dets = {make_detection("stove", 0.9, 100, 100, "stove.jpg"), make_detection("person", 0.9, 100, 350)};
    classify(cls, "stove.jpg", "ON");
    auto a = check_stove_unattended(dets, cls.classifications, cfg);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->type, AlertType::STOVE_TOO_FAR);
    EXPECT_EQ(a->severity, Severity::MEDIUM);
    EXPECT_EQ(a->details["distance_from_stove"], 250);
    EXPECT_NE(a->message.find("(250px)"), std::string::npos);
}

TEST_F(HazardRules, Stove_PersonAtThreshold_NoAlert) {
    dets = {make_detection("stove", 0.9, 100, 100, "stove.jpg"), make_detection("person", 0.9, 100, 300)};
    classify(cls, "stove.jpg", "ON");
    EXPECT_FALSE(check_stove_unattended(dets, cls.classifications, cfg).has_value());
}

TEST_F(HazardRules, Stove_LowercaseOnIsNotActive) {
    dets = {make_detection("stove", 0.9, 100, 100, "stove.jpg"), make_detection("pan", 0.9, 120, 100, "pan.jpg")};
    classify(cls, "stove.jpg", "on");
    classify(cls, "pan.jpg", "empty");
    EXPECT_FALSE(check_stove_unattended(dets, cls.classifications, cfg).has_value());
    EXPECT_FALSE(check_pan_overheating(dets, cls.classifications, cfg).has_value());
}

TEST_F(HazardRules, Stove_OffOrUnclassified_NoAlert) {
    dets = {make_detection("stove", 0.9, 100, 100, "stove.jpg")};
    EXPECT_FALSE(check_stove_unattended(dets, cls.classifications, cfg).has_value());

    classify(cls, "stove.jpg", "OFF");
    EXPECT_FALSE(check_stove_unattended(dets, cls.classifications, cfg).has_value());
}

TEST_F(HazardRules, Knife_UnattendedNoPerson_Medium) {
    dets = {make_detection("knife", 0.9, 300, 300, "knife.jpg")};
    classify(cls, "knife.jpg", "unattended");
    auto a = check_knife_unattended(dets, cls.classifications, cfg);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->type, AlertType::KNIFE_UNATTENDED);
    EXPECT_EQ(a->severity, Severity::MEDIUM);
    EXPECT_EQ(a->details["person_nearby"], false);
}

TEST_F(HazardRules, Knife_PersonNearbyVetoes) {
    dets = {make_detection("knife", 0.9, 300, 300, "knife.jpg"), make_detection("person", 0.9, 350, 300)};
    classify(cls, "knife.jpg", "unattended");
    EXPECT_FALSE(check_knife_unattended(dets, cls.classifications, cfg).has_value());
}

TEST_F(HazardRules, Knife_PersonAtDangerDistance_StillAlerts) {
    dets = {make_detection("knife", 0.9, 300, 300, "knife.jpg"), make_detection("person", 0.9, 400, 300)};
    classify(cls, "knife.jpg", "unattended");
    EXPECT_TRUE(check_knife_unattended(dets, cls.classifications, cfg).has_value());
}

TEST_F(HazardRules, Knife_InUse_NoAlert) {
    dets = {make_detection("knife", 0.9, 300, 300, "knife.jpg")};
    classify(cls, "knife.jpg", "in-use");
    EXPECT_FALSE(check_knife_unattended(dets, cls.classifications, cfg).has_value());
}

TEST_F(HazardRules, Pan_EmptyOnActiveStove_High) {
    dets = {make_detection("stove", 0.9, 100, 100, "stove.jpg"), make_detection("pan", 0.9, 200, 100, "pan.jpg")};
    classify(cls, "stove.jpg", "ON");
    classify(cls, "pan.jpg", "empty");
    auto a = check_pan_overheating(dets, cls.classifications, cfg);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->type, AlertType::PAN_OVERHEATING);
    EXPECT_EQ(a->severity, Severity::HIGH);
}

TEST_F(HazardRules, Pan_OffBurner_NoAlert) {
    dets = {make_detection("stove", 0.9, 100, 100, "stove.jpg"), make_detection("pan", 0.9, 250, 100, "pan.jpg")};
    classify(cls, "stove.jpg", "ON");
    classify(cls, "pan.jpg", "empty");
    EXPECT_FALSE(check_pan_overheating(dets, cls.classifications, cfg).has_value());
}

TEST_F(HazardRules, Pan_ProximityIgnoresConfig) {
    cfg.safe_distance_threshold = 10.0;
    cfg.knife_danger_distance = 10.0;
    dets = {make_detection("stove", 0.9, 100, 100, "stove.jpg"), make_detection("pan", 0.9, 100, 249, "pan.jpg")};
    classify(cls, "stove.jpg", "ON");
    classify(cls, "pan.jpg", "empty");
    EXPECT_TRUE(check_pan_overheating(dets, cls.classifications, cfg).has_value());
}

TEST_F(HazardRules, Pan_NeedsBothStatuses) {
    dets = {make_detection("stove", 0.9, 100, 100, "stove.jpg"), make_detection("pan", 0.9, 120, 100, "pan.jpg")};
    classify(cls, "stove.jpg", "OFF");
    classify(cls, "pan.jpg", "empty");
    EXPECT_FALSE(check_pan_overheating(dets, cls.classifications, cfg).has_value());

    classify(cls, "stove.jpg", "ON");
    classify(cls, "pan.jpg", "in-use");
    EXPECT_FALSE(check_pan_overheating(dets, cls.classifications, cfg).has_value());

    cls.classifications.erase("pan.jpg");
    EXPECT_FALSE(check_pan_overheating(dets, cls.classifications, cfg).has_value());
}

TEST_F(HazardRules, EmptyFrame_NoRuleFires) {
    EXPECT_FALSE(check_fire_smoke(dets, cfg).has_value());
    EXPECT_FALSE(check_pan_overheating(dets, cls.classifications, cfg).has_value());
    EXPECT_FALSE(check_stove_unattended(dets, cls.classifications, cfg).has_value());
    EXPECT_FALSE(check_knife_unattended(dets, cls.classifications, cfg).has_value());
}

}  // namespace gtest
}  // namespace kitchen
