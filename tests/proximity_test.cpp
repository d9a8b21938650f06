/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <leosim/proximity.hpp>

#include <map>
#include <string>

namespace leosim {
namespace {

TEST(ProximityTest, OnePairWithinThreshold) {
    std::map<std::string, Vec3> snapshot{
        {"A", {6921.0, 0.0, 0.0}},
        {"B", {6921.0, 3.0, 0.0}},
        {"C", {6921.0, 0.0, 500.0}}
    };
    auto events = detectProximity(snapshot, 5.0);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].idA, "A");
    EXPECT_EQ(events[0].idB, "B");
    EXPECT_NEAR(events[0].distanceKm, 3.0, 1e-9);
}

TEST(ProximityTest, ThresholdIsExclusive) {
    std::map<std::string, Vec3> snapshot{
        {"A", {0.0, 0.0, 0.0}},
        {"B", {5.0, 0.0, 0.0}}
    };
    EXPECT_TRUE(detectProximity(snapshot, 5.0).empty());
}

TEST(ProximityTest, EveryPairOnce) {
    std::map<std::string, Vec3> snapshot{
        {"A", {7000.0, 0.0, 0.0}},
        {"B", {7000.0, 1.0, 0.0}},
        {"C", {7000.0, 0.0, 1.0}},
        {"D", {7000.0, 1.0, 1.0}}
    };
    auto events = detectProximity(snapshot, 5.0);
    ASSERT_EQ(events.size(), 6u);
    for (const auto &event : events) {
        EXPECT_LT(event.idA, event.idB);
    }
}

TEST(ProximityTest, EmptyAndSingleSnapshots) {
    EXPECT_TRUE(detectProximity({}, 5.0).empty());
    EXPECT_TRUE(detectProximity({{"A", {7000.0, 0.0, 0.0}}}, 5.0).empty());
}

TEST(ProximityTest, DescribeCollision) {
    ProximityEvent event{"BULLDOG", "CRTS1", 3.14159};
    EXPECT_EQ(describeCollision(event, "BULLDOG"), "Collision with CRTS1 Dist=3.14km");
    EXPECT_EQ(describeCollision(event, "CRTS1"), "Collision with BULLDOG Dist=3.14km");
}

}
}
