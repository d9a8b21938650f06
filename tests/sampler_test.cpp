/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <leosim/sampler.hpp>

#include <chrono>
#include <cmath>

namespace leosim {
namespace {

using namespace std::chrono;

TEST(ChooseStepTest, BaseStepKeptWhenInRange) {
    // 7200 / 60 = 120 intervals, one orbit holds 5700 / 60 = 95 < 180
    EXPECT_DOUBLE_EQ(chooseStepSeconds(5700.0, 7200.0, 60.0, 100, 2000), 5700.0 / MIN_POINTS_PER_ORBIT);
    // 3600 / 10 = 360 intervals and 570 per orbit
    EXPECT_DOUBLE_EQ(chooseStepSeconds(5700.0, 3600.0, 10.0, 100, 2000), 10.0);
}

TEST(ChooseStepTest, ShrinksToMinimum) {
    EXPECT_DOUBLE_EQ(chooseStepSeconds(5700.0, 3600.0, 30.0, 400, 2000), 9.0);
}

TEST(ChooseStepTest, GrowsToMaximum) {
    // 9000 / 43.2 leaves 208 points per orbit
    EXPECT_DOUBLE_EQ(chooseStepSeconds(9000.0, 86400.0, 1.0, 100, 2000), 86400.0 / 2000);
}

TEST(ChooseStepTest, DensityFloor) {
    // 86400 / 2000 = 43.2s would only give 132 points per 5700s orbit
    double step = chooseStepSeconds(5700.0, 86400.0, 60.0, 100, 2000);
    EXPECT_DOUBLE_EQ(step, 5700.0 / MIN_POINTS_PER_ORBIT);
}

TEST(ChooseStepTest, FullOrbit) {
    double period = 5739.0;
    EXPECT_NEAR(chooseStepSeconds(period, period, period / 500, 500, 500), period / 500, 1e-12);
}

TEST(ChooseStepTest, RejectsNonPositiveInputs) {
    EXPECT_THROW(chooseStepSeconds(0.0, 3600.0, 60.0, 100, 2000), ComputeError);
    EXPECT_THROW(chooseStepSeconds(5700.0, 3600.0, 0.0, 100, 2000), ComputeError);
    EXPECT_THROW(chooseStepSeconds(5700.0, -1.0, 60.0, 100, 2000), ComputeError);
}

TEST(ChooseStepTest, BoundsOverRealisticOrbits) {
    for (double period = 5400.0; period <= 7200.0; period += 300.0) {
        for (double span = 3600.0; span <= 86400.0; span += 3600.0) {
            for (double base : {1.0, 10.0, 60.0, 300.0}) {
                double step = chooseStepSeconds(period, span, base, 100, 5000);
                double count = span / step;
                EXPECT_GE(count, 100.0 - 1e-9) << "period=" << period << " span=" << span << " base=" << base;
                EXPECT_LE(count, 5000.0 + 1e-9) << "period=" << period << " span=" << span << " base=" << base;
                EXPECT_GE(period / step, MIN_POINTS_PER_ORBIT - 1e-9);
            }
        }
    }
}

class GeneratePointsTest : public ::testing::Test {
protected:
    KeplerPropagator kepler;
    TrajectoryPropagator propagator{kepler};
    time_point epoch = sys_days{2025y/August/20} + 3h;
    ElementSet elements;
    EncodedElementRecord record;

    void SetUp() override {
        elements.catalogNumber = 22222;
        elements.epoch = epoch;
        elements.altitudeKm = 530.0;
        elements.inclinationDeg = 52.0;
        elements.eccentricity = 0.0005;
        elements.raanDeg = 100.0;
        elements.argpDeg = 50.0;
        elements.meanAnomalyDeg = 0.0;
        elements.meanMotionRevPerDay = meanMotionFromAltitude(530.0);
        record = encode(elements);
    }
};

TEST_F(GeneratePointsTest, ClosedInterval) {
    auto points = generatePoints(propagator, record, epoch, epoch + 1h, 60.0);
    ASSERT_EQ(points.size(), 61u);
    EXPECT_EQ(points.front().time, epoch);
    EXPECT_EQ(points.back().time, epoch + 1h);
    EXPECT_DOUBLE_EQ(points.back().elapsedSeconds, 3600.0);
}

TEST_F(GeneratePointsTest, EndNotOnGrid) {
    auto points = generatePoints(propagator, record, epoch, epoch + 100s, 30.0);
    ASSERT_EQ(points.size(), 4u);
    EXPECT_DOUBLE_EQ(points.back().elapsedSeconds, 90.0);
}

TEST_F(GeneratePointsTest, OrderedAndRestartable) {
    auto first = generatePoints(propagator, record, epoch, epoch + 30min, 45.0);
    auto second = generatePoints(propagator, record, epoch, epoch + 30min, 45.0);
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].position, second[i].position);
        if (i > 0) {
            EXPECT_GT(first[i].time, first[i - 1].time);
        }
    }
}

TEST_F(GeneratePointsTest, EmptyWhenEndBeforeStart) {
    EXPECT_TRUE(generatePoints(propagator, record, epoch, epoch - 1min, 60.0).empty());
}

TEST_F(GeneratePointsTest, FullOrbitTrajectory) {
    auto trajectory = fullOrbitTrajectory(propagator, decode(record), record, 500);
    ASSERT_EQ(trajectory.size(), 501u);
    EXPECT_NEAR(trajectory.back().elapsedSeconds, elements.periodSeconds(), 1e-3);

    // The last point closes the orbit up to the J2 drift of the node and perigee
    double gap = trajectory.front().position.distanceTo(trajectory.back().position);
    EXPECT_LT(gap, 100.0);
    for (const auto &point : trajectory) {
        EXPECT_NEAR(point.altitudeKm, 530.0, 10.0);
    }
}

}
}
