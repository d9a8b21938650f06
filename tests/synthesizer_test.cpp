/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <leosim/synthesizer.hpp>

#include <chrono>
#include <cmath>

namespace leosim {
namespace {

using namespace std::chrono;

class SynthesizerTest : public ::testing::Test {
protected:
    ElementSetSynthesizer synthesizer{42u};
    time_point epoch = sys_days{2025y/May/1} + 12h;
};

TEST(BandTest, ProbabilitiesSumToOne) {
    double altitude = 0.0;
    for (const auto &band : ALTITUDE_BANDS) altitude += band.probability;
    double inclination = 0.0;
    for (const auto &band : INCLINATION_BANDS) inclination += band.probability;
    EXPECT_NEAR(altitude, 1.0, 1e-12);
    EXPECT_NEAR(inclination, 1.0, 1e-12);
}

TEST_F(SynthesizerTest, AltitudeDistribution) {
    int samples = 20000;
    int crowdedShell = 0;
    for (int i = 0; i < samples; ++i) {
        double altitude = synthesizer.sampleBands(ALTITUDE_BANDS);
        ASSERT_GE(altitude, 160.0);
        ASSERT_LT(altitude, 2000.0);
        if (altitude >= 500.0 && altitude < 800.0) crowdedShell++;
    }
    EXPECT_NEAR(static_cast<double>(crowdedShell) / samples, 0.40, 0.02);
}

TEST_F(SynthesizerTest, InclinationRange) {
    for (int i = 0; i < 5000; ++i) {
        double inclination = synthesizer.sampleBands(INCLINATION_BANDS);
        ASSERT_GE(inclination, 0.0);
        ASSERT_LT(inclination, 120.0);
    }
}

TEST_F(SynthesizerTest, EccentricityNarrowsWithAltitude) {
    for (int i = 0; i < 5000; ++i) {
        auto orbit = synthesizer.realisticParameters();
        ASSERT_GE(orbit.eccentricity, 0.0001);
        if (orbit.altitudeKm < 400.0) {
            ASSERT_LE(orbit.eccentricity, 0.003);
        } else if (orbit.altitudeKm < 800.0) {
            ASSERT_LE(orbit.eccentricity, 0.01);
        } else {
            ASSERT_LE(orbit.eccentricity, 0.02);
        }
        ASSERT_GE(orbit.raanDeg, 0.0);
        ASSERT_LT(orbit.raanDeg, 360.0);
    }
}

TEST_F(SynthesizerTest, DragGrowsAsOrbitsGetLower) {
    for (int i = 0; i < 1000; ++i) {
        double low = std::abs(synthesizer.dragTermFor(300.0));
        double mid = std::abs(synthesizer.dragTermFor(600.0));
        double high = std::abs(synthesizer.dragTermFor(1500.0));
        ASSERT_GE(low, 1e-5);
        ASSERT_LT(low, 1e-4);
        ASSERT_GE(mid, 1e-6);
        ASSERT_LT(mid, 1e-5);
        ASSERT_GE(high, 1e-7);
        ASSERT_LT(high, 1e-6);
    }
}

TEST_F(SynthesizerTest, ConfiguredSatellite) {
    SatelliteConfig crts1{"CRTS1", 550.0, 51.6, "CRTS-1"};
    for (int i = 0; i < 200; ++i) {
        auto e = synthesizer.synthesize(crts1, epoch);
        ASSERT_GT(e.meanMotionRevPerDay, 0.0);
        ASSERT_GE(e.catalogNumber, 10000);
        ASSERT_LE(e.catalogNumber, 99999);
        ASSERT_GE(e.revolutionNumber, 1);
        ASSERT_LE(e.revolutionNumber, 5000);
        EXPECT_EQ(e.elementSetNumber, 999);
        EXPECT_EQ(e.classification, 'U');
        EXPECT_EQ(e.epoch, epoch);
        EXPECT_NO_THROW(validate(e));
    }
}

TEST_F(SynthesizerTest, MeanMotionFollowsAltitude) {
    OrbitParameters orbit{550.0, 51.6, 0.001, 10.0, 20.0, 30.0};
    auto e = synthesizer.synthesize(orbit, epoch);
    EXPECT_DOUBLE_EQ(e.altitudeKm, 550.0);
    EXPECT_DOUBLE_EQ(e.meanMotionRevPerDay, meanMotionFromAltitude(550.0));
    EXPECT_DOUBLE_EQ(e.inclinationDeg, 51.6);
    EXPECT_DOUBLE_EQ(e.raanDeg, 10.0);
}

TEST_F(SynthesizerTest, SnapsToRecordColumns) {
    OrbitParameters orbit{550.0, 51.600049, 0.00123456, 359.99996, 20.123456, 30.0};
    auto e = synthesizer.synthesize(orbit, epoch);
    EXPECT_DOUBLE_EQ(e.inclinationDeg, 51.6);
    EXPECT_DOUBLE_EQ(e.raanDeg, 0.0);
    EXPECT_DOUBLE_EQ(e.argpDeg, 20.1235);
    EXPECT_NEAR(e.eccentricity, 0.0012346, 1e-12);
}

TEST_F(SynthesizerTest, NonPhysicalOrbit) {
    OrbitParameters orbit{-7000.0, 51.6, 0.001, 0.0, 0.0, 0.0};
    EXPECT_THROW(synthesizer.synthesize(orbit, epoch), ConfigurationError);
}

TEST(SynthesizerSeedTest, SameSeedSameElements) {
    time_point epoch = sys_days{2025y/May/1};
    SatelliteConfig bulldog{"BULLDOG", 530.0, 52.0, ""};
    ElementSetSynthesizer a(99);
    ElementSetSynthesizer b(99);
    auto first = a.synthesize(bulldog, epoch);
    auto second = b.synthesize(bulldog, epoch);
    EXPECT_EQ(encode(first), encode(second));
}

}
}
