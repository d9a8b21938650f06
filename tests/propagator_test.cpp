/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <leosim/propagator.hpp>

#include <chrono>
#include <cmath>
#include <limits>
#include <numbers>

namespace leosim {
namespace {

using namespace std::chrono;

ElementSet makeElements(double altitudeKm, double inclinationDeg, double eccentricity, time_point epoch) {
    ElementSet e;
    e.catalogNumber = 11111;
    e.epoch = epoch;
    e.altitudeKm = altitudeKm;
    e.inclinationDeg = inclinationDeg;
    e.eccentricity = eccentricity;
    e.raanDeg = 40.0;
    e.argpDeg = 90.0;
    e.meanAnomalyDeg = 10.0;
    e.meanMotionRevPerDay = meanMotionFromAltitude(altitudeKm);
    e.dragTerm = 0.00001;
    return e;
}

// Returns a fixed state regardless of its input
class FixedPropagator : public Propagator {
public:
    explicit FixedPropagator(StateVector state) : state(state) {}

    StateVector propagate(const EncodedElementRecord &, time_point) const override {
        return state;
    }

private:
    StateVector state;
};

class KeplerPropagatorTest : public ::testing::Test {
protected:
    KeplerPropagator propagator;
    time_point epoch = sys_days{2025y/July/4};
};

// ============================================================================
// Kepler's Equation
// ============================================================================

TEST(SolveKeplerTest, CircularOrbit) {
    EXPECT_NEAR(solveKepler(1.234, 0.0), 1.234, 1e-12);
}

TEST(SolveKeplerTest, SatisfiesEquation) {
    for (double e : {0.001, 0.1, 0.5, 0.9}) {
        for (double M : {0.1, 1.0, 3.0, 5.5}) {
            double E = solveKepler(M, e);
            double residual = std::remainder(E - e * std::sin(E) - M, 2.0 * std::numbers::pi);
            EXPECT_NEAR(residual, 0.0, 1e-10);
        }
    }
}

// ============================================================================
// Kepler Propagator
// ============================================================================

TEST_F(KeplerPropagatorTest, CircularOrbitKeepsAltitude) {
    auto elements = makeElements(550.0, 51.6, 0.0, epoch);
    for (int minutes : {0, 17, 45, 90, 600}) {
        auto state = propagator.propagate(elements, epoch + std::chrono::minutes(minutes));
        EXPECT_NEAR(altitudeOf(state.position), 550.0, 1e-6);
    }
}

TEST_F(KeplerPropagatorTest, CircularSpeed) {
    auto elements = makeElements(550.0, 51.6, 0.0, epoch);
    auto state = propagator.propagate(elements, epoch);
    double expected = std::sqrt(EARTH_GM / (EARTH_RADIUS_KM + 550.0));
    EXPECT_NEAR(state.velocity.magnitude(), expected, 1e-9);
    EXPECT_NEAR(state.velocity.magnitude(), 7.6, 0.1);
}

TEST_F(KeplerPropagatorTest, VelocityIsPerpendicularOnCircularOrbit) {
    auto elements = makeElements(700.0, 98.0, 0.0, epoch);
    auto state = propagator.propagate(elements, epoch + 20min);
    EXPECT_NEAR(state.position.dot(state.velocity), 0.0, 1e-6);
}

TEST_F(KeplerPropagatorTest, AngularMomentumMatchesInclination) {
    auto elements = makeElements(550.0, 51.6, 0.005, epoch);
    auto state = propagator.propagate(elements, epoch + 3h);
    Vec3 h = state.position.cross(state.velocity);
    EXPECT_NEAR(h.z / h.magnitude(), std::cos(51.6 * DEGREES_TO_RADIANS), 1e-9);
}

TEST_F(KeplerPropagatorTest, EccentricOrbitStaysBetweenApsides) {
    auto elements = makeElements(1000.0, 63.4, 0.02, epoch);
    double a = EARTH_RADIUS_KM + 1000.0;
    for (int minutes = 0; minutes < 120; minutes += 5) {
        auto state = propagator.propagate(elements, epoch + std::chrono::minutes(minutes));
        double r = state.position.magnitude();
        EXPECT_GE(r, a * (1 - 0.02) - 1e-6);
        EXPECT_LE(r, a * (1 + 0.02) + 1e-6);
    }
}

TEST_F(KeplerPropagatorTest, EquatorialOrbitHasZeroLatitude) {
    auto elements = makeElements(550.0, 0.0, 0.0, epoch);
    auto state = propagator.propagate(elements, epoch + 42min);
    EXPECT_NEAR(state.position.z, 0.0, 1e-9);
    EXPECT_NEAR(state.latitudeDeg, 0.0, 1e-9);
}

TEST_F(KeplerPropagatorTest, LatitudeBoundedByInclination) {
    auto elements = makeElements(550.0, 30.0, 0.0, epoch);
    for (int minutes = 0; minutes < 100; minutes += 3) {
        auto state = propagator.propagate(elements, epoch + std::chrono::minutes(minutes));
        EXPECT_LE(std::abs(state.latitudeDeg), 30.3);
        EXPECT_GE(state.longitudeDeg, -180.0);
        EXPECT_LE(state.longitudeDeg, 180.0);
    }
}

TEST_F(KeplerPropagatorTest, RecordMatchesElements) {
    auto elements = makeElements(550.0, 51.6, 0.001, epoch);
    auto record = encode(elements);
    auto tp = epoch + 30min;
    auto fromRecord = propagator.propagate(record, tp);
    auto fromElements = propagator.propagate(decode(record), tp);
    EXPECT_EQ(fromRecord.position, fromElements.position);
    EXPECT_EQ(fromRecord.velocity, fromElements.velocity);
}

TEST_F(KeplerPropagatorTest, RejectsHyperbolicOrbit) {
    auto elements = makeElements(550.0, 51.6, 1.2, epoch);
    EXPECT_THROW(propagator.propagate(elements, epoch), ComputeError);
}

TEST_F(KeplerPropagatorTest, RejectsCorruptedRecord) {
    auto record = encode(makeElements(550.0, 51.6, 0.001, epoch));
    record.line2[20] = record.line2[20] == '9' ? '8' : '9';
    EXPECT_THROW(propagator.propagate(record, epoch), ConfigurationError);
}

// ============================================================================
// Trajectory Propagator
// ============================================================================

class TrajectoryPropagatorTest : public ::testing::Test {
protected:
    KeplerPropagator kepler;
    TrajectoryPropagator propagator{kepler};
    time_point epoch = sys_days{2025y/July/4};
};

TEST_F(TrajectoryPropagatorTest, PropagateAt) {
    auto record = encode(makeElements(550.0, 51.6, 0.0, epoch));
    auto point = propagator.propagateAt(record, epoch + 10min, epoch);
    EXPECT_NEAR(point.altitudeKm, altitudeOf(point.position), 1e-12);
    EXPECT_NEAR(point.speedKmS, point.velocity.magnitude(), 1e-12);
    EXPECT_NEAR(point.altitudeKm, 550.0, 0.01);
    EXPECT_DOUBLE_EQ(point.elapsedSeconds, 600.0);
    EXPECT_EQ(point.time, epoch + 10min);
}

TEST_F(TrajectoryPropagatorTest, NonFiniteStateFails) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    FixedPropagator broken({{nan, 0.0, 0.0}, {0.0, 7.5, 0.0}, 0.0, 0.0});
    TrajectoryPropagator trajectory(broken);
    EXPECT_THROW(trajectory.propagateAt({}, epoch), ComputeError);
}

TEST_F(TrajectoryPropagatorTest, DriftWithinToleranceIsKept) {
    Vec3 position{EARTH_RADIUS_KM + 590.0, 0.0, 0.0};
    EXPECT_EQ(propagator.correctAltitudeDrift(position, 550.0), position);
}

TEST_F(TrajectoryPropagatorTest, DriftBeyondToleranceIsRescaled) {
    Vec3 position{4000.0, 4000.0, 3000.0};
    Vec3 corrected = propagator.correctAltitudeDrift(position, 550.0);
    EXPECT_NEAR(altitudeOf(corrected), 550.0, 1e-9);

    // Same direction
    Vec3 u = position * (1.0 / position.magnitude());
    Vec3 v = corrected * (1.0 / corrected.magnitude());
    EXPECT_NEAR(u.distanceTo(v), 0.0, 1e-12);
}

TEST_F(TrajectoryPropagatorTest, ZeroPositionIsLeftAlone) {
    Vec3 zero{0.0, 0.0, 0.0};
    EXPECT_EQ(propagator.correctAltitudeDrift(zero, 550.0), zero);
}

TEST_F(TrajectoryPropagatorTest, CustomTolerance) {
    TrajectoryPropagator strict(kepler, 5.0);
    Vec3 position{EARTH_RADIUS_KM + 560.0, 0.0, 0.0};
    EXPECT_NEAR(altitudeOf(strict.correctAltitudeDrift(position, 550.0)), 550.0, 1e-9);
    EXPECT_DOUBLE_EQ(strict.getDriftToleranceKm(), 5.0);
}

TEST_F(TrajectoryPropagatorTest, InitialPositionDeviationIsOnlyLogged) {
    TrajectoryPoint point{};
    point.altitudeKm = 450.0;
    EXPECT_NO_THROW(propagator.validateInitialPosition("CRTS1", point, 550.0));
}

TEST_F(TrajectoryPropagatorTest, InitialPositionTooLow) {
    TrajectoryPoint point{};
    point.altitudeKm = 140.0;
    try {
        propagator.validateInitialPosition("CRTS1", point, 160.0);
        FAIL() << "Expected ConfigurationError";
    } catch (const ConfigurationError &e) {
        EXPECT_EQ(e.satellite(), "CRTS1");
    }
}

}
}
