/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <leosim/propagator.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <numbers>

using spdlog::debug;
using spdlog::warn;
using spdlog::error;

namespace leosim {

// Zonal harmonic used for the secular drift, with its reference radius
constexpr double J2 = 1.08262668e-3;
constexpr double J2_RADIUS_KM = 6378.137;

constexpr double TWO_PI = 2.0 * std::numbers::pi;

double solveKepler(double meanAnomaly, double eccentricity) {
    // Normalize to [-π, π) to keep Newton's method well behaved
    double M = std::fmod(meanAnomaly + std::numbers::pi, TWO_PI);
    if (M < 0) M += TWO_PI;
    M -= std::numbers::pi;

    double E = eccentricity < 0.8 ? M : std::numbers::pi;
    for (int i = 0; i < 50; ++i) {
        double f = E - eccentricity * std::sin(E) - M;
        double delta = f / (1.0 - eccentricity * std::cos(E));
        E -= delta;
        if (std::abs(delta) < 1e-12) {
            return E;
        }
    }
    throw ComputeError("Kepler's equation did not converge");
}

StateVector KeplerPropagator::propagate(const EncodedElementRecord &record, time_point tp) const {
    return propagate(decode(record), tp);
}

StateVector KeplerPropagator::propagate(const ElementSet &elements, time_point tp) const {
    double e = elements.eccentricity;
    if (e < 0.0 || e >= 1.0) {
        throw ComputeError("Orbit is not elliptical");
    }

    // Mean motion (rad/s) and semi-major axis (km)
    double n = elements.meanMotionRevPerDay * TWO_PI / SECONDS_PER_DAY;
    double a = std::cbrt(EARTH_GM / (n * n));
    double dt = secondsBetween(elements.epoch, tp);

    double inc = elements.inclinationDeg * DEGREES_TO_RADIANS;
    double cosInc = std::cos(inc);
    double sinInc = std::sin(inc);

    // Secular J2 rates of the node and argument of perigee
    double p = a * (1.0 - e * e);
    double j2Factor = n * J2 * (J2_RADIUS_KM / p) * (J2_RADIUS_KM / p);
    double raanRate = -1.5 * j2Factor * cosInc;
    double argpRate = 0.75 * j2Factor * (5.0 * cosInc * cosInc - 1.0);

    double raan = elements.raanDeg * DEGREES_TO_RADIANS + raanRate * dt;
    double argp = elements.argpDeg * DEGREES_TO_RADIANS + argpRate * dt;
    double M = elements.meanAnomalyDeg * DEGREES_TO_RADIANS + n * dt;

    double E = solveKepler(M, e);
    double cosE = std::cos(E);
    double sinE = std::sin(E);
    double rootOneMinusE2 = std::sqrt(1.0 - e * e);

    // Position and velocity in the perifocal frame
    double r = a * (1.0 - e * cosE);
    double xp = a * (cosE - e);
    double yp = a * rootOneMinusE2 * sinE;
    double vFactor = std::sqrt(EARTH_GM * a) / r;
    double vxp = -vFactor * sinE;
    double vyp = vFactor * rootOneMinusE2 * cosE;

    // Perifocal to inertial: R3(-Ω) R1(-i) R3(-ω)
    double cosO = std::cos(raan), sinO = std::sin(raan);
    double cosW = std::cos(argp), sinW = std::sin(argp);
    Vec3 P{
        cosO * cosW - sinO * sinW * cosInc,
        sinO * cosW + cosO * sinW * cosInc,
        sinW * sinInc
    };
    Vec3 Q{
        -cosO * sinW - sinO * cosW * cosInc,
        -sinO * sinW + cosO * cosW * cosInc,
        cosW * sinInc
    };

    Vec3 position = P * xp + Q * yp;
    Vec3 velocity = P * vxp + Q * vyp;

    GroundPoint ground = subpoint(position, tp);
    return StateVector{
        .position = position,
        .velocity = velocity,
        .latitudeDeg = ground.latitudeDeg,
        .longitudeDeg = ground.longitudeDeg
    };
}

TrajectoryPoint TrajectoryPropagator::propagateAt(const EncodedElementRecord &record, time_point tp,
                                                  time_point start) const {
    StateVector state = propagator.propagate(record, tp);

    double altitude = altitudeOf(state.position);
    double speed = state.velocity.magnitude();
    if (!std::isfinite(altitude) || !std::isfinite(speed)) {
        throw ComputeError("Propagation produced a non-finite state");
    }

    return TrajectoryPoint{
        .position = state.position,
        .velocity = state.velocity,
        .altitudeKm = altitude,
        .speedKmS = speed,
        .latitudeDeg = state.latitudeDeg,
        .longitudeDeg = state.longitudeDeg,
        .time = tp,
        .elapsedSeconds = secondsBetween(start, tp)
    };
}

Vec3 TrajectoryPropagator::correctAltitudeDrift(const Vec3 &position, double targetAltitudeKm) const {
    double altitude = altitudeOf(position);
    if (std::abs(altitude - targetAltitudeKm) <= driftToleranceKm) {
        return position;
    }

    double r = position.magnitude();
    if (r <= 0.0) {
        error("Cannot correct altitude: position vector has zero magnitude");
        return position;
    }

    Vec3 corrected = position * ((EARTH_RADIUS_KM + targetAltitudeKm) / r);
    debug("Corrected altitude drift from {:.1f}km to {:.1f}km (target: {:.1f}km)",
        altitude, altitudeOf(corrected), targetAltitudeKm);
    return corrected;
}

void TrajectoryPropagator::validateInitialPosition(const std::string &name, const TrajectoryPoint &point,
                                                   double targetAltitudeKm) const {
    if (std::abs(point.altitudeKm - targetAltitudeKm) > driftToleranceKm) {
        warn("{} altitude differs from expected: {:.1f}km vs {:.1f}km",
            name, point.altitudeKm, targetAltitudeKm);
    }

    if (point.altitudeKm < minimumAltitudeKm) {
        error("{} altitude is too low: {:.1f}km", name, point.altitudeKm);
        throw ConfigurationError(name, fmt::format("orbit is not viable, initial altitude {:.1f}km is below {:.1f}km",
            point.altitudeKm, minimumAltitudeKm));
    }
}

}
