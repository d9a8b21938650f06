/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <leosim/coordinates.hpp>

#include <chrono>
#include <cmath>

namespace leosim {

namespace {

using namespace std::chrono;

// 2000-01-01 12:00:00
const time_point J2000 = sys_days{year{2000}/January/1} + hours{12};

// WGS84
constexpr double ELLIPSOID_A = 6378.137;
constexpr double ELLIPSOID_E2 = 6.69437999014e-3;

double wrapDegrees(double deg) {
    deg = std::fmod(deg + 180.0, 360.0);
    if (deg < 0) deg += 360.0;
    return deg - 180.0;
}

} // namespace

double siderealAngle(time_point tp) {
    double centuries = secondsBetween(J2000, tp) / (SECONDS_PER_DAY * 36525.0);

    // Sidereal time in seconds, 240 of which make a degree
    double seconds = 67310.54841
        + (876600.0 * 3600.0 + 8640184.812866) * centuries
        + 0.093104 * centuries * centuries
        - 6.2e-6 * centuries * centuries * centuries;

    double angle = std::fmod(seconds / 240.0 * DEGREES_TO_RADIANS, 2.0 * std::numbers::pi);
    return angle < 0 ? angle + 2.0 * std::numbers::pi : angle;
}

Vec3 toEarthFixed(const Vec3 &inertial, double siderealAngleRad) {
    double c = std::cos(siderealAngleRad);
    double s = std::sin(siderealAngleRad);
    return {c * inertial.x + s * inertial.y, c * inertial.y - s * inertial.x, inertial.z};
}

GroundPoint toGroundPoint(const Vec3 &earthFixed) {
    double p = std::hypot(earthFixed.x, earthFixed.y);

    // Fixed point iteration on latitude, converges in a few passes below GEO
    double lat = std::atan2(earthFixed.z, p * (1.0 - ELLIPSOID_E2));
    double N = ELLIPSOID_A;
    for (int i = 0; i < 20; ++i) {
        double sinLat = std::sin(lat);
        N = ELLIPSOID_A / std::sqrt(1.0 - ELLIPSOID_E2 * sinLat * sinLat);
        double next = std::atan2(earthFixed.z + N * ELLIPSOID_E2 * sinLat, p);
        bool converged = std::abs(next - lat) < 1e-13;
        lat = next;
        if (converged) break;
    }

    // Near the poles p/cos(lat) is ill conditioned, use the z component instead
    double height = std::abs(lat) < std::numbers::pi / 4.0
        ? p / std::cos(lat) - N
        : earthFixed.z / std::sin(lat) - N * (1.0 - ELLIPSOID_E2);

    return GroundPoint{
        .latitudeDeg = lat * RADIANS_TO_DEGREES,
        .longitudeDeg = wrapDegrees(std::atan2(earthFixed.y, earthFixed.x) * RADIANS_TO_DEGREES),
        .heightKm = height
    };
}

GroundPoint subpoint(const Vec3 &inertial, time_point tp) {
    return toGroundPoint(toEarthFixed(inertial, siderealAngle(tp)));
}

}
