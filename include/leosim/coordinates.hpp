/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LEOSIM_COORDINATES_HPP
#define __LEOSIM_COORDINATES_HPP

#include <chrono>
#include <cmath>
#include <numbers>

namespace leosim {

using time_point = std::chrono::system_clock::time_point;

constexpr double EARTH_GM = 398600.4418;        // km^3/s^2
constexpr double EARTH_RADIUS_KM = 6371.0;      // Mean radius, the reference for every altitude
constexpr double SECONDS_PER_DAY = 86400.0;

constexpr double DEGREES_TO_RADIANS = std::numbers::pi / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / std::numbers::pi;

/**
 * Cartesian vector, in km or km/s depending on use.
 */
struct Vec3 {
    double x, y, z;

    Vec3 operator+(const Vec3 &v) const { return {x + v.x, y + v.y, z + v.z}; }
    Vec3 operator-(const Vec3 &v) const { return {x - v.x, y - v.y, z - v.z}; }
    Vec3 operator*(double s) const { return {x * s, y * s, z * s}; }
    bool operator==(const Vec3 &) const = default;

    double dot(const Vec3 &v) const { return x * v.x + y * v.y + z * v.z; }
    Vec3 cross(const Vec3 &v) const {
        return {y * v.z - z * v.y, z * v.x - x * v.z, x * v.y - y * v.x};
    }
    double magnitude() const { return std::sqrt(dot(*this)); }
    double distanceTo(const Vec3 &v) const { return (*this - v).magnitude(); }
};

/**
 * Point on the ground track of a satellite.
 */
struct GroundPoint {
    double latitudeDeg;     ///< Geodetic latitude, positive north
    double longitudeDeg;    ///< [-180, 180), positive east
    double heightKm;        ///< Height above the WGS84 ellipsoid
};

/**
 * Greenwich mean sidereal angle at the given instant (IAU 1982 polynomial,
 * UTC used in place of UT1).
 * @return angle in radians in [0, 2π)
 */
double siderealAngle(time_point tp);

/**
 * Rotates an inertial vector into the Earth-fixed frame.
 */
Vec3 toEarthFixed(const Vec3 &inertial, double siderealAngleRad);

/**
 * Geodetic position of an Earth-fixed vector on the WGS84 ellipsoid.
 */
GroundPoint toGroundPoint(const Vec3 &earthFixed);

/**
 * Point directly below an inertial position at the given instant.
 */
GroundPoint subpoint(const Vec3 &inertial, time_point tp);

/**
 * Altitude above a spherical Earth of radius EARTH_RADIUS_KM.
 */
inline double altitudeOf(const Vec3 &position) {
    return position.magnitude() - EARTH_RADIUS_KM;
}

inline std::chrono::system_clock::duration fromSeconds(double seconds) {
    return std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::duration<double>(seconds));
}

inline double secondsBetween(time_point from, time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

}

#endif
