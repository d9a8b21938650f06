/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Element records follow the NORAD two-line element layout.
 * See: https://celestrak.org/NORAD/documentation/tle-fmt.php
 */

#ifndef __LEOSIM_ELEMENTS_HPP
#define __LEOSIM_ELEMENTS_HPP

#include <leosim/coordinates.hpp>
#include <leosim/errors.hpp>

#include <iostream>
#include <string>
#include <string_view>

namespace leosim {

constexpr std::size_t RECORD_DATA_COLUMNS = 68;
constexpr std::size_t RECORD_LINE_LENGTH = RECORD_DATA_COLUMNS + 1;

/**
 * Orbital elements of a single satellite.
 *
 * Angles are in degrees. RAAN, argument of perigee and mean anomaly lie in
 * [0, 360), inclination in [0, 180]. Mean motion is derived from altitude
 * (see meanMotionFromAltitude).
 */
struct ElementSet {
    int catalogNumber = 0;              ///< 5-digit catalog number
    char classification = 'U';          ///< U/C/S
    time_point epoch;                   ///< Epoch of the elements (UTC)
    double altitudeKm = 0.0;            ///< Target altitude above the mean Earth radius
    double inclinationDeg = 0.0;
    double eccentricity = 0.0;
    double raanDeg = 0.0;               ///< Right ascension of the ascending node
    double argpDeg = 0.0;               ///< Argument of perigee
    double meanAnomalyDeg = 0.0;
    double meanMotionRevPerDay = 0.0;
    double dragTerm = 0.0;              ///< BSTAR drag term (1/earth radii)
    int elementSetNumber = 999;
    int revolutionNumber = 1;

    /** Orbital period in seconds, from the mean motion. */
    double periodSeconds() const {
        return SECONDS_PER_DAY / meanMotionRevPerDay;
    }
};

/**
 * Fixed-width two-line encoding of an ElementSet. Each line is 69 characters:
 * 68 data columns followed by a checksum digit.
 */
struct EncodedElementRecord {
    std::string line1;
    std::string line2;

    bool operator==(const EncodedElementRecord&) const = default;
};

/**
 * Mean motion (rev/day) of a circular orbit at the given altitude, from
 * Kepler's third law with a = EARTH_RADIUS_KM + altitude.
 * @throws ConfigurationError if altitude_km <= -EARTH_RADIUS_KM
 */
double meanMotionFromAltitude(double altitudeKm);

/**
 * Inverse of meanMotionFromAltitude.
 * @throws ConfigurationError if the mean motion is not positive
 */
double altitudeFromMeanMotion(double meanMotionRevPerDay);

/**
 * Checks that every field of the element set fits the physical ranges and
 * the fixed-width record columns.
 * @throws ConfigurationError describing the first offending field
 */
void validate(const ElementSet &elements);

/**
 * Encodes an element set into a two-line record with checksums.
 * @throws ConfigurationError if validate() fails
 */
EncodedElementRecord encode(const ElementSet &elements);

/**
 * Parses a two-line record. Altitude is recovered from the mean motion.
 * @throws ConfigurationError on a malformed line or a checksum mismatch
 */
ElementSet decode(std::string_view line1, std::string_view line2);

inline ElementSet decode(const EncodedElementRecord &record) {
    return decode(record.line1, record.line2);
}

/**
 * Checksum of a record line: digits count their value, '-' counts as 1,
 * everything else counts 0. Only the first 68 columns are considered.
 */
int calculateChecksum(std::string_view line);

/**
 * Returns true if the line is long enough and its last data column checksum
 * matches the appended digit.
 */
bool hasValidChecksum(std::string_view line);

// Record formatting utilities
std::string toExponentialField(double value);
double fromExponentialField(std::string_view field);

/**
 * Print orbital element information to a stream.
 */
void printInfo(std::ostream &os, std::string_view name, const ElementSet &elements);

}

#endif
