/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <leosim/synthesizer.hpp>
#include <spdlog/spdlog.h>

#include <cmath>

using spdlog::debug;
using spdlog::info;

namespace leosim {

const std::vector<Band> ALTITUDE_BANDS = {
    {160.0, 300.0, 0.15},
    {300.0, 500.0, 0.30},
    {500.0, 800.0, 0.40},
    {800.0, 1200.0, 0.10},
    {1200.0, 2000.0, 0.05}
};

const std::vector<Band> INCLINATION_BANDS = {
    {0.0, 20.0, 0.05},      // Equatorial
    {20.0, 45.0, 0.15},
    {45.0, 60.0, 0.20},
    {60.0, 80.0, 0.15},
    {80.0, 100.0, 0.30},    // Polar
    {97.0, 99.0, 0.10},     // Sun-synchronous
    {100.0, 120.0, 0.05}    // Retrograde
};

namespace {

// Snap a value to the precision of its record column
double toColumns(double value, double scale) {
    return std::round(value * scale) / scale;
}

double toAngleColumns(double degrees) {
    double snapped = toColumns(degrees, 10000.0);
    return snapped >= 360.0 ? snapped - 360.0 : snapped;
}

} // namespace

ElementSetSynthesizer::ElementSetSynthesizer(std::optional<unsigned> seed)
    : rng(seed.has_value() ? *seed : std::random_device{}()) {}

double ElementSetSynthesizer::uniform(double min, double max) {
    return std::uniform_real_distribution<double>(min, max)(rng);
}

int ElementSetSynthesizer::uniformInt(int min, int max) {
    return std::uniform_int_distribution<int>(min, max)(rng);
}

double ElementSetSynthesizer::sampleBands(const std::vector<Band> &bands) {
    double r = uniform(0.0, 1.0);
    double cumulative = 0.0;
    for (const auto &band : bands) {
        cumulative += band.probability;
        if (r <= cumulative) {
            return uniform(band.min, band.max);
        }
    }
    // Rounding left the cumulative sum just short of 1
    const auto &last = bands.back();
    return uniform(last.min, last.max);
}

OrbitParameters ElementSetSynthesizer::realisticParameters() {
    double altitude = sampleBands(ALTITUDE_BANDS);
    double inclination = sampleBands(INCLINATION_BANDS);

    // Drag circularizes the lower orbits
    double maxEccentricity = 0.02;
    if (altitude < 400.0) {
        maxEccentricity = 0.003;
    } else if (altitude < 800.0) {
        maxEccentricity = 0.01;
    }

    return OrbitParameters{
        .altitudeKm = altitude,
        .inclinationDeg = inclination,
        .eccentricity = uniform(0.0001, maxEccentricity),
        .raanDeg = uniform(0.0, 360.0),
        .argpDeg = uniform(0.0, 360.0),
        .meanAnomalyDeg = uniform(0.0, 360.0)
    };
}

double ElementSetSynthesizer::dragTermFor(double altitudeKm) {
    double exponent = altitudeKm < 400.0 ? -5.0 : (altitudeKm < 800.0 ? -6.0 : -7.0);
    double magnitude = std::pow(10.0, uniform(exponent, exponent + 1.0));
    return uniform(0.0, 1.0) < 0.5 ? magnitude : -magnitude;
}

ElementSet ElementSetSynthesizer::synthesize(const OrbitParameters &orbit, time_point epoch) {
    ElementSet elements{
        .catalogNumber = uniformInt(10000, 99999),
        .classification = 'U',
        .epoch = epoch,
        .altitudeKm = orbit.altitudeKm,
        .inclinationDeg = toColumns(orbit.inclinationDeg, 10000.0),
        .eccentricity = toColumns(orbit.eccentricity, 10000000.0),
        .raanDeg = toAngleColumns(orbit.raanDeg),
        .argpDeg = toAngleColumns(orbit.argpDeg),
        .meanAnomalyDeg = toAngleColumns(orbit.meanAnomalyDeg),
        .meanMotionRevPerDay = meanMotionFromAltitude(orbit.altitudeKm),
        .dragTerm = dragTermFor(orbit.altitudeKm),
        .elementSetNumber = 999,
        .revolutionNumber = uniformInt(1, 5000)
    };
    validate(elements);
    return elements;
}

ElementSet ElementSetSynthesizer::synthesize(const SatelliteConfig &satellite, time_point epoch) {
    OrbitParameters orbit;
    if (uniform(0.0, 1.0) < 0.5) {
        orbit = realisticParameters();
        debug("Using fully random orbit for {}", satellite.name);
    } else {
        orbit = OrbitParameters{
            .altitudeKm = satellite.altitudeKm * uniform(0.9, 1.1),
            .inclinationDeg = satellite.inclinationDeg * uniform(0.95, 1.05),
            .eccentricity = uniform(0.0001, 0.01),
            .raanDeg = uniform(0.0, 360.0),
            .argpDeg = uniform(0.0, 360.0),
            .meanAnomalyDeg = uniform(0.0, 360.0)
        };
        debug("Using configured orbit with variation for {}", satellite.name);
    }

    try {
        auto elements = synthesize(orbit, epoch);
        info("Generated orbit for {}: altitude={:.1f}km, inclination={:.1f}°, eccentricity={:.6f}",
            satellite.name, elements.altitudeKm, elements.inclinationDeg, elements.eccentricity);
        return elements;
    } catch (const ConfigurationError &e) {
        throw ConfigurationError(satellite.name, e.what());
    }
}

}
