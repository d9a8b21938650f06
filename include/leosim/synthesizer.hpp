/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LEOSIM_SYNTHESIZER_HPP
#define __LEOSIM_SYNTHESIZER_HPP

#include <leosim/config.hpp>
#include <leosim/elements.hpp>

#include <optional>
#include <random>
#include <vector>

namespace leosim {

/**
 * A uniform band of a piecewise-uniform distribution.
 */
struct Band {
    double min;
    double max;
    double probability;
};

// Altitude bands (km), weighted towards the crowded 500-800 km shell
extern const std::vector<Band> ALTITUDE_BANDS;

// Inclination bands (deg), including a sun-synchronous peak around 98 deg
extern const std::vector<Band> INCLINATION_BANDS;

/**
 * Shape and orientation of an orbit before it is turned into an element set.
 */
struct OrbitParameters {
    double altitudeKm;
    double inclinationDeg;
    double eccentricity;
    double raanDeg;
    double argpDeg;
    double meanAnomalyDeg;
};

/**
 * Generates randomized, physically plausible element sets.
 *
 * Every generated set is validated and lies on the record column grid, so
 * encode() followed by decode() reproduces its angles and mean motion.
 *
 * Not thread-safe: each instance owns its random engine.
 */
class ElementSetSynthesizer {
public:
    /**
     * @param seed Seed for the random engine. A random device seed is used if absent.
     */
    explicit ElementSetSynthesizer(std::optional<unsigned> seed = std::nullopt);

    /** Samples a value from a piecewise-uniform distribution. */
    double sampleBands(const std::vector<Band> &bands);

    /** Fully random realistic low Earth orbit. */
    OrbitParameters realisticParameters();

    /**
     * Signed drag term whose magnitude grows as the orbit gets lower:
     * [1e-5, 1e-4) below 400 km, [1e-6, 1e-5) below 800 km, [1e-7, 1e-6) above.
     */
    double dragTermFor(double altitudeKm);

    /**
     * Element set for the given orbit with a random catalog number, revolution
     * number and drag term.
     * @throws ConfigurationError if the orbit can't be encoded
     */
    ElementSet synthesize(const OrbitParameters &orbit, time_point epoch);

    /**
     * Element set for a configured satellite. Half of the time the orbit is
     * fully random, otherwise altitude and inclination vary around the
     * configured values by ±10% and ±5%.
     */
    ElementSet synthesize(const SatelliteConfig &satellite, time_point epoch);

private:
    std::mt19937 rng;

    double uniform(double min, double max);
    int uniformInt(int min, int max);
};

}

#endif
