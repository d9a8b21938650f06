/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LEOSIM_TELEMETRY_HPP
#define __LEOSIM_TELEMETRY_HPP

#include <optional>
#include <random>
#include <string_view>
#include <vector>

namespace leosim {

// Battery limits (%)
constexpr double BATTERY_MIN = 5.0;
constexpr double BATTERY_MAX = 100.0;
constexpr double INITIAL_BATTERY = 80.0;
constexpr double INITIAL_TEMPERATURE = 20.0;

// Battery drain (%/hour)
constexpr double ECLIPSE_DRAIN_RATE = 2.5;
constexpr double SUNLIT_DRAIN_RATE = 0.8;

// Temperatures approached in each illumination state (°C)
constexpr double ECLIPSE_TEMPERATURE = -20.0;
constexpr double SUNLIT_TEMPERATURE = 35.0;

enum class Anomaly {
    LowBattery,
    CriticalBattery,
    Overheat,
    Overcool,
    AttitudeError,
    LowAltitude
};

std::string_view toString(Anomaly anomaly);

struct Orientation {
    double yawDeg = 0.0;
    double pitchDeg = 0.0;
    double rollDeg = 0.0;
};

/**
 * Evolving subsystem state of one satellite.
 */
struct TelemetryState {
    double batteryPct = INITIAL_BATTERY;
    double temperatureC = INITIAL_TEMPERATURE;
    double orbitPhaseRad = 0.0;
    bool inEclipse = false;
    std::size_t lastTransitionIndex = 0;
};

/**
 * Telemetry reported for a single step. Battery and temperature are rounded
 * to a tenth, as are the orientation angles.
 */
struct TelemetrySample {
    double batteryPct;
    double temperatureC;
    Orientation orientation;
    std::vector<Anomaly> anomalies;
};

/**
 * Subsystem anomalies for the given readings. LowAltitude is never reported
 * here since it depends on the trajectory rather than the subsystems.
 */
std::vector<Anomaly> evaluateAnomalies(double batteryPct, double temperatureC, const Orientation &orientation);

/**
 * Returns true if the orbit phase is inside the eclipse window [0.7π, 1.3π).
 */
bool isEclipsePhase(double phaseRad);

/**
 * Synthesizes the telemetry of a single satellite, one step at a time.
 *
 * The orbit phase advances by 2π step/period and is wrapped. Battery drains
 * faster in eclipse, temperature relaxes towards the target of the current
 * illumination state and attitude noise grows as the battery empties.
 *
 * Each satellite needs its own instance since every step depends on the one
 * before it.
 */
class TelemetrySynthesizer {
public:
    explicit TelemetrySynthesizer(std::optional<unsigned> seed = std::nullopt);

    /**
     * Advances the state by one step.
     * @param index Index of the step in the run, recorded on eclipse transitions
     * @throws ComputeError if the step or period isn't positive
     */
    TelemetrySample step(std::size_t index, double stepSeconds, double periodSeconds);

    const TelemetryState &state() const { return current; }

private:
    TelemetryState current;
    std::mt19937 rng;

    double uniform(double min, double max);
};

}

#endif
