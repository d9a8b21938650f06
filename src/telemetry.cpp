/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <leosim/telemetry.hpp>
#include <leosim/errors.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace leosim {

namespace {

constexpr double TWO_PI = 2.0 * std::numbers::pi;
constexpr double ECLIPSE_START = 0.7 * std::numbers::pi;
constexpr double ECLIPSE_END = 1.3 * std::numbers::pi;

// Exponential relaxation rate of the temperature gap (1/hour)
constexpr double THERMAL_RATE_PER_HOUR = 0.6;

// Attitude stays nominal while the battery holds at least this charge (%)
constexpr double STABLE_BATTERY = 40.0;

double roundToTenth(double value) {
    return std::round(value * 10.0) / 10.0;
}

} // namespace

std::string_view toString(Anomaly anomaly) {
    switch (anomaly) {
        case Anomaly::LowBattery: return "LowBattery";
        case Anomaly::CriticalBattery: return "CriticalBattery";
        case Anomaly::Overheat: return "Overheat";
        case Anomaly::Overcool: return "Overcool";
        case Anomaly::AttitudeError: return "AttitudeError";
        case Anomaly::LowAltitude: return "LowAltitude";
    }
    return "Unknown";
}

std::vector<Anomaly> evaluateAnomalies(double batteryPct, double temperatureC, const Orientation &orientation) {
    std::vector<Anomaly> anomalies;
    if (batteryPct < 20.0) anomalies.push_back(Anomaly::LowBattery);
    if (batteryPct < 10.0) anomalies.push_back(Anomaly::CriticalBattery);
    if (temperatureC > 50.0) anomalies.push_back(Anomaly::Overheat);
    if (temperatureC < -40.0) anomalies.push_back(Anomaly::Overcool);
    if (std::abs(orientation.pitchDeg) > 5.0 || std::abs(orientation.rollDeg) > 5.0) {
        anomalies.push_back(Anomaly::AttitudeError);
    }
    return anomalies;
}

bool isEclipsePhase(double phaseRad) {
    return phaseRad >= ECLIPSE_START && phaseRad < ECLIPSE_END;
}

TelemetrySynthesizer::TelemetrySynthesizer(std::optional<unsigned> seed)
    : rng(seed.has_value() ? *seed : std::random_device{}()) {}

double TelemetrySynthesizer::uniform(double min, double max) {
    return std::uniform_real_distribution<double>(min, max)(rng);
}

TelemetrySample TelemetrySynthesizer::step(std::size_t index, double stepSeconds, double periodSeconds) {
    if (stepSeconds <= 0.0 || periodSeconds <= 0.0) {
        throw ComputeError("Telemetry step and orbital period must be positive");
    }

    double hours = stepSeconds / 3600.0;

    current.orbitPhaseRad = std::fmod(current.orbitPhaseRad + TWO_PI * stepSeconds / periodSeconds, TWO_PI);
    bool wasInEclipse = current.inEclipse;
    current.inEclipse = isEclipsePhase(current.orbitPhaseRad);
    if (current.inEclipse != wasInEclipse) {
        current.lastTransitionIndex = index;
    }

    double drain = (current.inEclipse ? ECLIPSE_DRAIN_RATE : SUNLIT_DRAIN_RATE) * hours;
    current.batteryPct = std::clamp(current.batteryPct - drain, BATTERY_MIN, BATTERY_MAX);

    double target = (current.inEclipse ? ECLIPSE_TEMPERATURE : SUNLIT_TEMPERATURE) + uniform(-2.0, 2.0);
    double rate = 1.0 - std::exp(-THERMAL_RATE_PER_HOUR * hours);
    current.temperatureC += (target - current.temperatureC) * rate;

    double stability = std::min(1.0, current.batteryPct / STABLE_BATTERY);
    Orientation orientation{
        .yawDeg = roundToTenth(uniform(-2.0, 2.0) / stability),
        .pitchDeg = roundToTenth(uniform(-1.0, 1.0) / stability),
        .rollDeg = roundToTenth(uniform(-1.0, 1.0) / stability)
    };

    return TelemetrySample{
        .batteryPct = roundToTenth(current.batteryPct),
        .temperatureC = roundToTenth(current.temperatureC),
        .orientation = orientation,
        .anomalies = evaluateAnomalies(current.batteryPct, current.temperatureC, orientation)
    };
}

}
