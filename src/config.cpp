/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <leosim/config.hpp>

#include <algorithm>

namespace leosim {

std::vector<SatelliteConfig> defaultFleet() {
    return {
        {"CRTS1", 550.0, 51.6, "CRTS-1 (Cosmic Ray Test Satellite)"},
        {"BULLDOG", 530.0, 52.0, "BULLDOG (Basic Utility Low-orbit Demonstration & Operations Gateway)"}
    };
}

Config::Config()
    : timeSpanHours(2),
      timeStepSeconds(60),
      proximityThresholdKm(5.0),
      lowAltitudeThresholdKm(300.0),
      driftToleranceKm(50.0),
      minimumAltitudeKm(150.0),
      orbitPoints(500),
      verbose(false),
      satellites(defaultFleet()) {}

int Config::getTimeSpanHours() const {
    return timeSpanHours;
}

void Config::setTimeSpanHours(const int hours) {
    timeSpanHours = std::clamp(hours, 1, 48);
}

int Config::getTimeStepSeconds() const {
    return timeStepSeconds;
}

void Config::setTimeStepSeconds(const int seconds) {
    timeStepSeconds = std::clamp(seconds, 1, 3600);
}

double Config::getProximityThresholdKm() const {
    return proximityThresholdKm;
}

void Config::setProximityThresholdKm(const double km) {
    proximityThresholdKm = km > 0.0 ? km : 0.0;
}

double Config::getLowAltitudeThresholdKm() const {
    return lowAltitudeThresholdKm;
}

void Config::setLowAltitudeThresholdKm(const double km) {
    lowAltitudeThresholdKm = km;
}

double Config::getDriftToleranceKm() const {
    return driftToleranceKm;
}

void Config::setDriftToleranceKm(const double km) {
    driftToleranceKm = km > 0.0 ? km : 0.0;
}

double Config::getMinimumAltitudeKm() const {
    return minimumAltitudeKm;
}

void Config::setMinimumAltitudeKm(const double km) {
    minimumAltitudeKm = km;
}

int Config::getOrbitPoints() const {
    return orbitPoints;
}

void Config::setOrbitPoints(const int points) {
    orbitPoints = std::clamp(points, 180, 5000);
}

bool Config::hasSeed() const {
    return seed.has_value();
}

unsigned Config::getSeed() const {
    return seed.value_or(0);
}

void Config::setSeed(const unsigned s) {
    seed = s;
}

void Config::clearSeed() {
    seed.reset();
}

std::string Config::getCacheFile() const {
    return cacheFile;
}

void Config::setCacheFile(const std::string &path) {
    cacheFile = path;
}

bool Config::getVerbose() const {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

void Config::addSatellite(const SatelliteConfig &satellite) {
    removeSatellite(satellite.name);
    satellites.push_back(satellite);
}

void Config::removeSatellite(const std::string &name) {
    std::erase_if(satellites, [&name](const SatelliteConfig &s) { return s.name == name; });
}

void Config::clearSatellites() {
    satellites.clear();
}

std::vector<SatelliteConfig> Config::getSatellites() const {
    return satellites;
}

bool Config::hasSatellites() const {
    return !satellites.empty();
}

}
