/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LEOSIM_CONFIG_HPP
#define __LEOSIM_CONFIG_HPP

#include <optional>
#include <string>
#include <vector>

namespace leosim {

/**
 * A satellite of the simulated fleet with its nominal orbit.
 */
struct SatelliteConfig {
    std::string name;
    double altitudeKm;
    double inclinationDeg;
    std::string description;
};

/**
 * The two satellites flown when no fleet is configured.
 */
std::vector<SatelliteConfig> defaultFleet();

class Config {
public:
    Config();
    ~Config() = default;

    int getTimeSpanHours() const;
    void setTimeSpanHours(const int hours);

    int getTimeStepSeconds() const;
    void setTimeStepSeconds(const int seconds);

    double getProximityThresholdKm() const;
    void setProximityThresholdKm(const double km);

    double getLowAltitudeThresholdKm() const;
    void setLowAltitudeThresholdKm(const double km);

    double getDriftToleranceKm() const;
    void setDriftToleranceKm(const double km);

    double getMinimumAltitudeKm() const;
    void setMinimumAltitudeKm(const double km);

    int getOrbitPoints() const;
    void setOrbitPoints(const int points);

    bool hasSeed() const;
    unsigned getSeed() const;
    void setSeed(const unsigned seed);
    void clearSeed();

    std::string getCacheFile() const;
    void setCacheFile(const std::string &path);

    bool getVerbose() const;
    void setVerbose(bool);

    void addSatellite(const SatelliteConfig &satellite);
    void removeSatellite(const std::string &name);
    void clearSatellites();
    std::vector<SatelliteConfig> getSatellites() const;
    bool hasSatellites() const;

private:
    int timeSpanHours;
    int timeStepSeconds;
    double proximityThresholdKm;
    double lowAltitudeThresholdKm;
    double driftToleranceKm;
    double minimumAltitudeKm;
    int orbitPoints;
    std::optional<unsigned> seed;
    std::string cacheFile;
    bool verbose;
    std::vector<SatelliteConfig> satellites;
};

}

#endif
