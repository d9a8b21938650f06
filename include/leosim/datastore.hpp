/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LEOSIM_DATASTORE_HPP
#define __LEOSIM_DATASTORE_HPP

#include <leosim/elements.hpp>
#include <leosim/propagator.hpp>
#include <leosim/telemetry.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace leosim {

/**
 * A satellite of the fleet with the element set it flies.
 */
struct SatelliteEntry {
    std::string name;
    std::string description;
    ElementSet elements;
    EncodedElementRecord record;

    /** Altitude the drift correction pulls the satellite back to. */
    double targetAltitudeKm() const { return elements.altitudeKm; }
};

/**
 * Full observation of one satellite at one step of a run.
 */
struct SimulationRecord {
    time_point time;
    Vec3 position;                      ///< km, after drift correction
    Vec3 velocity;                      ///< km/s
    double altitudeKm;
    double speedKmS;
    std::vector<std::string> collisions;
    double batteryPct;
    double temperatureC;
    Orientation orientation;
    std::vector<Anomaly> anomalies;
};

/**
 * Summary of what the store currently holds.
 */
struct DataStatus {
    std::vector<std::string> satellites;
    std::map<std::string, std::size_t> recordCounts;
    std::map<std::string, std::size_t> trajectoryCounts;
    bool hasSatellites = false;
    bool hasRecords = false;
    bool hasTrajectories = false;
};

/**
 * In-memory results of the engine, keyed by satellite name.
 *
 * Every accessor returns a copy. A miss is reported with MissingDataError,
 * never with an empty or default result.
 */
class DataStore {
public:
    void setSatellite(const SatelliteEntry &entry);
    SatelliteEntry getSatellite(const std::string &name) const;
    std::vector<SatelliteEntry> getSatellites() const;
    bool hasSatellite(const std::string &name) const;

    /** Looks a satellite up ignoring case. */
    std::optional<SatelliteEntry> findSatellite(const std::string &name) const;

    void setRecords(const std::string &name, std::vector<SimulationRecord> records);
    std::vector<SimulationRecord> getRecords(const std::string &name) const;

    /**
     * Records of every satellite.
     * @throws MissingDataError if no run has been stored
     */
    std::map<std::string, std::vector<SimulationRecord>> getAllRecords() const;

    void setTrajectory(const std::string &name, std::vector<TrajectoryPoint> trajectory);
    std::vector<TrajectoryPoint> getTrajectory(const std::string &name) const;
    std::map<std::string, std::vector<TrajectoryPoint>> getAllTrajectories() const;

    /**
     * Last stepped record of a satellite.
     * @throws MissingDataError if the satellite has no records
     */
    SimulationRecord latestTelemetry(const std::string &name) const;

    DataStatus status() const;

    /** Removes everything, satellites included. */
    void clear();

    /** Removes records and trajectories but keeps the satellites. */
    void clearResults();

private:
    mutable std::mutex mutex;
    std::map<std::string, SatelliteEntry> satellites;
    std::map<std::string, std::vector<SimulationRecord>> records;
    std::map<std::string, std::vector<TrajectoryPoint>> trajectories;
};

}

#endif
