/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <leosim/datastore.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

using spdlog::info;

namespace leosim {

namespace {

bool equalsIgnoreCase(const std::string &a, const std::string &b) {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

} // namespace

void DataStore::setSatellite(const SatelliteEntry &entry) {
    std::lock_guard<std::mutex> lock(mutex);
    satellites[entry.name] = entry;
}

SatelliteEntry DataStore::getSatellite(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = satellites.find(name);
    if (it == satellites.end()) {
        throw MissingDataError("Unknown satellite: " + name);
    }
    return it->second;
}

std::vector<SatelliteEntry> DataStore::getSatellites() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<SatelliteEntry> result;
    result.reserve(satellites.size());
    for (const auto &[name, entry] : satellites) {
        result.push_back(entry);
    }
    return result;
}

bool DataStore::hasSatellite(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex);
    return satellites.contains(name);
}

std::optional<SatelliteEntry> DataStore::findSatellite(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto &[key, entry] : satellites) {
        if (equalsIgnoreCase(key, name)) {
            return entry;
        }
    }
    return std::nullopt;
}

void DataStore::setRecords(const std::string &name, std::vector<SimulationRecord> data) {
    std::lock_guard<std::mutex> lock(mutex);
    info("Stored {} simulation records for {}", data.size(), name);
    records[name] = std::move(data);
}

std::vector<SimulationRecord> DataStore::getRecords(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = records.find(name);
    if (it == records.end() || it->second.empty()) {
        throw MissingDataError("No simulation data available for " + name);
    }
    return it->second;
}

std::map<std::string, std::vector<SimulationRecord>> DataStore::getAllRecords() const {
    std::lock_guard<std::mutex> lock(mutex);
    if (records.empty()) {
        throw MissingDataError("No simulation data available, the simulation needs to be run");
    }
    return records;
}

void DataStore::setTrajectory(const std::string &name, std::vector<TrajectoryPoint> trajectory) {
    std::lock_guard<std::mutex> lock(mutex);
    info("Stored {} trajectory points for {}", trajectory.size(), name);
    trajectories[name] = std::move(trajectory);
}

std::vector<TrajectoryPoint> DataStore::getTrajectory(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = trajectories.find(name);
    if (it == trajectories.end() || it->second.empty()) {
        throw MissingDataError("No orbit data available for " + name);
    }
    return it->second;
}

std::map<std::string, std::vector<TrajectoryPoint>> DataStore::getAllTrajectories() const {
    std::lock_guard<std::mutex> lock(mutex);
    if (trajectories.empty()) {
        throw MissingDataError("No orbit data available");
    }
    return trajectories;
}

SimulationRecord DataStore::latestTelemetry(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = records.find(name);
    if (it == records.end() || it->second.empty()) {
        throw MissingDataError("No telemetry available for " + name);
    }
    return it->second.back();
}

DataStatus DataStore::status() const {
    std::lock_guard<std::mutex> lock(mutex);
    DataStatus status;
    for (const auto &[name, entry] : satellites) {
        status.satellites.push_back(name);
    }
    for (const auto &[name, data] : records) {
        status.recordCounts[name] = data.size();
    }
    for (const auto &[name, data] : trajectories) {
        status.trajectoryCounts[name] = data.size();
    }
    status.hasSatellites = !satellites.empty();
    status.hasRecords = !records.empty();
    status.hasTrajectories = !trajectories.empty();
    return status;
}

void DataStore::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    satellites.clear();
    records.clear();
    trajectories.clear();
    info("Cleared all data from the data store");
}

void DataStore::clearResults() {
    std::lock_guard<std::mutex> lock(mutex);
    records.clear();
    trajectories.clear();
}

}
