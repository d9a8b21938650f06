/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LEOSIM_REPORT_HPP
#define __LEOSIM_REPORT_HPP

#include <leosim/datastore.hpp>

#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace leosim {

/** ISO-8601 UTC timestamp with millisecond precision. */
std::string toISOString(time_point tp);

/**
 * JSON document holding the stepped records of every satellite:
 * {"satellites": {"NAME": [{"time": ..., "position": [x, y, z], ...}]}}
 */
std::string recordsToJson(const std::map<std::string, std::vector<SimulationRecord>> &records);

/**
 * JSON document holding the full-orbit trajectory of every satellite.
 */
std::string trajectoriesToJson(const std::map<std::string, std::vector<TrajectoryPoint>> &trajectories);

/**
 * Writes a JSON document to a file.
 * @throws std::runtime_error if the file can't be written
 */
void writeJsonFile(const std::string &path, const std::string &json);

/** Table with one row per satellite summarizing a run. */
void printRunSummary(std::ostream &os, const std::map<std::string, std::vector<SimulationRecord>> &records);

/** Table with one row per trajectory point. */
void printTrajectory(std::ostream &os, const std::string &name, const std::vector<TrajectoryPoint> &trajectory);

/** Contents of the store. */
void printStatus(std::ostream &os, const DataStatus &status);

}

#endif
