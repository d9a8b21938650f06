/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LEOSIM_ERRORS_HPP
#define __LEOSIM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace leosim {

/**
 * Base exception class for simulation errors.
 */
class SimulationError : public std::runtime_error {
public:
    explicit SimulationError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Thrown when orbital parameters are physically impossible or can't be encoded.
 * Always fatal for a run.
 */
class ConfigurationError : public SimulationError {
public:
    explicit ConfigurationError(const std::string& msg) : SimulationError(msg) {}

    ConfigurationError(const std::string& satellite, const std::string& msg)
        : SimulationError("Satellite " + satellite + ": " + msg), satellite_(satellite) {}

    /** Name of the offending satellite, empty if unknown. */
    const std::string& satellite() const noexcept { return satellite_; }

private:
    std::string satellite_;
};

/**
 * Thrown when requested results haven't been computed yet.
 */
class MissingDataError : public SimulationError {
public:
    explicit MissingDataError(const std::string& msg) : SimulationError(msg) {}
};

/**
 * Thrown when a single propagation or telemetry computation fails.
 */
class ComputeError : public SimulationError {
public:
    explicit ComputeError(const std::string& msg) : SimulationError(msg) {}
};

}

#endif
