/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LEOSIM_SIMULATION_HPP
#define __LEOSIM_SIMULATION_HPP

#include <leosim/cache.hpp>
#include <leosim/config.hpp>
#include <leosim/datastore.hpp>
#include <leosim/propagator.hpp>
#include <leosim/synthesizer.hpp>
#include <leosim/task.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace leosim {

/**
 * State shared between the engine and its readers.
 */
struct SimulationContext {
    DataStore store;
    BackgroundTask initialization;
};

/**
 * Closed time grid start, start + step, ... up to and including start + span.
 * Holds floor(span / step) + 1 ticks.
 * @throws ComputeError if the step isn't positive or the span is negative
 */
std::vector<time_point> buildTimeGrid(time_point start, double spanSeconds, double stepSeconds);

/**
 * Drives a simulation of the configured fleet.
 *
 * A run has two phases. Setup obtains the element sets, checks that every
 * satellite starts at a viable altitude and generates the full-orbit
 * trajectories; any failure there aborts the run. The stepped phase then
 * walks the time grid, and a failure for one satellite at one tick only drops
 * that record.
 */
class Simulation {
public:
    explicit Simulation(Config config,
                        std::unique_ptr<Propagator> propagator = std::make_unique<KeplerPropagator>(),
                        std::unique_ptr<ElementSetCache> cache = nullptr);
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /**
     * Fills the store with one element set per configured satellite. A cache
     * hit is used as is unless forceNew is set; otherwise the sets are
     * synthesized with the given epoch and written back to the cache.
     * @throws ConfigurationError if a set can't be synthesized
     */
    std::vector<SatelliteEntry> initializeSatellites(bool forceNew, time_point epoch);

    /**
     * Generates and stores the full-orbit trajectory of every satellite.
     * @throws MissingDataError if no satellites have been initialized
     */
    void generateOrbitData();

    /**
     * Runs the configured span starting at the given time and stores the
     * records. Satellites are initialized first if the store has none.
     * Results of earlier runs are discarded.
     * @throws ConfigurationError if setup fails
     * @throws SimulationError if another run is in progress
     */
    std::map<std::string, std::vector<SimulationRecord>> run(time_point start);

    /**
     * Initializes the satellites and their orbit data on a worker thread.
     * @return false if an initialization or a run is already in progress
     */
    bool startBackgroundInitialization(bool forceNew);

    TaskStatus backgroundStatus() const;
    std::string backgroundError() const;
    void waitForBackground();

    DataStore &store() { return context.store; }
    const DataStore &store() const { return context.store; }


private:
    Config config;
    std::unique_ptr<Propagator> propagator;
    std::unique_ptr<ElementSetCache> cache;
    TrajectoryPropagator trajectoryPropagator;
    ElementSetSynthesizer synthesizer;
    std::mutex initMutex;
    std::mutex runMutex;
    bool running = false;
    SimulationContext context;

    void validateSetup(const std::vector<SatelliteEntry> &satellites, time_point start) const;
};

}

#endif
