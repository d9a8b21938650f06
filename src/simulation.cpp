/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <leosim/simulation.hpp>
#include <leosim/proximity.hpp>
#include <leosim/sampler.hpp>
#include <leosim/telemetry.hpp>
#include <spdlog/spdlog.h>

#include <date/date.h>

#include <cmath>

using spdlog::debug;
using spdlog::info;
using spdlog::error;

namespace leosim {

namespace {

std::optional<unsigned> seedFor(const Config &config, unsigned offset) {
    if (!config.hasSeed()) {
        return std::nullopt;
    }
    return config.getSeed() + offset;
}

std::string formatTime(time_point tp) {
    return date::format("%F %T UTC", std::chrono::floor<std::chrono::seconds>(tp));
}

// Marks a run as in progress for the lifetime of the scope
class RunScope {
public:
    RunScope(std::mutex &mutex, bool &running) : mutex(mutex), running(running) {
        std::lock_guard<std::mutex> lock(mutex);
        if (running) {
            throw SimulationError("A simulation run is already in progress");
        }
        running = true;
    }

    ~RunScope() {
        std::lock_guard<std::mutex> lock(mutex);
        running = false;
    }

    RunScope(const RunScope&) = delete;
    RunScope& operator=(const RunScope&) = delete;

private:
    std::mutex &mutex;
    bool &running;
};

} // namespace

std::vector<time_point> buildTimeGrid(time_point start, double spanSeconds, double stepSeconds) {
    if (stepSeconds <= 0.0) {
        throw ComputeError("Time step must be positive");
    }
    if (spanSeconds < 0.0) {
        throw ComputeError("Time span must not be negative");
    }

    auto ticks = static_cast<std::size_t>(std::floor(spanSeconds / stepSeconds + 1e-9)) + 1;
    std::vector<time_point> grid;
    grid.reserve(ticks);
    for (std::size_t i = 0; i < ticks; ++i) {
        grid.push_back(start + fromSeconds(static_cast<double>(i) * stepSeconds));
    }
    return grid;
}

Simulation::Simulation(Config config, std::unique_ptr<Propagator> propagator, std::unique_ptr<ElementSetCache> cache)
    : config(std::move(config)),
      propagator(std::move(propagator)),
      cache(std::move(cache)),
      trajectoryPropagator(*this->propagator, this->config.getDriftToleranceKm(), this->config.getMinimumAltitudeKm()),
      synthesizer(seedFor(this->config, 0)) {}

Simulation::~Simulation() {
    waitForBackground();
}

std::vector<SatelliteEntry> Simulation::initializeSatellites(bool forceNew, time_point epoch) {
    std::lock_guard<std::mutex> lock(initMutex);

    if (!forceNew && cache) {
        auto cached = cache->load();
        if (cached.has_value()) {
            info("Using cached orbit data");
            for (const auto &entry : *cached) {
                context.store.setSatellite(entry);
            }
            return *cached;
        }
    }

    if (!config.hasSatellites()) {
        throw ConfigurationError("No satellites configured");
    }

    if (forceNew) {
        context.store.clear();
        info("Cleared existing simulation data for fresh generation");
    }

    std::vector<SatelliteEntry> satellites;
    for (const auto &satellite : config.getSatellites()) {
        SatelliteEntry entry{
            .name = satellite.name,
            .description = satellite.description,
            .elements = synthesizer.synthesize(satellite, epoch)
        };
        entry.record = encode(entry.elements);

        info("Generated {} element record:", entry.name);
        info("  {}", entry.record.line1);
        info("  {}", entry.record.line2);
        satellites.push_back(std::move(entry));
    }

    for (const auto &entry : satellites) {
        context.store.setSatellite(entry);
    }
    if (cache) {
        cache->store(satellites);
    }
    return satellites;
}

void Simulation::generateOrbitData() {
    auto satellites = context.store.getSatellites();
    if (satellites.empty()) {
        throw MissingDataError("No satellites have been initialized");
    }

    for (const auto &entry : satellites) {
        try {
            auto trajectory = fullOrbitTrajectory(trajectoryPropagator, entry.elements, entry.record,
                config.getOrbitPoints());
            context.store.setTrajectory(entry.name, std::move(trajectory));
        } catch (const ConfigurationError &) {
            throw;
        } catch (const std::exception &e) {
            throw ConfigurationError(entry.name, std::string("failed to generate orbit data: ") + e.what());
        }
    }
}

void Simulation::validateSetup(const std::vector<SatelliteEntry> &satellites, time_point start) const {
    for (const auto &entry : satellites) {
        TrajectoryPoint point{};
        try {
            // Catches records that were altered after they were generated
            decode(entry.record);
            point = trajectoryPropagator.propagateAt(entry.record, start);
        } catch (const ConfigurationError &e) {
            throw ConfigurationError(entry.name, e.what());
        } catch (const std::exception &e) {
            error("Error calculating initial position for {}: {}", entry.name, e.what());
            throw ConfigurationError(entry.name, std::string("failed to calculate initial position: ") + e.what());
        }

        info("{} at start: altitude={:.1f}km (expected {:.1f}km)",
            entry.name, point.altitudeKm, entry.targetAltitudeKm());
        info("  Position: [{:.1f}, {:.1f}, {:.1f}] km", point.position.x, point.position.y, point.position.z);
        info("  Velocity: {:.1f} km/s", point.speedKmS);

        trajectoryPropagator.validateInitialPosition(entry.name, point, entry.targetAltitudeKm());
    }
}

std::map<std::string, std::vector<SimulationRecord>> Simulation::run(time_point start) {
    // Background starts are refused from here on, so the fleet can't change under the run
    RunScope scope(runMutex, running);
    waitForBackground();

    auto satellites = context.store.getSatellites();
    if (satellites.empty()) {
        satellites = initializeSatellites(false, start);
    }

    auto spanSeconds = config.getTimeSpanHours() * 3600.0;
    auto stepSeconds = static_cast<double>(config.getTimeStepSeconds());
    auto grid = buildTimeGrid(start, spanSeconds, stepSeconds);
    info("Running simulation from {} for {} hours with {}s steps ({} steps)",
        formatTime(start), config.getTimeSpanHours(), config.getTimeStepSeconds(), grid.size());

    // Setup
    context.store.clearResults();
    validateSetup(satellites, start);
    generateOrbitData();

    std::map<std::string, TelemetrySynthesizer> telemetry;
    std::map<std::string, std::vector<SimulationRecord>> records;
    for (std::size_t i = 0; i < satellites.size(); ++i) {
        telemetry.emplace(satellites[i].name, TelemetrySynthesizer(seedFor(config, static_cast<unsigned>(i) + 1)));
        records[satellites[i].name].reserve(grid.size());
    }

    // Stepped run
    for (std::size_t i = 0; i < grid.size(); ++i) {
        auto t = grid[i];

        std::map<std::string, TrajectoryPoint> points;
        std::map<std::string, Vec3> snapshot;
        for (const auto &entry : satellites) {
            try {
                auto point = trajectoryPropagator.propagateAt(entry.record, t, start);
                point.position = trajectoryPropagator.correctAltitudeDrift(point.position, entry.targetAltitudeKm());
                point.altitudeKm = altitudeOf(point.position);
                snapshot[entry.name] = point.position;
                points.emplace(entry.name, point);
            } catch (const std::exception &e) {
                error("Error during position calculation for {} at {}: {}", entry.name, formatTime(t), e.what());
            }
        }

        // Every position of this tick is known before pairs are compared
        auto events = detectProximity(snapshot, config.getProximityThresholdKm());
        for (const auto &event : events) {
            debug("{} and {} are {:.2f}km apart at {}", event.idA, event.idB, event.distanceKm, formatTime(t));
        }

        for (const auto &entry : satellites) {
            auto found = points.find(entry.name);
            if (found == points.end()) {
                continue;
            }
            const auto &point = found->second;

            try {
                auto sample = telemetry.at(entry.name).step(i, stepSeconds, entry.elements.periodSeconds());

                std::vector<std::string> collisions;
                for (const auto &event : events) {
                    if (event.idA == entry.name || event.idB == entry.name) {
                        collisions.push_back(describeCollision(event, entry.name));
                    }
                }

                auto anomalies = std::move(sample.anomalies);
                if (point.altitudeKm < config.getLowAltitudeThresholdKm()) {
                    anomalies.push_back(Anomaly::LowAltitude);
                }

                records[entry.name].push_back(SimulationRecord{
                    .time = t,
                    .position = point.position,
                    .velocity = point.velocity,
                    .altitudeKm = point.altitudeKm,
                    .speedKmS = point.speedKmS,
                    .collisions = std::move(collisions),
                    .batteryPct = sample.batteryPct,
                    .temperatureC = sample.temperatureC,
                    .orientation = sample.orientation,
                    .anomalies = std::move(anomalies)
                });
            } catch (const std::exception &e) {
                error("Error generating telemetry for {} at {}: {}", entry.name, formatTime(t), e.what());
            }
        }
    }

    std::size_t total = 0;
    for (const auto &[name, data] : records) {
        context.store.setRecords(name, data);
        total += data.size();
    }
    info("Built simulation data: {} total data points", total);

    return records;
}

bool Simulation::startBackgroundInitialization(bool forceNew) {
    std::lock_guard<std::mutex> lock(runMutex);
    if (running) {
        info("Background initialization refused while a simulation is running");
        return false;
    }

    bool started = context.initialization.start([this, forceNew] {
        initializeSatellites(forceNew, std::chrono::system_clock::now());
        generateOrbitData();
    });
    if (started) {
        info("Started background initialization");
    } else {
        info("Background initialization is already running");
    }
    return started;
}

TaskStatus Simulation::backgroundStatus() const {
    return context.initialization.status();
}

std::string Simulation::backgroundError() const {
    return context.initialization.error();
}

void Simulation::waitForBackground() {
    context.initialization.wait();
}

}
