/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <leosim.hpp>
#include <CLI/CLI.hpp>
#include <date/date.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <stdexcept>
#include <thread>
#include <vector>

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** Parse a UTC time in YYYY-MM-DD HH:MM:SS format */
leosim::time_point parseTime(const std::string &timeStr) {
    std::istringstream in(timeStr);
    leosim::time_point tp;
    in >> date::parse("%Y-%m-%d %H:%M:%S", tp);
    if (in.fail()) {
        throw std::invalid_argument("Invalid time format (expected YYYY-MM-DD HH:MM:SS UTC): " + timeStr);
    }
    return tp;
}

/** Build a simulation backed by the configured element cache */
std::unique_ptr<leosim::Simulation> makeSimulation(const leosim::Config &config) {
    std::unique_ptr<leosim::ElementSetCache> cache;
    if (!config.getCacheFile().empty()) {
        cache = std::make_unique<leosim::FileElementSetCache>(config.getCacheFile());
    }
    return std::make_unique<leosim::Simulation>(config, std::make_unique<leosim::KeplerPropagator>(), std::move(cache));
}

/** Element sets from the cache, or an error telling the user to generate them */
std::vector<leosim::SatelliteEntry> loadCached(const leosim::Config &config) {
    leosim::FileElementSetCache cache(config.getCacheFile());
    auto satellites = cache.load();
    if (!satellites.has_value()) {
        throw leosim::MissingDataError("No element sets in " + config.getCacheFile() + ", run 'leosim generate' first");
    }
    return *satellites;
}

/** Parse a fleet entry in NAME:ALTITUDE_KM:INCLINATION_DEG[:DESCRIPTION] format */
leosim::SatelliteConfig parseSatellite(const std::string &spec) {
    std::vector<std::string> fields;
    std::istringstream in(spec);
    std::string field;
    while (fields.size() < 3 && std::getline(in, field, ':')) {
        fields.push_back(field);
    }
    std::string description;
    std::getline(in, description);

    if (fields.size() < 3 || fields[0].empty()) {
        throw std::invalid_argument("Invalid satellite (expected NAME:ALTITUDE_KM:INCLINATION_DEG[:DESCRIPTION]): " + spec);
    }
    try {
        return leosim::SatelliteConfig{fields[0], std::stod(fields[1]), std::stod(fields[2]), description};
    } catch (const std::logic_error &) {
        throw std::invalid_argument("Invalid satellite altitude or inclination: " + spec);
    }
}

void printRecord(const leosim::SatelliteEntry &entry) {
    std::cout << entry.name << std::endl;
    std::cout << entry.record.line1 << std::endl;
    std::cout << entry.record.line2 << std::endl << std::endl;
}

/** Program entry point */
int main(int argc, char* argv[]) {

    leosim::Config config;
    config.setCacheFile(expandTilde("~/.leosim/orbits.json"));

    auto configFile = expandTilde("~/.leosim.toml");

    CLI::App app{"LEO Satellite Simulator"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_option_function<std::string>("--cache",
        [&config](const std::string &path) { config.setCacheFile(expandTilde(path)); },
        "File used to cache generated element sets")->envname("LEOSIM_CACHE");
    app.add_option_function<unsigned>("--seed",
        [&config](const unsigned seed) { config.setSeed(seed); },
        "Seed for the random generators, for repeatable runs");
    app.add_option_function<int>("--points",
        [&config](const int points) { config.setOrbitPoints(points); },
        "Number of intervals in a full-orbit trajectory (default 500)");
    app.add_option_function<double>("--threshold",
        [&config](const double km) { config.setProximityThresholdKm(km); },
        "Distance below which two satellites are reported as a collision, in km (default 5)");
    app.add_option_function<std::vector<std::string>>("--satellite",
        [&config](const std::vector<std::string> &specs) {
            config.clearSatellites();
            for (const auto &spec : specs) {
                try {
                    config.addSatellite(parseSatellite(spec));
                } catch (const std::invalid_argument &err) {
                    throw CLI::ValidationError("--satellite", err.what());
                }
            }
        },
        "Fly this satellite instead of the default fleet (format: NAME:ALTITUDE_KM:INCLINATION_DEG[:DESCRIPTION])");
    app.add_option_function<std::vector<std::string>>("--exclude",
        [&config](const std::vector<std::string> &names) {
            for (const auto &name : names) {
                config.removeSatellite(name);
            }
        },
        "Leave this satellite out of the fleet");
    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) {
            config.setVerbose(v > 0);
            spdlog::set_level(config.getVerbose() ? spdlog::level::debug : spdlog::level::info);
        },
        "Display debugging information");

    app.ignore_case();

    auto generateCommand = app.add_subcommand("generate", "Generate element sets for the fleet");
    bool force = false;
    generateCommand->add_flag("--force", force, "Regenerate even if cached element sets exist");

    auto tleCommand = app.add_subcommand("tle", "View the cached element records");

    auto infoCommand = app.add_subcommand("info", "View the cached orbital elements");

    auto orbitCommand = app.add_subcommand("orbit", "Display the full-orbit trajectory of a satellite");
    std::string orbitName;
    orbitCommand->add_option("name", orbitName, "Name of the satellite (ie. CRTS1)")->required();

    auto simulateCommand = app.add_subcommand("simulate", "Run the simulation and summarize the results");
    simulateCommand->add_option_function<int>("--hours",
        [&config](const int hours) { config.setTimeSpanHours(hours); },
        "Number of hours to simulate (default 2, max 48)")->envname("SIMULATION_HOURS");
    simulateCommand->add_option_function<int>("--step",
        [&config](const int seconds) { config.setTimeStepSeconds(seconds); },
        "Seconds between simulation steps (default 60)")->envname("TIME_STEP_SECONDS");
    std::string startTime;
    simulateCommand->add_option("--start", startTime, "Start of the simulation (format: YYYY-MM-DD HH:MM:SS UTC)");
    std::string jsonFile;
    simulateCommand->add_option("--json", jsonFile, "Write the simulation records to this JSON file");
    std::string orbitsFile;
    simulateCommand->add_option("--orbits", orbitsFile, "Write the full-orbit trajectories to this JSON file");

    auto statusCommand = app.add_subcommand("status", "Initialize the fleet in the background and report progress");

    // Command callbacks

    generateCommand->final_callback([&config, &force](void) {
        try {
            auto simulation = makeSimulation(config);
            auto satellites = simulation->initializeSatellites(force, std::chrono::system_clock::now());
            for (const auto &entry : satellites) {
                printRecord(entry);
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    tleCommand->final_callback([&config](void) {
        try {
            for (const auto &entry : loadCached(config)) {
                printRecord(entry);
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    infoCommand->final_callback([&config](void) {
        try {
            for (const auto &entry : loadCached(config)) {
                leosim::printInfo(std::cout, entry.name, entry.elements);
                std::cout << "Description:      " << entry.description << std::endl << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    orbitCommand->final_callback([&config, &orbitName](void) {
        try {
            auto simulation = makeSimulation(config);
            simulation->initializeSatellites(false, std::chrono::system_clock::now());
            auto entry = simulation->store().findSatellite(orbitName);
            if (!entry.has_value()) {
                std::cerr << "Satellite " << orbitName << " not found." << std::endl;
                std::exit(1);
            }
            simulation->generateOrbitData();
            leosim::printTrajectory(std::cout, entry->name, simulation->store().getTrajectory(entry->name));
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    simulateCommand->final_callback([&config, &startTime, &jsonFile, &orbitsFile](void) {
        try {
            auto start = startTime.empty() ? std::chrono::system_clock::now() : parseTime(startTime);
            auto simulation = makeSimulation(config);
            auto records = simulation->run(start);

            leosim::printRunSummary(std::cout, records);

            if (!jsonFile.empty()) {
                leosim::writeJsonFile(jsonFile, leosim::recordsToJson(records));
                std::cout << "Wrote simulation records to " << jsonFile << std::endl;
            }
            if (!orbitsFile.empty()) {
                leosim::writeJsonFile(orbitsFile, leosim::trajectoriesToJson(simulation->store().getAllTrajectories()));
                std::cout << "Wrote orbit trajectories to " << orbitsFile << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    statusCommand->final_callback([&config](void) {
        try {
            auto simulation = makeSimulation(config);
            simulation->startBackgroundInitialization(false);

            auto last = leosim::TaskStatus::Idle;
            auto current = simulation->backgroundStatus();
            while (current == leosim::TaskStatus::Running || current != last) {
                if (current != last) {
                    std::cout << "Initialization: " << leosim::toString(current) << std::endl;
                    last = current;
                }
                if (current != leosim::TaskStatus::Running) {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                current = simulation->backgroundStatus();
            }
            simulation->waitForBackground();

            if (simulation->backgroundStatus() == leosim::TaskStatus::Failed) {
                std::cerr << simulation->backgroundError() << std::endl;
                std::exit(1);
            }
            leosim::printStatus(std::cout, simulation->store().status());
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
