/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LEOSIM_PROPAGATOR_HPP
#define __LEOSIM_PROPAGATOR_HPP

#include <leosim/coordinates.hpp>
#include <leosim/elements.hpp>

#include <string>

namespace leosim {

/**
 * Inertial state of a satellite plus its sub-satellite point.
 */
struct StateVector {
    Vec3 position;          ///< km, inertial frame
    Vec3 velocity;          ///< km/s, inertial frame
    double latitudeDeg;
    double longitudeDeg;
};

/**
 * The propagation primitive. Implementations are treated as authoritative;
 * callers only sanity check the resulting altitude.
 */
class Propagator {
public:
    virtual ~Propagator() = default;

    /**
     * State of the satellite described by the record at the given time.
     * @throws ConfigurationError if the record can't be decoded
     * @throws ComputeError if the state can't be computed
     */
    virtual StateVector propagate(const EncodedElementRecord &record, time_point tp) const = 0;
};

/**
 * Analytical two-body propagator with J2 secular drift of the node and
 * perigee. Semi-major axis is recovered from the mean motion with the same
 * constants used to encode it, so circular orbits keep their altitude.
 */
class KeplerPropagator : public Propagator {
public:
    StateVector propagate(const EncodedElementRecord &record, time_point tp) const override;

    StateVector propagate(const ElementSet &elements, time_point tp) const;
};

/**
 * Solves Kepler's equation M = E - e sin(E) for the eccentric anomaly.
 * @throws ComputeError if Newton's method doesn't converge
 */
double solveKepler(double meanAnomaly, double eccentricity);

/**
 * One sample of a trajectory. Immutable once produced.
 */
struct TrajectoryPoint {
    Vec3 position;              ///< km
    Vec3 velocity;              ///< km/s
    double altitudeKm;
    double speedKmS;
    double latitudeDeg;
    double longitudeDeg;
    time_point time;
    double elapsedSeconds;      ///< Seconds since the start of the trajectory
};

/**
 * Turns the raw propagation primitive into trajectory points and keeps
 * positions within a tolerance band of the target altitude.
 */
class TrajectoryPropagator {
public:
    explicit TrajectoryPropagator(const Propagator &propagator, double driftToleranceKm = 50.0,
                                  double minimumAltitudeKm = 150.0)
        : propagator(propagator), driftToleranceKm(driftToleranceKm), minimumAltitudeKm(minimumAltitudeKm) {}

    /**
     * Propagates the record to the given time.
     * @param start Start of the trajectory, used for elapsedSeconds
     */
    TrajectoryPoint propagateAt(const EncodedElementRecord &record, time_point tp, time_point start) const;

    TrajectoryPoint propagateAt(const EncodedElementRecord &record, time_point tp) const {
        return propagateAt(record, tp, tp);
    }

    /**
     * Rescales the position radially onto the target altitude if it drifted
     * further than the tolerance. Direction is preserved; velocity is never
     * touched. Returns the position unchanged otherwise.
     */
    Vec3 correctAltitudeDrift(const Vec3 &position, double targetAltitudeKm) const;

    /**
     * Checks the first position of a run. A deviation from the target beyond
     * the tolerance is only logged.
     * @throws ConfigurationError if the altitude is below the viable minimum
     */
    void validateInitialPosition(const std::string &name, const TrajectoryPoint &point,
                                 double targetAltitudeKm) const;

    double getDriftToleranceKm() const { return driftToleranceKm; }

private:
    const Propagator &propagator;
    double driftToleranceKm;
    double minimumAltitudeKm;
};

}

#endif
