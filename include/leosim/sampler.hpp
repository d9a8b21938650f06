/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LEOSIM_SAMPLER_HPP
#define __LEOSIM_SAMPLER_HPP

#include <leosim/propagator.hpp>

#include <vector>

namespace leosim {

// Smallest number of samples per orbital period for a smooth ground track
constexpr int MIN_POINTS_PER_ORBIT = 180;

/**
 * Chooses the time step for a trajectory.
 *
 * Starts from the base step, shrinks it if the span would hold fewer than
 * minPoints intervals and grows it if it would hold more than maxPoints.
 * Finally the step is shrunk further if an orbital period would hold fewer
 * than MIN_POINTS_PER_ORBIT samples. The density floor wins over maxPoints.
 *
 * @return step in seconds
 * @throws ComputeError if any input is not positive
 */
double chooseStepSeconds(double periodSeconds, double spanSeconds, double baseStepSeconds,
                         int minPoints, int maxPoints);

/**
 * Propagates the record at start, start + step, start + 2 step, ... up to
 * and including end. Points are not drift corrected.
 */
std::vector<TrajectoryPoint> generatePoints(const TrajectoryPropagator &propagator,
                                            const EncodedElementRecord &record,
                                            time_point start, time_point end, double stepSeconds);

/**
 * Trajectory covering exactly one orbital period starting at the epoch of
 * the elements, sampled with the given number of intervals.
 */
std::vector<TrajectoryPoint> fullOrbitTrajectory(const TrajectoryPropagator &propagator,
                                                 const ElementSet &elements,
                                                 const EncodedElementRecord &record,
                                                 int points = 500);

}

#endif
