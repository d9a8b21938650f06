/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <leosim/sampler.hpp>
#include <spdlog/spdlog.h>

#include <cmath>

using spdlog::debug;
using spdlog::info;

namespace leosim {

double chooseStepSeconds(double periodSeconds, double spanSeconds, double baseStepSeconds,
                         int minPoints, int maxPoints) {
    if (periodSeconds <= 0.0 || spanSeconds <= 0.0 || baseStepSeconds <= 0.0 || minPoints <= 0 || maxPoints <= 0) {
        throw ComputeError("Sampling parameters must be positive");
    }

    double step = baseStepSeconds;
    double count = spanSeconds / step;
    if (count < minPoints) {
        step = spanSeconds / minPoints;
    } else if (count > maxPoints) {
        step = spanSeconds / maxPoints;
    }

    if (periodSeconds / step < MIN_POINTS_PER_ORBIT) {
        step = periodSeconds / MIN_POINTS_PER_ORBIT;
    }

    debug("Sampling with step size {:.2f}s ({:.1f} points per orbit)", step, periodSeconds / step);
    return step;
}

std::vector<TrajectoryPoint> generatePoints(const TrajectoryPropagator &propagator,
                                            const EncodedElementRecord &record,
                                            time_point start, time_point end, double stepSeconds) {
    if (stepSeconds <= 0.0) {
        throw ComputeError("Step size must be positive");
    }

    double span = secondsBetween(start, end);
    std::vector<TrajectoryPoint> points;
    if (span < 0.0) {
        return points;
    }

    // Ticks are computed from the start to avoid accumulating rounding error
    auto intervals = static_cast<std::size_t>(std::floor(span / stepSeconds + 1e-9));
    points.reserve(intervals + 1);
    for (std::size_t i = 0; i <= intervals; ++i) {
        time_point tp = start + fromSeconds(static_cast<double>(i) * stepSeconds);
        points.push_back(propagator.propagateAt(record, tp, start));
    }
    return points;
}

std::vector<TrajectoryPoint> fullOrbitTrajectory(const TrajectoryPropagator &propagator,
                                                 const ElementSet &elements,
                                                 const EncodedElementRecord &record,
                                                 int points) {
    double period = elements.periodSeconds();
    double step = chooseStepSeconds(period, period, period / points, points, points);

    auto start = elements.epoch;
    auto end = start + fromSeconds(period);
    auto trajectory = generatePoints(propagator, record, start, end, step);
    info("Generated {} orbit points spanning {:.1f} minutes", trajectory.size(), period / 60.0);
    return trajectory;
}

}
