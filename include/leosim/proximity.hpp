/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LEOSIM_PROXIMITY_HPP
#define __LEOSIM_PROXIMITY_HPP

#include <leosim/coordinates.hpp>

#include <map>
#include <string>
#include <vector>

namespace leosim {

/**
 * Two satellites closer than the proximity threshold at one instant.
 */
struct ProximityEvent {
    std::string idA;
    std::string idB;
    double distanceKm;
};

/**
 * Checks every unordered pair of the snapshot exactly once and reports the
 * pairs closer than the threshold. idA sorts before idB.
 */
std::vector<ProximityEvent> detectProximity(const std::map<std::string, Vec3> &snapshot, double thresholdKm);

/**
 * Human-readable description of an event as seen from one of its satellites,
 * e.g. "Collision with BULLDOG Dist=3.00km".
 */
std::string describeCollision(const ProximityEvent &event, const std::string &observer);

}

#endif
