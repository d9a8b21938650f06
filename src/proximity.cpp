/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <leosim/proximity.hpp>
#include <spdlog/fmt/fmt.h>

#include <iterator>

namespace leosim {

std::vector<ProximityEvent> detectProximity(const std::map<std::string, Vec3> &snapshot, double thresholdKm) {
    std::vector<ProximityEvent> events;
    for (auto a = snapshot.begin(); a != snapshot.end(); ++a) {
        for (auto b = std::next(a); b != snapshot.end(); ++b) {
            double distance = a->second.distanceTo(b->second);
            if (distance < thresholdKm) {
                events.push_back({a->first, b->first, distance});
            }
        }
    }
    return events;
}

std::string describeCollision(const ProximityEvent &event, const std::string &observer) {
    const auto &other = observer == event.idA ? event.idB : event.idA;
    return fmt::format("Collision with {} Dist={:.2f}km", other, event.distanceKm);
}

}
