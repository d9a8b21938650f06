/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LEOSIM_CACHE_HPP
#define __LEOSIM_CACHE_HPP

#include <leosim/datastore.hpp>

#include <optional>
#include <string>
#include <vector>

namespace leosim {

/**
 * Storage for previously generated element sets. A hit is authoritative and
 * skips regeneration.
 */
class ElementSetCache {
public:
    virtual ~ElementSetCache() = default;

    /** Returns nothing on a miss. Never throws. */
    virtual std::optional<std::vector<SatelliteEntry>> load() = 0;

    /** Failures are logged and otherwise ignored. */
    virtual void store(const std::vector<SatelliteEntry> &satellites) = 0;
};

/**
 * Cache kept as a JSON document on disk:
 *
 *   {"satellites": [{"name": ..., "description": ..., "altitude_km": ...,
 *                    "line1": ..., "line2": ..., "epoch": "2025-01-01T00:00:00Z"}]}
 */
class FileElementSetCache : public ElementSetCache {
public:
    explicit FileElementSetCache(std::string path) : path(std::move(path)) {}

    std::optional<std::vector<SatelliteEntry>> load() override;
    void store(const std::vector<SatelliteEntry> &satellites) override;

    const std::string &getPath() const { return path; }

private:
    std::string path;
};

/** Converts a JSON document to satellite entries. @throws ConfigurationError */
std::vector<SatelliteEntry> parseCacheDocument(const std::string &json);

/** Converts satellite entries to a JSON document. */
std::string toCacheDocument(const std::vector<SatelliteEntry> &satellites);

}

#endif
