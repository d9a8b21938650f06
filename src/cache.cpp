/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <leosim/cache.hpp>
#include <spdlog/spdlog.h>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <date/date.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using spdlog::info;
using spdlog::error;

namespace fs = std::filesystem;

namespace leosim {

namespace {

constexpr const char *EPOCH_FORMAT = "%FT%TZ";

std::string getString(const rapidjson::Value &value, const char *member) {
    if (!value.HasMember(member) || !value[member].IsString()) {
        throw ConfigurationError(std::string("Cache entry is missing ") + member);
    }
    return value[member].GetString();
}

} // namespace

std::vector<SatelliteEntry> parseCacheDocument(const std::string &json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    if (doc.HasParseError() || !doc.IsObject()) {
        throw ConfigurationError("Cache is not a valid JSON document");
    }
    if (!doc.HasMember("satellites") || !doc["satellites"].IsArray()) {
        throw ConfigurationError("Cache has no satellites");
    }

    std::vector<SatelliteEntry> satellites;
    for (const auto &item : doc["satellites"].GetArray()) {
        if (!item.IsObject()) {
            throw ConfigurationError("Cache entry is not an object");
        }

        SatelliteEntry entry{
            .name = getString(item, "name"),
            .description = item.HasMember("description") && item["description"].IsString()
                ? item["description"].GetString() : "",
            .record = {getString(item, "line1"), getString(item, "line2")}
        };
        entry.elements = decode(entry.record);

        // The stored epoch keeps sub-tick precision the record columns drop
        std::istringstream in(getString(item, "epoch"));
        time_point epoch;
        in >> date::parse(EPOCH_FORMAT, epoch);
        if (in.fail()) {
            throw ConfigurationError("Cache entry for " + entry.name + " has an invalid epoch");
        }
        entry.elements.epoch = epoch;

        if (item.HasMember("altitude_km") && item["altitude_km"].IsNumber()) {
            entry.elements.altitudeKm = item["altitude_km"].GetDouble();
        }
        satellites.push_back(std::move(entry));
    }

    if (satellites.empty()) {
        throw ConfigurationError("Cache has no satellites");
    }
    return satellites;
}

std::string toCacheDocument(const std::vector<SatelliteEntry> &satellites) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("satellites");
    writer.StartArray();
    for (const auto &entry : satellites) {
        writer.StartObject();
        writer.Key("name");
        writer.String(entry.name.c_str());
        writer.Key("description");
        writer.String(entry.description.c_str());
        writer.Key("altitude_km");
        writer.Double(entry.elements.altitudeKm);
        writer.Key("line1");
        writer.String(entry.record.line1.c_str());
        writer.Key("line2");
        writer.String(entry.record.line2.c_str());
        writer.Key("epoch");
        writer.String(date::format(EPOCH_FORMAT, entry.elements.epoch).c_str());
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();

    return buffer.GetString();
}

std::optional<std::vector<SatelliteEntry>> FileElementSetCache::load() {
    if (path.empty() || !fs::exists(path)) {
        return std::nullopt;
    }

    try {
        std::ifstream file(path);
        if (!file) {
            throw std::runtime_error("Couldn't open " + path);
        }
        std::stringstream contents;
        contents << file.rdbuf();

        auto satellites = parseCacheDocument(contents.str());
        info("Loaded cached orbit data for {} satellites", satellites.size());
        return satellites;
    } catch (const std::exception &e) {
        error("Error loading cached orbit data: {}", e.what());
        return std::nullopt;
    }
}

void FileElementSetCache::store(const std::vector<SatelliteEntry> &satellites) {
    if (path.empty()) {
        return;
    }

    try {
        auto parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Couldn't open " + path + " for writing");
        }
        file << toCacheDocument(satellites) << std::endl;
        info("Cached orbit data for {} satellites", satellites.size());
    } catch (const std::exception &e) {
        error("Error caching orbit data: {}", e.what());
    }
}

}
