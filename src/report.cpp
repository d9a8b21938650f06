/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <leosim/report.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <date/date.h>

#include <algorithm>
#include <fstream>
#include <set>
#include <stdexcept>

namespace leosim {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void writeVector(JsonWriter &writer, const Vec3 &v) {
    writer.StartArray();
    writer.Double(v.x);
    writer.Double(v.y);
    writer.Double(v.z);
    writer.EndArray();
}

void writeRecord(JsonWriter &writer, const SimulationRecord &record) {
    writer.StartObject();
    writer.Key("time");
    writer.String(toISOString(record.time).c_str());
    writer.Key("position");
    writeVector(writer, record.position);
    writer.Key("velocity");
    writeVector(writer, record.velocity);
    writer.Key("altitude_km");
    writer.Double(record.altitudeKm);
    writer.Key("speed_km_s");
    writer.Double(record.speedKmS);
    writer.Key("collisions");
    writer.StartArray();
    for (const auto &collision : record.collisions) {
        writer.String(collision.c_str());
    }
    writer.EndArray();
    writer.Key("battery");
    writer.Double(record.batteryPct);
    writer.Key("temperature");
    writer.Double(record.temperatureC);
    writer.Key("orientation");
    writer.StartObject();
    writer.Key("yaw_deg");
    writer.Double(record.orientation.yawDeg);
    writer.Key("pitch_deg");
    writer.Double(record.orientation.pitchDeg);
    writer.Key("roll_deg");
    writer.Double(record.orientation.rollDeg);
    writer.EndObject();
    writer.Key("anomalies");
    writer.StartArray();
    for (auto anomaly : record.anomalies) {
        auto tag = toString(anomaly);
        writer.String(tag.data(), static_cast<rapidjson::SizeType>(tag.size()));
    }
    writer.EndArray();
    writer.EndObject();
}

void writePoint(JsonWriter &writer, const TrajectoryPoint &point) {
    writer.StartObject();
    writer.Key("time");
    writer.String(toISOString(point.time).c_str());
    writer.Key("time_from_start");
    writer.Double(point.elapsedSeconds);
    writer.Key("position");
    writeVector(writer, point.position);
    writer.Key("velocity");
    writeVector(writer, point.velocity);
    writer.Key("altitude_km");
    writer.Double(point.altitudeKm);
    writer.Key("speed_km_s");
    writer.Double(point.speedKmS);
    writer.Key("latitude");
    writer.Double(point.latitudeDeg);
    writer.Key("longitude");
    writer.Double(point.longitudeDeg);
    writer.EndObject();
}

} // namespace

std::string toISOString(time_point tp) {
    return date::format("%FT%TZ", std::chrono::floor<std::chrono::milliseconds>(tp));
}

std::string recordsToJson(const std::map<std::string, std::vector<SimulationRecord>> &records) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("satellites");
    writer.StartObject();
    for (const auto &[name, data] : records) {
        writer.Key(name.c_str());
        writer.StartArray();
        for (const auto &record : data) {
            writeRecord(writer, record);
        }
        writer.EndArray();
    }
    writer.EndObject();
    writer.EndObject();

    return buffer.GetString();
}

std::string trajectoriesToJson(const std::map<std::string, std::vector<TrajectoryPoint>> &trajectories) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("orbits");
    writer.StartObject();
    for (const auto &[name, points] : trajectories) {
        writer.Key(name.c_str());
        writer.StartArray();
        for (const auto &point : points) {
            writePoint(writer, point);
        }
        writer.EndArray();
    }
    writer.EndObject();
    writer.EndObject();

    return buffer.GetString();
}

void writeJsonFile(const std::string &path, const std::string &json) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Couldn't open " + path + " for writing");
    }
    file << json << std::endl;
}

void printRunSummary(std::ostream &os, const std::map<std::string, std::vector<SimulationRecord>> &records) {
    constexpr std::string_view rowFormat = "{:<12} {:>8} {:>10} {:>10} {:>10} {:>10} {:>11} {:<}";

    os << fmt::format(rowFormat, "Satellite", "Records", "Min Alt", "Max Alt", "Battery", "Temp", "Collisions", "Anomalies")
       << std::endl;
    os << fmt::format(rowFormat, std::string(12, '-'), std::string(8, '-'), std::string(10, '-'), std::string(10, '-'),
                      std::string(10, '-'), std::string(10, '-'), std::string(11, '-'), std::string(20, '-'))
       << std::endl;

    for (const auto &[name, data] : records) {
        if (data.empty()) {
            os << fmt::format(rowFormat, name, 0, "-", "-", "-", "-", "-", "No data") << std::endl;
            continue;
        }

        auto [minIt, maxIt] = std::ranges::minmax_element(data, {}, &SimulationRecord::altitudeKm);
        std::size_t collisions = 0;
        std::set<std::string_view> anomalies;
        for (const auto &record : data) {
            collisions += record.collisions.size();
            for (auto anomaly : record.anomalies) {
                anomalies.insert(toString(anomaly));
            }
        }

        const auto &last = data.back();
        os << fmt::format(rowFormat, name, data.size(),
                          fmt::format("{:.1f}km", minIt->altitudeKm),
                          fmt::format("{:.1f}km", maxIt->altitudeKm),
                          fmt::format("{:.1f}%", last.batteryPct),
                          fmt::format("{:.1f}C", last.temperatureC),
                          collisions,
                          anomalies.empty() ? "None" : fmt::format("{}", fmt::join(anomalies, ", ")))
           << std::endl;
    }
}

void printTrajectory(std::ostream &os, const std::string &name, const std::vector<TrajectoryPoint> &trajectory) {
    constexpr std::string_view rowFormat = "{:>10} {:>10} {:>10} {:>10} {:>10}";

    os << name << " (" << trajectory.size() << " points)" << std::endl;
    os << fmt::format(rowFormat, "Elapsed", "Altitude", "Speed", "Latitude", "Longitude") << std::endl;
    os << fmt::format(rowFormat, std::string(10, '-'), std::string(10, '-'), std::string(10, '-'),
                      std::string(10, '-'), std::string(10, '-')) << std::endl;
    for (const auto &point : trajectory) {
        os << fmt::format("{:>9.1f}s {:>8.1f}km {:>6.3f}km/s {:>10.4f} {:>10.4f}",
                          point.elapsedSeconds, point.altitudeKm, point.speedKmS,
                          point.latitudeDeg, point.longitudeDeg) << std::endl;
    }
}

void printStatus(std::ostream &os, const DataStatus &status) {
    os << "Satellites:   " << (status.hasSatellites ? fmt::format("{}", fmt::join(status.satellites, ", ")) : "none")
       << std::endl;
    for (const auto &name : status.satellites) {
        auto records = status.recordCounts.contains(name) ? status.recordCounts.at(name) : 0;
        auto points = status.trajectoryCounts.contains(name) ? status.trajectoryCounts.at(name) : 0;
        os << fmt::format("  {:<12} {:>6} records {:>6} orbit points", name, records, points) << std::endl;
    }
}

}
