/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <leosim/report.hpp>

#include <rapidjson/document.h>

#include <chrono>
#include <sstream>

using namespace std::chrono;

namespace leosim {
namespace {

const time_point START = sys_days{2025y/March/14} + 6h;

SimulationRecord makeRecord(double elapsed, double altitudeKm) {
    return SimulationRecord{
        .time = START + fromSeconds(elapsed),
        .position = {EARTH_RADIUS_KM + altitudeKm, 0.0, 0.0},
        .velocity = {0.0, 7.6, 0.0},
        .altitudeKm = altitudeKm,
        .speedKmS = 7.6,
        .collisions = {},
        .batteryPct = 79.9,
        .temperatureC = 20.2,
        .orientation = {0.5, -0.2, 0.1},
        .anomalies = {}
    };
}

TEST(ReportTest, ISOString) {
    EXPECT_EQ(toISOString(START), "2025-03-14T06:00:00.000Z");
    EXPECT_EQ(toISOString(START + 1500ms), "2025-03-14T06:00:01.500Z");
}

TEST(ReportTest, RecordsToJson) {
    auto collided = makeRecord(60.0, 549.0);
    collided.collisions.push_back("Collision with BULLDOG Dist=3.00km");
    collided.anomalies = {Anomaly::LowBattery, Anomaly::AttitudeError};

    std::map<std::string, std::vector<SimulationRecord>> records{
        {"CRTS1", {makeRecord(0.0, 550.0), collided}},
        {"BULLDOG", {makeRecord(0.0, 530.0)}}
    };

    rapidjson::Document doc;
    doc.Parse(recordsToJson(records).c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.HasMember("satellites"));

    const auto &satellites = doc["satellites"];
    ASSERT_TRUE(satellites.HasMember("CRTS1"));
    ASSERT_TRUE(satellites.HasMember("BULLDOG"));
    ASSERT_EQ(satellites["CRTS1"].Size(), 2u);
    ASSERT_EQ(satellites["BULLDOG"].Size(), 1u);

    const auto &record = satellites["CRTS1"][1];
    EXPECT_STREQ(record["time"].GetString(), "2025-03-14T06:01:00.000Z");
    EXPECT_NEAR(record["altitude_km"].GetDouble(), 549.0, 1e-9);
    EXPECT_NEAR(record["position"][0].GetDouble(), EARTH_RADIUS_KM + 549.0, 1e-9);
    EXPECT_NEAR(record["speed_km_s"].GetDouble(), 7.6, 1e-9);
    EXPECT_NEAR(record["battery"].GetDouble(), 79.9, 1e-9);
    EXPECT_NEAR(record["orientation"]["pitch_deg"].GetDouble(), -0.2, 1e-9);
    ASSERT_EQ(record["collisions"].Size(), 1u);
    EXPECT_STREQ(record["collisions"][0].GetString(), "Collision with BULLDOG Dist=3.00km");
    ASSERT_EQ(record["anomalies"].Size(), 2u);
    EXPECT_STREQ(record["anomalies"][0].GetString(), "LowBattery");
    EXPECT_STREQ(record["anomalies"][1].GetString(), "AttitudeError");
}

TEST(ReportTest, TrajectoriesToJson) {
    TrajectoryPoint point{};
    point.position = {EARTH_RADIUS_KM + 550.0, 0.0, 0.0};
    point.altitudeKm = 550.0;
    point.latitudeDeg = 12.5;
    point.longitudeDeg = -45.0;
    point.time = START + 30s;
    point.elapsedSeconds = 30.0;

    rapidjson::Document doc;
    doc.Parse(trajectoriesToJson({{"CRTS1", {point, point}}}).c_str());
    ASSERT_FALSE(doc.HasParseError());
    const auto &orbit = doc["orbits"]["CRTS1"];
    ASSERT_EQ(orbit.Size(), 2u);
    EXPECT_NEAR(orbit[0]["time_from_start"].GetDouble(), 30.0, 1e-9);
    EXPECT_NEAR(orbit[0]["latitude"].GetDouble(), 12.5, 1e-9);
    EXPECT_NEAR(orbit[0]["longitude"].GetDouble(), -45.0, 1e-9);
}

TEST(ReportTest, RunSummary) {
    auto low = makeRecord(60.0, 520.0);
    low.anomalies = {Anomaly::LowBattery};
    std::map<std::string, std::vector<SimulationRecord>> records{
        {"CRTS1", {makeRecord(0.0, 550.0), low}},
        {"EMPTY", {}}
    };

    std::ostringstream out;
    printRunSummary(out, records);
    auto text = out.str();
    EXPECT_NE(text.find("CRTS1"), std::string::npos);
    EXPECT_NE(text.find("520.0km"), std::string::npos);
    EXPECT_NE(text.find("550.0km"), std::string::npos);
    EXPECT_NE(text.find("LowBattery"), std::string::npos);
    EXPECT_NE(text.find("No data"), std::string::npos);
}

TEST(ReportTest, Status) {
    DataStatus status;
    status.satellites = {"BULLDOG", "CRTS1"};
    status.recordCounts["CRTS1"] = 121;
    status.hasSatellites = true;
    status.hasRecords = true;

    std::ostringstream out;
    printStatus(out, status);
    auto text = out.str();
    EXPECT_NE(text.find("BULLDOG, CRTS1"), std::string::npos);
    EXPECT_NE(text.find("121 records"), std::string::npos);
}

}
}
