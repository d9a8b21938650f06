/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <leosim/elements.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <numbers>
#include <sstream>
#include <string>
#include <string_view>

#include <date/date.h>

namespace leosim {

namespace {

// Helper function to trim leading spaces from a string_view
std::string_view trimLeft(std::string_view str) {
    auto pos = str.find_first_not_of(' ');
    return pos == std::string_view::npos ? "" : str.substr(pos);
}

// Helper function to trim trailing spaces from a string_view
std::string_view trimRight(std::string_view str) {
    auto pos = str.find_last_not_of(' ');
    return pos == std::string_view::npos ? "" : str.substr(0, pos + 1);
}

// Helper function to convert a record field to a numeric type
template <typename T>
T toNumber(std::string_view field, const char *name) {
    field = trimLeft(trimRight(field));
    T value{};
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec != std::errc() || ptr != field.data() + field.size()) {
        throw ConfigurationError(std::string("Couldn't parse ") + name + ": '" + std::string(field) + "'");
    }
    return value;
}

// Epochs are written to 1e-8 of a day
using EpochTick = std::chrono::duration<long long, std::ratio<864, 1000000>>;
constexpr long long EPOCH_TICKS_PER_DAY = 100000000;

// YYDDD.DDDDDDDD
std::string formatEpoch(time_point epoch) {
    using namespace std::chrono;

    year_month_day ymd{floor<days>(epoch)};
    auto yearStart = sys_days{ymd.year()/January/1};
    long long ticks = round<EpochTick>(epoch - yearStart).count();

    int twoDigitYear = static_cast<int>(ymd.year()) % 100;
    long long dayOfYear = ticks / EPOCH_TICKS_PER_DAY + 1;
    long long fraction = ticks % EPOCH_TICKS_PER_DAY;

    std::ostringstream ss;
    ss << std::setw(2) << std::setfill('0') << twoDigitYear
       << std::setw(3) << std::setfill('0') << dayOfYear
       << '.' << std::setw(8) << std::setfill('0') << fraction;
    return ss.str();
}

time_point parseEpoch(std::string_view field) {
    using namespace std::chrono;

    int y = toNumber<int>(field.substr(0, 2), "epoch year");
    double dayOfYear = toNumber<double>(field.substr(2), "epoch day");

    // Two-digit years follow the catalog convention: 57-99 => 19xx
    y += (y < 57) ? 2000 : 1900;

    if (dayOfYear < 1.0 || dayOfYear >= 367.0) {
        throw ConfigurationError("Epoch day of year out of range: " + std::string(field));
    }

    int wholeDays = static_cast<int>(dayOfYear);
    double fracDays = dayOfYear - wholeDays;

    auto date = sys_days{year{y}/January/1} + days{wholeDays - 1};
    auto time = duration_cast<microseconds>(duration<double, std::ratio<86400>>{fracDays});

    return date + time;
}

// Angles are written with 4 decimals; 359.99996 must not become "360.0000"
double wrapForColumns(double degrees) {
    double rounded = std::round(degrees * 10000.0) / 10000.0;
    return rounded >= 360.0 ? rounded - 360.0 : rounded;
}

bool isAngle(double degrees) {
    return std::isfinite(degrees) && degrees >= 0.0 && degrees < 360.0;
}

} // namespace

double meanMotionFromAltitude(double altitudeKm) {
    if (!std::isfinite(altitudeKm) || altitudeKm <= -EARTH_RADIUS_KM) {
        std::ostringstream ss;
        ss << "Non-physical altitude: " << altitudeKm << " km";
        throw ConfigurationError(ss.str());
    }

    // Kepler's third law: T = 2π sqrt(a³/GM)
    double a = EARTH_RADIUS_KM + altitudeKm;
    double periodSeconds = 2.0 * std::numbers::pi * std::sqrt(a * a * a / EARTH_GM);
    return SECONDS_PER_DAY / periodSeconds;
}

double altitudeFromMeanMotion(double meanMotionRevPerDay) {
    if (!std::isfinite(meanMotionRevPerDay) || meanMotionRevPerDay <= 0.0) {
        std::ostringstream ss;
        ss << "Non-physical mean motion: " << meanMotionRevPerDay << " rev/day";
        throw ConfigurationError(ss.str());
    }

    double n = meanMotionRevPerDay * 2.0 * std::numbers::pi / SECONDS_PER_DAY;
    return std::cbrt(EARTH_GM / (n * n)) - EARTH_RADIUS_KM;
}

void validate(const ElementSet &e) {
    using namespace std::chrono;

    auto fail = [](const std::string &field, double value) {
        std::ostringstream ss;
        ss << "Invalid " << field << ": " << value;
        throw ConfigurationError(ss.str());
    };

    if (e.catalogNumber < 0 || e.catalogNumber > 99999) fail("catalog number", e.catalogNumber);
    if (e.classification != 'U' && e.classification != 'C' && e.classification != 'S') {
        throw ConfigurationError(std::string("Invalid classification: ") + e.classification);
    }
    if (!std::isfinite(e.altitudeKm) || e.altitudeKm <= -EARTH_RADIUS_KM) fail("altitude", e.altitudeKm);
    if (!std::isfinite(e.inclinationDeg) || e.inclinationDeg < 0.0 || e.inclinationDeg > 180.0) {
        fail("inclination", e.inclinationDeg);
    }
    if (!std::isfinite(e.eccentricity) || e.eccentricity < 0.0
        || std::round(e.eccentricity * 10000000) >= 10000000) {
        fail("eccentricity", e.eccentricity);
    }
    if (!isAngle(e.raanDeg)) fail("RAAN", e.raanDeg);
    if (!isAngle(e.argpDeg)) fail("argument of perigee", e.argpDeg);
    if (!isAngle(e.meanAnomalyDeg)) fail("mean anomaly", e.meanAnomalyDeg);

    // 11.8f leaves room for two integer digits
    if (!std::isfinite(e.meanMotionRevPerDay) || e.meanMotionRevPerDay <= 0.0
        || e.meanMotionRevPerDay >= 100.0) {
        fail("mean motion", e.meanMotionRevPerDay);
    }
    if (!std::isfinite(e.dragTerm) || std::abs(e.dragTerm) >= 1.0) fail("drag term", e.dragTerm);
    if (e.elementSetNumber < 0 || e.elementSetNumber > 9999) fail("element set number", e.elementSetNumber);
    if (e.revolutionNumber < 0 || e.revolutionNumber > 99999) fail("revolution number", e.revolutionNumber);

    int epochYear = static_cast<int>(year_month_day{floor<days>(e.epoch)}.year());
    if (epochYear < 1957 || epochYear > 2056) fail("epoch year", epochYear);
}

int calculateChecksum(std::string_view line) {
    int sum = 0;
    for (char c : line.substr(0, std::min(line.size(), RECORD_DATA_COLUMNS))) {
        if (c >= '0' && c <= '9') {
            sum += (c - '0');
        } else if (c == '-') {
            sum += 1;
        }
    }
    return sum % 10;
}

bool hasValidChecksum(std::string_view line) {
    if (line.size() < RECORD_LINE_LENGTH) {
        return false;
    }
    char digit = line[RECORD_DATA_COLUMNS];
    return digit >= '0' && digit <= '9' && (digit - '0') == calculateChecksum(line);
}

// Format a value in exponential notation (e.g., " 00000+0" or " 15237-3" or "-12345-6")
// The format is: [sign]NNNNN[sign]E where NNNNN is 5 digits of mantissa and E is exponent
std::string toExponentialField(double value) {
    if (value == 0.0) {
        return " 00000+0";
    }

    char sign = (value >= 0) ? ' ' : '-';
    value = std::abs(value);

    int exponent = static_cast<int>(std::floor(std::log10(value)));

    // Normalize mantissa to be in range [0.1, 1.0)
    double mantissa = value / std::pow(10.0, exponent + 1);
    int mantissaInt = static_cast<int>(std::round(mantissa * 100000));

    // Handle rounding overflow
    if (mantissaInt >= 100000) {
        mantissaInt = 10000;
        exponent++;
    }

    char expSign = (exponent + 1 >= 0) ? '+' : '-';
    int expAbs = std::abs(exponent + 1);

    std::ostringstream ss;
    ss << sign << std::setw(5) << std::setfill('0') << mantissaInt << expSign << expAbs;
    return ss.str();
}

// Example input: "-11606-4" -> -0.000011606
double fromExponentialField(std::string_view field) {
    field = trimLeft(trimRight(field));

    bool negative = false;
    if (!field.empty() && (field[0] == '-' || field[0] == '+')) {
        negative = field[0] == '-';
        field.remove_prefix(1);
    }

    auto pos = field.find_last_of("+-");
    if (pos == std::string_view::npos || pos == 0) {
        throw ConfigurationError("Invalid exponential field: " + std::string(field));
    }

    double base = toNumber<double>("0." + std::string(field.substr(0, pos)), "mantissa");
    int exponent = toNumber<int>(field.substr(pos + 1), "exponent");
    if (field[pos] == '-') exponent = -exponent;

    double value = base * std::pow(10.0, exponent);
    return negative ? -value : value;
}

EncodedElementRecord encode(const ElementSet &e) {
    validate(e);

    // Line 1 (columns 1-indexed):
    // 01 line number, 03-07 catalog number, 08 classification,
    // 10-17 designator (blank), 19-32 epoch, 34-43 first derivative of mean
    // motion, 45-52 second derivative, 54-61 drag term, 63 ephemeris type,
    // 65-68 element set number, 69 checksum
    std::ostringstream line1;
    line1 << "1 "
          << std::setw(5) << std::setfill('0') << e.catalogNumber
          << e.classification << ' '
          << std::string(8, ' ') << ' '
          << formatEpoch(e.epoch) << ' '
          << " .00000000" << ' '
          << " 00000+0" << ' '
          << toExponentialField(e.dragTerm) << ' '
          << "0 "
          << std::right << std::setw(4) << std::setfill(' ') << e.elementSetNumber;

    // Line 2 (columns 1-indexed):
    // 01 line number, 03-07 catalog number, 09-16 inclination, 18-25 RAAN,
    // 27-33 eccentricity (implied decimal), 35-42 argument of perigee,
    // 44-51 mean anomaly, 53-63 mean motion, 64-68 revolution number,
    // 69 checksum
    long eccInt = std::lround(e.eccentricity * 10000000);

    std::ostringstream line2;
    line2 << "2 "
          << std::setw(5) << std::setfill('0') << e.catalogNumber << ' '
          << std::fixed << std::setprecision(4)
          << std::right << std::setw(8) << std::setfill(' ') << e.inclinationDeg << ' '
          << std::right << std::setw(8) << std::setfill(' ') << wrapForColumns(e.raanDeg) << ' '
          << std::setw(7) << std::setfill('0') << eccInt << ' '
          << std::right << std::setw(8) << std::setfill(' ') << wrapForColumns(e.argpDeg) << ' '
          << std::right << std::setw(8) << std::setfill(' ') << wrapForColumns(e.meanAnomalyDeg) << ' '
          << std::setprecision(8)
          << std::right << std::setw(11) << std::setfill(' ') << e.meanMotionRevPerDay
          << std::setw(5) << std::setfill('0') << e.revolutionNumber;

    EncodedElementRecord record{line1.str(), line2.str()};
    if (record.line1.size() != RECORD_DATA_COLUMNS || record.line2.size() != RECORD_DATA_COLUMNS) {
        throw ConfigurationError("Element set doesn't fit the record columns");
    }
    record.line1 += static_cast<char>('0' + calculateChecksum(record.line1));
    record.line2 += static_cast<char>('0' + calculateChecksum(record.line2));
    return record;
}

ElementSet decode(std::string_view line1, std::string_view line2) {
    line1 = trimRight(line1);
    line2 = trimRight(line2);

    if (line1.size() < RECORD_LINE_LENGTH || line2.size() < RECORD_LINE_LENGTH) {
        throw ConfigurationError("Element record lines must be " + std::to_string(RECORD_LINE_LENGTH) + " characters");
    }
    if (line1[0] != '1' || line2[0] != '2') {
        throw ConfigurationError("Element record lines are out of order");
    }
    if (!hasValidChecksum(line1)) {
        throw ConfigurationError("Checksum mismatch on line 1: " + std::string(line1));
    }
    if (!hasValidChecksum(line2)) {
        throw ConfigurationError("Checksum mismatch on line 2: " + std::string(line2));
    }

    ElementSet e;
    e.catalogNumber = toNumber<int>(line1.substr(2, 5), "catalog number");
    e.classification = line1[7];
    e.epoch = parseEpoch(line1.substr(18, 14));
    e.dragTerm = fromExponentialField(line1.substr(53, 8));
    e.elementSetNumber = toNumber<int>(line1.substr(64, 4), "element set number");

    if (toNumber<int>(line2.substr(2, 5), "catalog number") != e.catalogNumber) {
        throw ConfigurationError("Catalog numbers of line 1 and line 2 differ");
    }
    e.inclinationDeg = toNumber<double>(line2.substr(8, 8), "inclination");
    e.raanDeg = toNumber<double>(line2.substr(17, 8), "RAAN");
    e.eccentricity = toNumber<double>("0." + std::string(line2.substr(26, 7)), "eccentricity");
    e.argpDeg = toNumber<double>(line2.substr(34, 8), "argument of perigee");
    e.meanAnomalyDeg = toNumber<double>(line2.substr(43, 8), "mean anomaly");
    e.meanMotionRevPerDay = toNumber<double>(line2.substr(52, 11), "mean motion");
    e.revolutionNumber = toNumber<int>(line2.substr(63, 5), "revolution number");
    e.altitudeKm = altitudeFromMeanMotion(e.meanMotionRevPerDay);

    return e;
}

void printInfo(std::ostream &os, std::string_view name, const ElementSet &e) {
    auto epoch = std::chrono::floor<std::chrono::seconds>(e.epoch);
    os << name << std::endl;
    os << "  Catalog Number: " << e.catalogNumber << std::endl;
    os << "  Classification: " << e.classification << std::endl;
    os << "  Epoch: " << date::format("%F %T UTC", epoch) << std::endl;
    os << "  Altitude: " << e.altitudeKm << " km" << std::endl;
    os << "  Inclination: " << e.inclinationDeg << " deg" << std::endl;
    os << "  Right Ascension of Ascending Node: " << e.raanDeg << " deg" << std::endl;
    os << "  Eccentricity: " << e.eccentricity << std::endl;
    os << "  Argument of Perigee: " << e.argpDeg << " deg" << std::endl;
    os << "  Mean Anomaly: " << e.meanAnomalyDeg << " deg" << std::endl;
    os << "  Mean Motion: " << e.meanMotionRevPerDay << " revs per day" << std::endl;
    os << "  Period: " << e.periodSeconds() / 60.0 << " min" << std::endl;
    os << "  Drag Term: " << e.dragTerm << std::endl;
    os << "  Element Set Number: " << e.elementSetNumber << std::endl;
    os << "  Revolution Number at Epoch: " << e.revolutionNumber << std::endl;
    os << std::endl;
}

}
