//===----------------------------------------------------------------------===//
//                         IOM Client
//
// data/value.hpp
//
// Converted cell values and calendar helpers
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <string>
#include <variant>
#include <vector>

namespace iomclient {

// Calendar day, counted from 1970-01-01
struct Date {
    int32_t days = 0;

    bool operator==(const Date& other) const { return days == other.days; }
    bool operator!=(const Date& other) const { return days != other.days; }
};

// Instant with microsecond precision, counted from 1970-01-01T00:00:00
struct DateTime {
    int64_t micros = 0;

    bool operator==(const DateTime& other) const { return micros == other.micros; }
    bool operator!=(const DateTime& other) const { return micros != other.micros; }
};

// Missing, numeric, character, date, or datetime
using Value = std::variant<std::monostate, double, std::string, Date, DateTime>;

inline bool IsMissing(const Value& v) { return std::holds_alternative<std::monostate>(v); }

// Header plus rows; every row has header.size() converted values
struct TabularResult {
    std::vector<std::string> header;
    std::vector<std::vector<Value>> rows;
};

namespace calendar {

// The engine counts days and seconds from 1960-01-01
constexpr int32_t ENGINE_EPOCH_DAYS_BEFORE_UNIX = 3653;
constexpr int64_t ENGINE_EPOCH_SECONDS_BEFORE_UNIX = 315619200;

Date FromEngineDays(double days);
DateTime FromEngineSeconds(double seconds);
double ToEngineSeconds(const DateTime& dt);

// Proleptic Gregorian conversions
int32_t DaysFromCivil(int32_t year, uint32_t month, uint32_t day);
void CivilFromDays(int32_t days, int32_t& year, uint32_t& month, uint32_t& day);

// YYYY-MM-DD
std::string FormatDate(const Date& d);
// YYYY-MM-DDTHH:MM:SS.ffffff
std::string FormatDateTime(const DateTime& dt);

} // namespace calendar

} // namespace iomclient
