//===----------------------------------------------------------------------===//
//                         IOM Client
//
// data/value.cpp
//
// Calendar conversions between engine offsets and civil dates
//===----------------------------------------------------------------------===//

#include "data/value.hpp"
#include <cmath>
#include <cstdio>

namespace iomclient {
namespace calendar {

namespace {

constexpr int64_t MICROS_PER_SECOND = 1000000;
constexpr int64_t SECONDS_PER_DAY = 86400;

int64_t FloorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        q--;
    }
    return q;
}

} // anonymous namespace

Date FromEngineDays(double days) {
    return Date{static_cast<int32_t>(std::floor(days)) - ENGINE_EPOCH_DAYS_BEFORE_UNIX};
}

DateTime FromEngineSeconds(double seconds) {
    double unix_seconds = seconds - static_cast<double>(ENGINE_EPOCH_SECONDS_BEFORE_UNIX);
    return DateTime{static_cast<int64_t>(std::llround(unix_seconds * MICROS_PER_SECOND))};
}

double ToEngineSeconds(const DateTime& dt) {
    return static_cast<double>(dt.micros) / MICROS_PER_SECOND +
           static_cast<double>(ENGINE_EPOCH_SECONDS_BEFORE_UNIX);
}

// Howard Hinnant's days_from_civil
int32_t DaysFromCivil(int32_t year, uint32_t month, uint32_t day) {
    year -= month <= 2 ? 1 : 0;
    const int32_t era = (year >= 0 ? year : year - 399) / 400;
    const uint32_t yoe = static_cast<uint32_t>(year - era * 400);
    const uint32_t doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const uint32_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int32_t>(doe) - 719468;
}

void CivilFromDays(int32_t days, int32_t& year, uint32_t& month, uint32_t& day) {
    days += 719468;
    const int32_t era = (days >= 0 ? days : days - 146096) / 146097;
    const uint32_t doe = static_cast<uint32_t>(days - era * 146097);
    const uint32_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const uint32_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const uint32_t mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int32_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0);
}

std::string FormatDate(const Date& d) {
    int32_t y;
    uint32_t m, dd;
    CivilFromDays(d.days, y, m, dd);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, dd);
    return buf;
}

std::string FormatDateTime(const DateTime& dt) {
    int64_t total_seconds = FloorDiv(dt.micros, MICROS_PER_SECOND);
    int64_t micros = dt.micros - total_seconds * MICROS_PER_SECOND;
    int64_t days = FloorDiv(total_seconds, SECONDS_PER_DAY);
    int64_t sod = total_seconds - days * SECONDS_PER_DAY;

    int32_t y;
    uint32_t m, d;
    CivilFromDays(static_cast<int32_t>(days), y, m, d);

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%06lld",
                  y, m, d,
                  static_cast<int>(sod / 3600), static_cast<int>((sod % 3600) / 60),
                  static_cast<int>(sod % 60), static_cast<long long>(micros));
    return buf;
}

} // namespace calendar
} // namespace iomclient
