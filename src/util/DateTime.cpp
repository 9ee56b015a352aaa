/**
Copyright 2025 IceStream Team
Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at
    http://www.apache.org/licenses/LICENSE-2.0
Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
 */

#include "DateTime.h"

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace icestream {

static const int64_t MILLIS_PER_DAY = 86400000LL;

static int64_t floorDiv(int64_t value, int64_t divisor) {
    int64_t q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) q--;
    return q;
}

Timestamp DateTime::now() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

Timestamp DateTime::fromMillis(int64_t millis) { return Timestamp(std::chrono::milliseconds(millis)); }

int64_t DateTime::toMillis(Timestamp ts) { return ts.time_since_epoch().count(); }

std::chrono::milliseconds DateTime::days(int count) { return std::chrono::milliseconds(count * MILLIS_PER_DAY); }

Timestamp DateTime::dayStart(Timestamp ts, DayBoundary boundary) {
    int64_t millis = toMillis(ts);
    if (boundary == DayBoundary::UTC) {
        return fromMillis(floorDiv(millis, MILLIS_PER_DAY) * MILLIS_PER_DAY);
    }
    time_t seconds = static_cast<time_t>(floorDiv(millis, 1000));
    struct tm local;
    localtime_r(&seconds, &local);
    local.tm_hour = 0;
    local.tm_min = 0;
    local.tm_sec = 0;
    local.tm_isdst = -1;
    time_t midnight = mktime(&local);
    return fromMillis(static_cast<int64_t>(midnight) * 1000);
}

Timestamp DateTime::addDays(Timestamp ts, int count, DayBoundary boundary) {
    if (boundary == DayBoundary::UTC) {
        return ts + days(count);
    }
    int64_t millis = toMillis(ts);
    time_t seconds = static_cast<time_t>(floorDiv(millis, 1000));
    int64_t fraction = millis - static_cast<int64_t>(seconds) * 1000;
    struct tm local;
    localtime_r(&seconds, &local);
    local.tm_mday += count;
    local.tm_isdst = -1;
    time_t moved = mktime(&local);
    return fromMillis(static_cast<int64_t>(moved) * 1000 + fraction);
}

std::string DateTime::toIsoString(Timestamp ts, DayBoundary boundary) {
    int64_t millis = toMillis(ts);
    time_t seconds = static_cast<time_t>(floorDiv(millis, 1000));
    int64_t fraction = millis - static_cast<int64_t>(seconds) * 1000;
    struct tm parts;
    if (boundary == DayBoundary::UTC) {
        gmtime_r(&seconds, &parts);
    } else {
        localtime_r(&seconds, &parts);
    }
    char buffer[40];
    snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03d%s", parts.tm_year + 1900, parts.tm_mon + 1,
             parts.tm_mday, parts.tm_hour, parts.tm_min, parts.tm_sec, static_cast<int>(fraction),
             boundary == DayBoundary::UTC ? "Z" : "");
    return std::string(buffer);
}

bool DateTime::parseIso(const std::string &text, DayBoundary boundary, Timestamp &out) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, millis = 0;
    std::string value = text;
    if (!value.empty() && (value.back() == 'Z' || value.back() == 'z')) {
        boundary = DayBoundary::UTC;
        value.pop_back();
    }

    int consumed = 0;
    int fields = sscanf(value.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed);
    if (fields != 3) return false;
    if (static_cast<size_t>(consumed) != value.size()) {
        char separator = value[consumed];
        if (separator != 'T' && separator != 't' && separator != ' ') return false;
        int timeConsumed = 0;
        fields = sscanf(value.c_str() + consumed + 1, "%2d:%2d:%2d%n", &hour, &minute, &second, &timeConsumed);
        if (fields != 3) return false;
        size_t position = consumed + 1 + timeConsumed;
        if (position != value.size()) {
            if (value[position] != '.') return false;
            std::string fraction = value.substr(position + 1);
            if (fraction.empty() || fraction.size() > 3) return false;
            for (char c : fraction) {
                if (c < '0' || c > '9') return false;
            }
            while (fraction.size() < 3) fraction += "0";
            millis = std::stoi(fraction);
        }
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) return false;

    struct tm parts = {};
    parts.tm_year = year - 1900;
    parts.tm_mon = month - 1;
    parts.tm_mday = day;
    parts.tm_hour = hour;
    parts.tm_min = minute;
    parts.tm_sec = second;
    parts.tm_isdst = -1;
    time_t seconds = boundary == DayBoundary::UTC ? timegm(&parts) : mktime(&parts);
    if (seconds == static_cast<time_t>(-1) && !(year == 1969 && month == 12 && day == 31)) return false;
    out = fromMillis(static_cast<int64_t>(seconds) * 1000 + millis);
    return true;
}

std::string DateTime::targetToken(Timestamp ts) {
    time_t seconds = static_cast<time_t>(floorDiv(toMillis(ts), 1000));
    struct tm parts;
    gmtime_r(&seconds, &parts);
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dt%H-%M-%Sz", &parts);
    return std::string(buffer);
}

DayBoundary DateTime::parseDayBoundary(const std::string &name) {
    if (name.empty() || name == "local") return DayBoundary::LOCAL;
    if (name == "utc" || name == "UTC") return DayBoundary::UTC;
    throw std::invalid_argument("Unknown day boundary '" + name + "', expected local or utc");
}

}  // namespace icestream
