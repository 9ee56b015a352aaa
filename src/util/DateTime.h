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

#ifndef ICESTREAM_DATETIME_H
#define ICESTREAM_DATETIME_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace icestream {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;
using Clock = std::function<Timestamp()>;

// Which calendar day boundaries are used for day-start computations
enum class DayBoundary { LOCAL, UTC };

class DateTime {
 public:
    // The smallest distinguishable step between two timestamps
    static constexpr std::chrono::milliseconds SMALLEST_INCREMENT{1};

    static Timestamp now();

    static Timestamp fromMillis(int64_t millis);

    static int64_t toMillis(Timestamp ts);

    static std::chrono::milliseconds days(int count);

    // Midnight of the calendar day containing ts
    static Timestamp dayStart(Timestamp ts, DayBoundary boundary);

    // Moves ts by whole calendar days, keeping its wall clock time in the boundary's zone
    static Timestamp addDays(Timestamp ts, int count, DayBoundary boundary);

    static std::string toIsoString(Timestamp ts, DayBoundary boundary = DayBoundary::UTC);

    /**
     * Parses YYYY-MM-DD, YYYY-MM-DDTHH:MM:SS or YYYY-MM-DDTHH:MM:SS.mmm. A trailing 'Z' forces UTC,
     * otherwise the value is read in the given boundary's zone.
     * @return false when the text is not a valid timestamp
     */
    static bool parseIso(const std::string &text, DayBoundary boundary, Timestamp &out);

    // Compact token used inside target names, always UTC (e.g. 2024-03-01t00-00-00z)
    static std::string targetToken(Timestamp ts);

    static DayBoundary parseDayBoundary(const std::string &name);
};

}  // namespace icestream

#endif  // ICESTREAM_DATETIME_H
