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

#ifndef ICESTREAM_TIMEWINDOWDISCOVERER_H
#define ICESTREAM_TIMEWINDOWDISCOVERER_H

#include <optional>
#include <string>

#include "../util/DateTime.h"
#include "IngestionConfig.h"

namespace icestream {

// Half open [since, until)
struct TimeWindow {
    Timestamp since;
    Timestamp until;

    bool empty() const { return since >= until; }

    std::string toString() const;
};

// Caller supplied bounds, both optional
struct TimeHints {
    std::optional<Timestamp> since;
    std::optional<Timestamp> until;
};

class TimeWindowDiscoverer {
 public:
    TimeWindowDiscoverer(const IngestionConfig &config, Clock clock);

    /**
     * First window of a run. lastIngested is the last timestamp of the last valid target, absent on a
     * cold start. A since hint only moves the start forward once data exists.
     */
    TimeWindow discover(const std::optional<Timestamp> &lastIngested, const TimeHints &hints) const;

    // min(forward cutoff, wall clock, until hint)
    Timestamp untilFor(Timestamp since, const TimeHints &hints) const;

    // Day start of since plus one target span plus the streaming margin
    Timestamp forwardCutoff(Timestamp since) const;

 private:
    IngestionConfig config;
    Clock clock;
};

}  // namespace icestream

#endif  // ICESTREAM_TIMEWINDOWDISCOVERER_H
