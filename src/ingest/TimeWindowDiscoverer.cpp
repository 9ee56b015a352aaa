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

#include "TimeWindowDiscoverer.h"

#include <algorithm>

#include "../util/logger/Logger.h"

Logger window_logger;

namespace icestream {

std::string TimeWindow::toString() const {
    return "[" + DateTime::toIsoString(since) + ", " + DateTime::toIsoString(until) + ")";
}

TimeWindowDiscoverer::TimeWindowDiscoverer(const IngestionConfig &config, Clock clock)
    : config(config), clock(std::move(clock)) {}

Timestamp TimeWindowDiscoverer::forwardCutoff(Timestamp since) const {
    Timestamp dayStart = DateTime::dayStart(since, config.dayBoundary);
    return config.spanEnd(dayStart) + std::chrono::minutes(config.streamingMinutes);
}

Timestamp TimeWindowDiscoverer::untilFor(Timestamp since, const TimeHints &hints) const {
    Timestamp until = std::min(forwardCutoff(since), clock());
    if (hints.until) {
        until = std::min(until, *hints.until);
    }
    return until;
}

TimeWindow TimeWindowDiscoverer::discover(const std::optional<Timestamp> &lastIngested,
                                          const TimeHints &hints) const {
    TimeWindow window;
    if (!lastIngested) {
        window.since = hints.since ? *hints.since : DateTime::dayStart(clock(), config.dayBoundary);
        window_logger.info("No previous data found, starting from " + DateTime::toIsoString(window.since));
    } else {
        window.since = *lastIngested + DateTime::SMALLEST_INCREMENT;
        if (hints.since && *hints.since > window.since) {
            window_logger.info("Since hint " + DateTime::toIsoString(*hints.since) +
                               " is later than the last ingested data, skipping ahead");
            window.since = *hints.since;
        }
    }
    window.until = untilFor(window.since, hints);
    window_logger.info("Streaming window " + window.toString());
    return window;
}

}  // namespace icestream
