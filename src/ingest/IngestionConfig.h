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

#ifndef ICESTREAM_INGESTIONCONFIG_H
#define ICESTREAM_INGESTIONCONFIG_H

#include <chrono>
#include <set>
#include <string>

#include "../util/Conts.h"
#include "../util/DateTime.h"
#include "AppendabilityClassifier.h"

namespace icestream {

struct IngestionConfig {
    int streamingMinutes = 30;
    int daysPerFile = 1;
    size_t chunkSize = 100;
    size_t highResChunkSize = 1000;
    SignificantAttributes significantKeys = SignificantAttributes::parse(Conts::DEFAULTS::SIGNIFICANT_KEYS);
    DayBoundary dayBoundary = DayBoundary::LOCAL;
    std::string stateFileName = "streaming_state.yaml";
    std::string historyDbLocation;

    std::string timeDim = Conts::TIME_DIM;
    std::string highResDim = Conts::HIGH_RES_TIME_DIM;
    std::set<std::string> setupDims = {Conts::RETRO_DIM, Conts::SETTINGS_ID_DIM};

    // ts moved forward by daysPerFile calendar days of the configured boundary
    Timestamp spanEnd(Timestamp ts) const { return DateTime::addDays(ts, daysPerFile, dayBoundary); }

    /**
     * Resolves every setting from conf/icestream.properties, using the built in defaults for absent keys.
     * Throws std::invalid_argument for malformed values.
     */
    static IngestionConfig fromProperties();

    // Throws std::invalid_argument when a value is out of range
    void validate() const;
};

}  // namespace icestream

#endif  // ICESTREAM_INGESTIONCONFIG_H
