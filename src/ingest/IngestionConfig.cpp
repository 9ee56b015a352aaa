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

#include "IngestionConfig.h"

#include <stdexcept>

#include "../util/Utils.h"

namespace icestream {

IngestionConfig IngestionConfig::fromProperties() {
    IngestionConfig config;
    config.streamingMinutes =
        Utils::getIceStreamIntProperty(Conts::PROPERTIES::STREAMING_MINUTES, Conts::DEFAULTS::STREAMING_MINUTES);
    config.daysPerFile = Utils::getIceStreamIntProperty(Conts::PROPERTIES::STREAMING_DAYS_PER_FILE,
                                                        Conts::DEFAULTS::STREAMING_DAYS_PER_FILE);
    config.chunkSize =
        Utils::getIceStreamIntProperty(Conts::PROPERTIES::CHUNK_TIMESTAMP, Conts::DEFAULTS::CHUNK_TIMESTAMP);
    config.highResChunkSize = Utils::getIceStreamIntProperty(Conts::PROPERTIES::CHUNK_HIGH_RES_TIMESTAMP,
                                                             Conts::DEFAULTS::CHUNK_HIGH_RES_TIMESTAMP);

    std::string keys = Utils::getIceStreamProperty(Conts::PROPERTIES::SIGNIFICANT_KEYS);
    config.significantKeys = SignificantAttributes::parse(keys.empty() ? Conts::DEFAULTS::SIGNIFICANT_KEYS : keys);
    config.dayBoundary = DateTime::parseDayBoundary(Utils::getIceStreamProperty(Conts::PROPERTIES::DAY_BOUNDARY));

    std::string stateFile = Utils::getIceStreamProperty(Conts::PROPERTIES::STATE_FILE);
    config.stateFileName = stateFile.empty() ? Conts::DEFAULTS::STATE_FILE : stateFile;
    config.historyDbLocation = Utils::getIceStreamProperty(Conts::PROPERTIES::HISTORY_DB_LOCATION);

    config.validate();
    return config;
}

void IngestionConfig::validate() const {
    if (chunkSize == 0 || highResChunkSize == 0) {
        throw std::invalid_argument("Chunk sizes must be positive");
    }
    if (daysPerFile <= 0) {
        throw std::invalid_argument("days_per_file must be positive");
    }
    if (streamingMinutes < 0) {
        throw std::invalid_argument("streaming minutes must not be negative");
    }
    if (significantKeys.keys().empty()) {
        throw std::invalid_argument("At least one significant attribute key is required");
    }
}

}  // namespace icestream
