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

#include "MockSliceProvider.h"

#include <cmath>
#include <stdexcept>

#include "../dataset/DatasetSerializer.h"
#include "../util/Conts.h"
#include "../util/Utils.h"
#include "../util/logger/Logger.h"

Logger mock_provider_logger;

namespace icestream {

MockSliceConfig MockSliceConfig::fromProperties() {
    MockSliceConfig config;
    std::string instrument = Utils::getIceStreamProperty(Conts::PROPERTIES::MOCK_INSTRUMENT);
    if (!instrument.empty()) config.instrument = instrument;
    std::string project = Utils::getIceStreamProperty(Conts::PROPERTIES::MOCK_PROJECT);
    if (!project.empty()) config.project = project;
    config.settingsId = Utils::getIceStreamIntProperty(Conts::PROPERTIES::MOCK_SETTINGS_ID, config.settingsId);
    config.cadenceSeconds =
        Utils::getIceStreamIntProperty(Conts::PROPERTIES::MOCK_CADENCE_SECONDS, config.cadenceSeconds);
    config.highResFactor =
        Utils::getIceStreamIntProperty(Conts::PROPERTIES::MOCK_HIGH_RES_FACTOR, config.highResFactor);
    return config;
}

MockSliceProvider::MockSliceProvider(MockSliceConfig config) : config(std::move(config)) {
    if (this->config.cadenceSeconds <= 0 || this->config.highResFactor <= 0) {
        throw std::invalid_argument("Mock cadence and high resolution factor must be positive");
    }
}

std::string MockSliceProvider::sliceName(Timestamp first) const {
    return config.instrument + "/" + config.project + "/inst-" + config.instrument + "-prj-" + config.project + "-" +
           DateTime::targetToken(first) + "l1b" + Conts::TARGET_EXTENSION;
}

Dataset MockSliceProvider::generate(Timestamp since, Timestamp until, int64_t settingsId) const {
    const int64_t cadence = static_cast<int64_t>(config.cadenceSeconds) * 1000;
    int64_t from = DateTime::toMillis(since);
    int64_t to = DateTime::toMillis(until);
    int64_t first = from % cadence == 0 ? from : (from / cadence + (from > 0 ? 1 : 0)) * cadence;

    std::vector<double> timestamps;
    for (int64_t t = first; t < to; t += cadence) {
        timestamps.push_back(static_cast<double>(t));
    }
    Dataset slice;
    if (timestamps.empty()) {
        return slice;
    }

    const size_t rows = timestamps.size();
    std::vector<double> waves;
    for (size_t w = 0; w < config.waveSize; w++) waves.push_back(static_cast<double>(w));
    std::vector<double> backscatter;
    backscatter.reserve(rows * config.waveSize);
    std::vector<double> depth;
    for (double t : timestamps) {
        double seconds = t / 1000.0;
        for (size_t w = 0; w < config.waveSize; w++) {
            backscatter.push_back(-70.0 + 10.0 * std::sin(seconds / 600.0 + static_cast<double>(w)));
        }
        depth.push_back(20.0 + 5.0 * std::cos(seconds / 3600.0));
    }

    const int64_t highResStep = cadence / config.highResFactor;
    std::vector<double> highResTimes;
    std::vector<double> highResSignal;
    for (double t : timestamps) {
        for (int k = 0; k < config.highResFactor; k++) {
            double ts = t + static_cast<double>(k * highResStep);
            highResTimes.push_back(ts);
            highResSignal.push_back(std::sin(ts / 250.0));
        }
    }

    std::vector<double> retro;
    std::vector<double> retroGain;
    for (size_t r = 0; r < config.retroCount; r++) {
        retro.push_back(static_cast<double>(settingsId * 10 + static_cast<int64_t>(r)));
        retroGain.push_back(0.5 + 0.25 * static_cast<double>(r));
    }

    slice.setVariable(Conts::TIME_DIM, {Conts::TIME_DIM}, timestamps);
    slice.setVariable("wave", {"wave"}, waves);
    slice.setVariable("backscatter", {Conts::TIME_DIM, "wave"}, backscatter);
    slice.setVariable("depth", {Conts::TIME_DIM}, depth);
    slice.setVariable(Conts::HIGH_RES_TIME_DIM, {Conts::HIGH_RES_TIME_DIM}, highResTimes);
    slice.setVariable("high_res_signal", {Conts::HIGH_RES_TIME_DIM}, highResSignal);
    slice.setVariable(Conts::RETRO_DIM, {Conts::RETRO_DIM}, retro);
    slice.setVariable("retro_gain", {Conts::RETRO_DIM}, retroGain);
    slice.setVariable(Conts::SETTINGS_ID_DIM, {Conts::SETTINGS_ID_DIM}, {static_cast<double>(settingsId)});
    slice.setVariable("settings_frequency", {Conts::SETTINGS_ID_DIM}, {38000.0 + 1000.0 * settingsId});
    slice.setAttribute("instrument", config.instrument);
    slice.setAttribute("project", config.project);
    slice.setAttribute("settings_id", settingsId);
    return slice;
}

std::vector<std::string> MockSliceProvider::fetchSlices(const std::string &localDir, Timestamp since,
                                                        Timestamp until) {
    std::vector<std::pair<Dataset, Timestamp>> parts;
    if (config.settingsChangeAt && *config.settingsChangeAt > since && *config.settingsChangeAt < until) {
        parts.emplace_back(generate(since, *config.settingsChangeAt, config.settingsId), since);
        parts.emplace_back(generate(*config.settingsChangeAt, until, config.changedSettingsId),
                           *config.settingsChangeAt);
    } else {
        bool changed = config.settingsChangeAt && *config.settingsChangeAt <= since;
        parts.emplace_back(generate(since, until, changed ? config.changedSettingsId : config.settingsId), since);
    }

    std::vector<std::string> paths;
    for (const auto &part : parts) {
        const Dataset &slice = part.first;
        if (slice.size(Conts::TIME_DIM) == 0) continue;
        std::string path = localDir + "/" + sliceName(slice.firstTimestamp(Conts::TIME_DIM));
        if (!DatasetSerializer::write(slice, path)) {
            throw SliceProviderError("Cannot write mock slice " + path);
        }
        mock_provider_logger.debug("Generated " + std::to_string(slice.size(Conts::TIME_DIM)) + " rows in " + path);
        paths.push_back(path);
    }
    return paths;
}

}  // namespace icestream
