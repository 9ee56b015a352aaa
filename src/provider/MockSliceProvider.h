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

#ifndef ICESTREAM_MOCKSLICEPROVIDER_H
#define ICESTREAM_MOCKSLICEPROVIDER_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../dataset/Dataset.h"
#include "SliceProvider.h"

namespace icestream {

struct MockSliceConfig {
    std::string instrument = "EK80";
    std::string project = "demo";
    int64_t settingsId = 1;
    int cadenceSeconds = 10;
    int highResFactor = 4;
    size_t waveSize = 4;
    size_t retroCount = 2;
    // Rows at or after this instant carry changedSettingsId
    std::optional<Timestamp> settingsChangeAt;
    int64_t changedSettingsId = 2;

    static MockSliceConfig fromProperties();
};

/**
 * Deterministic measurement data on a fixed cadence grid. Every grid point inside the requested
 * window gets one row, with highResFactor high resolution rows per regular row.
 */
class MockSliceProvider : public SliceProvider {
 public:
    explicit MockSliceProvider(MockSliceConfig config);

    std::vector<std::string> fetchSlices(const std::string &localDir, Timestamp since, Timestamp until) override;

    // Rows for [since, until) using one settings id; empty when no grid point falls inside
    Dataset generate(Timestamp since, Timestamp until, int64_t settingsId) const;

    // <instrument>/<project>/inst-<instrument>-prj-<project>-<token>l1b.zarr
    std::string sliceName(Timestamp first) const;

 private:
    MockSliceConfig config;
};

}  // namespace icestream

#endif  // ICESTREAM_MOCKSLICEPROVIDER_H
