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

#ifndef ICESTREAM_COMMANDSLICEPROVIDER_H
#define ICESTREAM_COMMANDSLICEPROVIDER_H

#include <string>
#include <vector>

#include "SliceProvider.h"

namespace icestream {

/**
 * Runs an external backup command and collects the slice directories it leaves below localDir.
 * The command template may use {dir}, {since} and {until}; timestamps are passed as UTC ISO strings.
 */
class CommandSliceProvider : public SliceProvider {
 public:
    explicit CommandSliceProvider(std::string commandTemplate);

    std::vector<std::string> fetchSlices(const std::string &localDir, Timestamp since, Timestamp until) override;

    std::string render(const std::string &localDir, Timestamp since, Timestamp until) const;

    // Directories ending in .zarr that hold a dataset descriptor, sorted by path
    static std::vector<std::string> collectSlices(const std::string &localDir);

 private:
    std::string commandTemplate;
};

}  // namespace icestream

#endif  // ICESTREAM_COMMANDSLICEPROVIDER_H
