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

#ifndef ICESTREAM_SLICEPROVIDER_H
#define ICESTREAM_SLICEPROVIDER_H

#include <stdexcept>
#include <string>
#include <vector>

#include "../util/DateTime.h"

namespace icestream {

class SliceProviderError : public std::runtime_error {
 public:
    explicit SliceProviderError(const std::string &message) : std::runtime_error(message) {}
};

// Source of local slice directories
class SliceProvider {
 public:
    virtual ~SliceProvider() = default;

    /**
     * Materializes the data available in [since, until) below localDir.
     * @return slice directories in time order; may cover only part of the range or be empty
     */
    virtual std::vector<std::string> fetchSlices(const std::string &localDir, Timestamp since, Timestamp until) = 0;
};

}  // namespace icestream

#endif  // ICESTREAM_SLICEPROVIDER_H
