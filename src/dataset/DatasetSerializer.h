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

#ifndef ICESTREAM_DATASETSERIALIZER_H
#define ICESTREAM_DATASETSERIALIZER_H

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "Dataset.h"

using json = nlohmann::json;

namespace icestream {

/**
 * Local slice directory layout: <dir>/dataset.json holds dims, attrs and variable descriptors,
 * and <dir>/<variable>.bin holds the raw little-endian doubles of each variable.
 */
class DatasetSerializer {
 public:
    static const char *DESCRIPTOR_FILE;

    static bool write(const Dataset &dataset, const std::string &dirPath);

    static bool read(const std::string &dirPath, Dataset &out);

    static json attributesToJson(const std::map<std::string, AttributeValue> &attributes);

    static std::map<std::string, AttributeValue> attributesFromJson(const json &node);

    static std::string encodeValues(const std::vector<double> &values);

    static bool decodeValues(const std::string &bytes, std::vector<double> &out);
};

}  // namespace icestream

#endif  // ICESTREAM_DATASETSERIALIZER_H
