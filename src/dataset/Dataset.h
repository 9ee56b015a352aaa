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

#ifndef ICESTREAM_DATASET_H
#define ICESTREAM_DATASET_H

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "../util/DateTime.h"

namespace icestream {

using AttributeValue = std::variant<std::string, int64_t, double, bool>;

std::string attributeToString(const AttributeValue &value);

// Row-major values laid out over an ordered list of dimensions
struct Variable {
    std::vector<std::string> dims;
    std::vector<double> values;
};

/**
 * An immutable-by-convention collection of named dimensions, variables and scalar attributes.
 * A variable whose name equals its only dimension is the coordinate of that dimension.
 * Time coordinates hold milliseconds since the Unix epoch.
 * All selection operations return new datasets and never modify the receiver.
 */
class Dataset {
 public:
    void setDimension(const std::string &name, size_t size);
    void setVariable(const std::string &name, std::vector<std::string> dims, std::vector<double> values);
    void setAttribute(const std::string &key, AttributeValue value);
    void setAttributes(const std::map<std::string, AttributeValue> &attributes);

    const std::map<std::string, size_t> &dimensions() const { return dims; }
    const std::map<std::string, Variable> &variables() const { return vars; }
    const std::map<std::string, AttributeValue> &attributes() const { return attrs; }

    bool hasDimension(const std::string &name) const { return dims.count(name) > 0; }
    bool hasVariable(const std::string &name) const { return vars.count(name) > 0; }
    // 0 when the dimension is absent
    size_t size(const std::string &dim) const;
    const Variable &variable(const std::string &name) const;
    // nullptr when the key is absent
    const AttributeValue *attribute(const std::string &key) const;
    const std::vector<double> &coordinate(const std::string &dim) const;

    Dataset isel(const std::string &dim, size_t start, size_t stop) const;
    Dataset take(const std::string &dim, const std::vector<size_t> &indices) const;
    // Drops the given dimensions and every variable that uses any of them
    Dataset dropDims(const std::set<std::string> &names) const;
    // Keeps only the given dimensions and the variables defined entirely on them
    Dataset selectDims(const std::set<std::string> &names) const;
    Dataset dropVariables(const std::set<std::string> &names) const;
    // Variables and attributes of other replace those with the same name
    Dataset merge(const Dataset &other) const;
    static Dataset concat(const Dataset &first, const Dataset &second, const std::string &dim);

    Timestamp firstTimestamp(const std::string &dim) const;
    Timestamp lastTimestamp(const std::string &dim) const;

    size_t nbytes() const;
    bool empty() const { return vars.empty(); }

    // Throws std::invalid_argument when a variable does not match its dimension sizes
    void validate() const;

 private:
    std::map<std::string, size_t> dims;
    std::map<std::string, Variable> vars;
    std::map<std::string, AttributeValue> attrs;
};

}  // namespace icestream

#endif  // ICESTREAM_DATASET_H
