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

#include "Dataset.h"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace icestream {

std::string attributeToString(const AttributeValue &value) {
    if (const auto *text = std::get_if<std::string>(&value)) return *text;
    if (const auto *integer = std::get_if<int64_t>(&value)) return std::to_string(*integer);
    if (const auto *flag = std::get_if<bool>(&value)) return *flag ? "true" : "false";
    std::ostringstream out;
    out.precision(17);
    out << std::get<double>(value);
    return out.str();
}

static size_t axisOf(const Variable &var, const std::string &dim) {
    for (size_t i = 0; i < var.dims.size(); i++) {
        if (var.dims[i] == dim) return i;
    }
    return var.dims.size();
}

static size_t productOf(const std::map<std::string, size_t> &dims, const std::vector<std::string> &names,
                        size_t from, size_t to) {
    size_t product = 1;
    for (size_t i = from; i < to; i++) {
        product *= dims.at(names[i]);
    }
    return product;
}

void Dataset::setDimension(const std::string &name, size_t size) { dims[name] = size; }

void Dataset::setVariable(const std::string &name, std::vector<std::string> varDims, std::vector<double> values) {
    if (varDims.size() == 1 && dims.count(varDims[0]) == 0) {
        dims[varDims[0]] = values.size();
    }
    size_t expected = 1;
    for (const auto &dim : varDims) {
        auto it = dims.find(dim);
        if (it == dims.end()) {
            throw std::invalid_argument("Variable " + name + " uses unknown dimension " + dim);
        }
        expected *= it->second;
    }
    if (expected != values.size()) {
        throw std::invalid_argument("Variable " + name + " has " + std::to_string(values.size()) +
                                    " values, dimensions require " + std::to_string(expected));
    }
    vars[name] = Variable{std::move(varDims), std::move(values)};
}

void Dataset::setAttribute(const std::string &key, AttributeValue value) { attrs[key] = std::move(value); }

void Dataset::setAttributes(const std::map<std::string, AttributeValue> &attributes) { attrs = attributes; }

size_t Dataset::size(const std::string &dim) const {
    auto it = dims.find(dim);
    return it == dims.end() ? 0 : it->second;
}

const Variable &Dataset::variable(const std::string &name) const {
    auto it = vars.find(name);
    if (it == vars.end()) {
        throw std::out_of_range("No variable named " + name);
    }
    return it->second;
}

const AttributeValue *Dataset::attribute(const std::string &key) const {
    auto it = attrs.find(key);
    return it == attrs.end() ? nullptr : &it->second;
}

const std::vector<double> &Dataset::coordinate(const std::string &dim) const { return variable(dim).values; }

Dataset Dataset::take(const std::string &dim, const std::vector<size_t> &indices) const {
    auto dimIt = dims.find(dim);
    if (dimIt == dims.end()) {
        throw std::out_of_range("No dimension named " + dim);
    }
    size_t length = dimIt->second;
    for (size_t index : indices) {
        if (index >= length) {
            throw std::out_of_range("Index " + std::to_string(index) + " out of range for " + dim);
        }
    }

    Dataset result;
    result.dims = dims;
    result.dims[dim] = indices.size();
    result.attrs = attrs;
    for (const auto &entry : vars) {
        const Variable &var = entry.second;
        size_t axis = axisOf(var, dim);
        if (axis == var.dims.size()) {
            result.vars[entry.first] = var;
            continue;
        }
        size_t outer = productOf(dims, var.dims, 0, axis);
        size_t inner = productOf(dims, var.dims, axis + 1, var.dims.size());
        Variable selected{var.dims, {}};
        selected.values.reserve(outer * indices.size() * inner);
        for (size_t o = 0; o < outer; o++) {
            for (size_t index : indices) {
                auto begin = var.values.begin() + (o * length + index) * inner;
                selected.values.insert(selected.values.end(), begin, begin + inner);
            }
        }
        result.vars[entry.first] = std::move(selected);
    }
    return result;
}

Dataset Dataset::isel(const std::string &dim, size_t start, size_t stop) const {
    size_t length = size(dim);
    if (stop > length) stop = length;
    std::vector<size_t> indices;
    for (size_t i = start; i < stop; i++) {
        indices.push_back(i);
    }
    return take(dim, indices);
}

Dataset Dataset::dropDims(const std::set<std::string> &names) const {
    Dataset result;
    result.attrs = attrs;
    for (const auto &dim : dims) {
        if (names.count(dim.first) == 0) result.dims.insert(dim);
    }
    for (const auto &entry : vars) {
        bool uses = false;
        for (const auto &dim : entry.second.dims) {
            if (names.count(dim)) uses = true;
        }
        if (!uses) result.vars.insert(entry);
    }
    return result;
}

Dataset Dataset::selectDims(const std::set<std::string> &names) const {
    std::set<std::string> others;
    for (const auto &dim : dims) {
        if (names.count(dim.first) == 0) others.insert(dim.first);
    }
    return dropDims(others);
}

Dataset Dataset::dropVariables(const std::set<std::string> &names) const {
    Dataset result = *this;
    for (const auto &name : names) {
        result.vars.erase(name);
    }
    return result;
}

Dataset Dataset::merge(const Dataset &other) const {
    Dataset result = *this;
    for (const auto &dim : other.dims) {
        result.dims[dim.first] = dim.second;
    }
    for (const auto &entry : other.vars) {
        result.vars[entry.first] = entry.second;
    }
    for (const auto &attr : other.attrs) {
        result.attrs[attr.first] = attr.second;
    }
    result.validate();
    return result;
}

Dataset Dataset::concat(const Dataset &first, const Dataset &second, const std::string &dim) {
    if (!first.hasDimension(dim)) return second;
    if (!second.hasDimension(dim)) return first;

    Dataset result;
    result.dims = first.dims;
    result.dims[dim] = first.size(dim) + second.size(dim);
    result.attrs = first.attrs;
    for (const auto &entry : first.vars) {
        const Variable &left = entry.second;
        size_t axis = axisOf(left, dim);
        if (axis == left.dims.size()) {
            result.vars[entry.first] = left;
            continue;
        }
        auto rightIt = second.vars.find(entry.first);
        if (rightIt == second.vars.end() || rightIt->second.dims != left.dims) {
            throw std::invalid_argument("Cannot concatenate variable " + entry.first + " along " + dim);
        }
        const Variable &right = rightIt->second;
        size_t outer = productOf(first.dims, left.dims, 0, axis);
        size_t inner = productOf(first.dims, left.dims, axis + 1, left.dims.size());
        size_t leftBlock = first.size(dim) * inner;
        size_t rightBlock = second.size(dim) * inner;
        Variable joined{left.dims, {}};
        joined.values.reserve(left.values.size() + right.values.size());
        for (size_t o = 0; o < outer; o++) {
            joined.values.insert(joined.values.end(), left.values.begin() + o * leftBlock,
                                 left.values.begin() + (o + 1) * leftBlock);
            joined.values.insert(joined.values.end(), right.values.begin() + o * rightBlock,
                                 right.values.begin() + (o + 1) * rightBlock);
        }
        result.vars[entry.first] = std::move(joined);
    }
    result.validate();
    return result;
}

Timestamp Dataset::firstTimestamp(const std::string &dim) const {
    const auto &values = coordinate(dim);
    if (values.empty()) {
        throw std::out_of_range("Dimension " + dim + " is empty");
    }
    return DateTime::fromMillis(std::llround(values.front()));
}

Timestamp Dataset::lastTimestamp(const std::string &dim) const {
    const auto &values = coordinate(dim);
    if (values.empty()) {
        throw std::out_of_range("Dimension " + dim + " is empty");
    }
    return DateTime::fromMillis(std::llround(values.back()));
}

size_t Dataset::nbytes() const {
    size_t total = 0;
    for (const auto &entry : vars) {
        total += entry.second.values.size() * sizeof(double);
    }
    return total;
}

void Dataset::validate() const {
    for (const auto &entry : vars) {
        size_t expected = 1;
        for (const auto &dim : entry.second.dims) {
            auto it = dims.find(dim);
            if (it == dims.end()) {
                throw std::invalid_argument("Variable " + entry.first + " uses unknown dimension " + dim);
            }
            expected *= it->second;
        }
        if (expected != entry.second.values.size()) {
            throw std::invalid_argument("Variable " + entry.first + " does not match its dimension sizes");
        }
    }
}

}  // namespace icestream
