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

#include "DatasetSerializer.h"

#include <cstring>
#include <fstream>
#include <sstream>

#include "../util/Utils.h"
#include "../util/logger/Logger.h"

Logger serializer_logger;

namespace icestream {

const char *DatasetSerializer::DESCRIPTOR_FILE = "dataset.json";

json DatasetSerializer::attributesToJson(const std::map<std::string, AttributeValue> &attributes) {
    json node = json::object();
    for (const auto &attr : attributes) {
        std::visit([&](const auto &value) { node[attr.first] = value; }, attr.second);
    }
    return node;
}

std::map<std::string, AttributeValue> DatasetSerializer::attributesFromJson(const json &node) {
    std::map<std::string, AttributeValue> attributes;
    for (auto it = node.begin(); it != node.end(); ++it) {
        const json &value = it.value();
        if (value.is_boolean()) {
            attributes[it.key()] = value.get<bool>();
        } else if (value.is_number_integer()) {
            attributes[it.key()] = value.get<int64_t>();
        } else if (value.is_number_float()) {
            attributes[it.key()] = value.get<double>();
        } else if (value.is_string()) {
            attributes[it.key()] = value.get<std::string>();
        } else {
            serializer_logger.warn("Ignoring attribute " + it.key() + " with unsupported type");
        }
    }
    return attributes;
}

std::string DatasetSerializer::encodeValues(const std::vector<double> &values) {
    std::string bytes(values.size() * sizeof(double), '\0');
    if (!values.empty()) {
        std::memcpy(&bytes[0], values.data(), bytes.size());
    }
    return bytes;
}

bool DatasetSerializer::decodeValues(const std::string &bytes, std::vector<double> &out) {
    if (bytes.size() % sizeof(double) != 0) {
        return false;
    }
    out.resize(bytes.size() / sizeof(double));
    if (!out.empty()) {
        std::memcpy(out.data(), bytes.data(), bytes.size());
    }
    return true;
}

bool DatasetSerializer::write(const Dataset &dataset, const std::string &dirPath) {
    if (Utils::createDirectory(dirPath) != 0) {
        serializer_logger.error("Cannot create slice directory " + dirPath);
        return false;
    }

    json descriptor;
    descriptor["dims"] = json::object();
    for (const auto &dim : dataset.dimensions()) {
        descriptor["dims"][dim.first] = dim.second;
    }
    descriptor["attrs"] = attributesToJson(dataset.attributes());
    descriptor["variables"] = json::object();
    for (const auto &entry : dataset.variables()) {
        descriptor["variables"][entry.first] = {{"dims", entry.second.dims}};

        std::ofstream out(dirPath + "/" + entry.first + ".bin", std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            serializer_logger.error("Cannot write variable " + entry.first + " to " + dirPath);
            return false;
        }
        std::string bytes = encodeValues(entry.second.values);
        out.write(bytes.data(), bytes.size());
        if (!out.good()) {
            serializer_logger.error("Short write for variable " + entry.first + " in " + dirPath);
            return false;
        }
    }

    std::ofstream out(dirPath + "/" + DESCRIPTOR_FILE, std::ios::trunc);
    if (!out.is_open()) {
        serializer_logger.error("Cannot write descriptor in " + dirPath);
        return false;
    }
    out << descriptor.dump(2);
    return out.good();
}

bool DatasetSerializer::read(const std::string &dirPath, Dataset &out) {
    std::string descriptorPath = dirPath + "/" + DESCRIPTOR_FILE;
    if (!Utils::fileExists(descriptorPath)) {
        serializer_logger.error("Slice descriptor not found: " + descriptorPath);
        return false;
    }

    json descriptor;
    try {
        std::ifstream in(descriptorPath);
        descriptor = json::parse(in);
    } catch (const json::exception &ex) {
        serializer_logger.error("Malformed slice descriptor " + descriptorPath + ": " + ex.what());
        return false;
    }

    Dataset dataset;
    try {
        for (auto it = descriptor.at("dims").begin(); it != descriptor.at("dims").end(); ++it) {
            dataset.setDimension(it.key(), it.value().get<size_t>());
        }
        if (descriptor.contains("attrs")) {
            dataset.setAttributes(attributesFromJson(descriptor["attrs"]));
        }
        for (auto it = descriptor.at("variables").begin(); it != descriptor.at("variables").end(); ++it) {
            std::ifstream in(dirPath + "/" + it.key() + ".bin", std::ios::binary);
            if (!in.is_open()) {
                serializer_logger.error("Missing values for variable " + it.key() + " in " + dirPath);
                return false;
            }
            std::stringstream buffer;
            buffer << in.rdbuf();
            std::vector<double> values;
            if (!decodeValues(buffer.str(), values)) {
                serializer_logger.error("Truncated values for variable " + it.key() + " in " + dirPath);
                return false;
            }
            dataset.setVariable(it.key(), it.value().at("dims").get<std::vector<std::string>>(), std::move(values));
        }
    } catch (const json::exception &ex) {
        serializer_logger.error("Invalid slice descriptor " + descriptorPath + ": " + ex.what());
        return false;
    } catch (const std::invalid_argument &ex) {
        serializer_logger.error("Inconsistent slice " + dirPath + ": " + ex.what());
        return false;
    }

    out = std::move(dataset);
    return true;
}

}  // namespace icestream
