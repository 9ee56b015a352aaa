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

#include "AppendabilityClassifier.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

#include "../util/Utils.h"
#include "../util/logger/Logger.h"

Logger classifier_logger;

namespace icestream {

SignificantAttributes SignificantAttributes::parse(const std::string &text) {
    std::vector<SignificantAttribute> keys;
    for (const auto &entry : Utils::split(text, ',')) {
        std::string item = Utils::trim_copy(entry);
        if (item.empty()) continue;
        SignificantAttribute attribute;
        size_t colon = item.find(':');
        attribute.key = Utils::trim_copy(item.substr(0, colon));
        if (attribute.key.empty()) {
            throw std::invalid_argument("Empty significant attribute key in '" + text + "'");
        }
        if (colon != std::string::npos) {
            std::string comparer = Utils::trim_copy(item.substr(colon + 1));
            if (comparer == "exact") {
                attribute.comparer = AttributeComparer::EXACT;
            } else if (comparer == "numeric") {
                attribute.comparer = AttributeComparer::NUMERIC;
            } else if (comparer == "nocase") {
                attribute.comparer = AttributeComparer::CASE_INSENSITIVE;
            } else {
                throw std::invalid_argument("Unknown comparer '" + comparer + "' for key " + attribute.key);
            }
        }
        keys.push_back(attribute);
    }
    return SignificantAttributes(keys);
}

static bool isNumber(const AttributeValue &value) {
    return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value);
}

static double toNumber(const AttributeValue &value) {
    if (const auto *integer = std::get_if<int64_t>(&value)) return static_cast<double>(*integer);
    if (const auto *real = std::get_if<double>(&value)) return *real;
    if (const auto *flag = std::get_if<bool>(&value)) return *flag ? 1.0 : 0.0;
    const std::string &text = std::get<std::string>(value);
    size_t consumed = 0;
    double parsed = std::stod(text, &consumed);
    if (consumed != text.size()) {
        throw std::invalid_argument("'" + text + "' is not a number");
    }
    return parsed;
}

static std::string lowered(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

bool attributesEqual(const AttributeValue &left, const AttributeValue &right, AttributeComparer comparer) {
    switch (comparer) {
        case AttributeComparer::NUMERIC:
            return toNumber(left) == toNumber(right);
        case AttributeComparer::CASE_INSENSITIVE:
            return lowered(attributeToString(left)) == lowered(attributeToString(right));
        case AttributeComparer::EXACT:
        default:
            if (isNumber(left) && isNumber(right)) {
                return toNumber(left) == toNumber(right);
            }
            return left == right;
    }
}

bool AppendabilityClassifier::isAppendable(const Dataset *prior, const Dataset &incoming,
                                           const SignificantAttributes &keys) {
    if (prior == nullptr) {
        return false;
    }
    try {
        for (const auto &attribute : keys.keys()) {
            const AttributeValue *left = prior->attribute(attribute.key);
            const AttributeValue *right = incoming.attribute(attribute.key);
            if (left == nullptr || right == nullptr) {
                classifier_logger.warn("Could not confirm compatibility, attribute " + attribute.key + " is missing");
                return false;
            }
            if (!attributesEqual(*left, *right, attribute.comparer)) {
                classifier_logger.debug("Significant key mismatch: " + attribute.key + " " +
                                        attributeToString(*left) + " != " + attributeToString(*right));
                return false;
            }
        }
    } catch (const std::exception &ex) {
        classifier_logger.warn(std::string("Could not confirm compatibility based on significant keys: ") + ex.what());
        return false;
    }
    return true;
}

bool AppendabilityClassifier::isWithinTimeframe(const Dataset *prior, const Dataset &incoming,
                                                int spanDays, DayBoundary boundary,
                                                const std::string &timeDim) {
    if (prior == nullptr) {
        return false;
    }
    try {
        Timestamp limit = DateTime::addDays(DateTime::dayStart(prior->firstTimestamp(timeDim), boundary), spanDays,
                                            boundary);
        Timestamp first = incoming.firstTimestamp(timeDim);
        if (first > limit) {
            classifier_logger.debug("Duration needs to be broken down, " + DateTime::toIsoString(first) +
                                    " is past " + DateTime::toIsoString(limit));
            return false;
        }
    } catch (const std::exception &ex) {
        classifier_logger.warn(std::string("Could not confirm compatibility based on timeframe: ") + ex.what());
        return false;
    }
    return true;
}

std::string AppendabilityClassifier::settingsFingerprint(const Dataset &slice, const SignificantAttributes &keys) {
    // 64-bit FNV-1a
    uint64_t hash = 1469598103934665603ULL;
    auto feed = [&hash](const std::string &text) {
        for (unsigned char c : text) {
            hash ^= c;
            hash *= 1099511628211ULL;
        }
        hash ^= 0xff;
        hash *= 1099511628211ULL;
    };
    for (const auto &attribute : keys.keys()) {
        feed(attribute.key);
        const AttributeValue *value = slice.attribute(attribute.key);
        feed(value ? attributeToString(*value) : std::string());
    }
    char buffer[17];
    snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash));
    return std::string(buffer).substr(0, 12);
}

}  // namespace icestream
