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

#ifndef ICESTREAM_APPENDABILITYCLASSIFIER_H
#define ICESTREAM_APPENDABILITYCLASSIFIER_H

#include <chrono>
#include <string>
#include <vector>

#include "../dataset/Dataset.h"
#include "../util/Conts.h"

namespace icestream {

enum class AttributeComparer { EXACT, NUMERIC, CASE_INSENSITIVE };

struct SignificantAttribute {
    std::string key;
    AttributeComparer comparer = AttributeComparer::EXACT;
};

// Ordered attribute keys that decide whether two slices belong to the same logical stream
class SignificantAttributes {
 public:
    SignificantAttributes() = default;
    explicit SignificantAttributes(std::vector<SignificantAttribute> keys) : keyList(std::move(keys)) {}

    /**
     * Parses a comma separated list of key[:comparer] entries, comparer being exact, numeric or nocase.
     * Throws std::invalid_argument for an unknown comparer or an empty key.
     */
    static SignificantAttributes parse(const std::string &text);

    const std::vector<SignificantAttribute> &keys() const { return keyList; }

 private:
    std::vector<SignificantAttribute> keyList;
};

// Throws std::invalid_argument when a numeric comparison meets a non-numeric value
bool attributesEqual(const AttributeValue &left, const AttributeValue &right, AttributeComparer comparer);

class AppendabilityClassifier {
 public:
    // True iff every significant key is present in both slices and compares equal
    static bool isAppendable(const Dataset *prior, const Dataset &incoming, const SignificantAttributes &keys);

    // True iff the incoming first timestamp is not later than spanDays calendar days after the prior first day start
    static bool isWithinTimeframe(const Dataset *prior, const Dataset &incoming, int spanDays,
                                  DayBoundary boundary, const std::string &timeDim = Conts::TIME_DIM);

    // Stable short hash of the significant attribute values
    static std::string settingsFingerprint(const Dataset &slice, const SignificantAttributes &keys);
};

}  // namespace icestream

#endif  // ICESTREAM_APPENDABILITYCLASSIFIER_H
