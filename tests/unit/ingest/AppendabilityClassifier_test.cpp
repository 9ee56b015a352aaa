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

#include "../../../src/ingest/AppendabilityClassifier.h"

#include <stdexcept>

#include "gtest/gtest.h"

using namespace icestream;

// 2024-03-01T00:00:00Z
static const int64_t MARCH_FIRST = 1709251200000;
static const int64_t HOUR = 3600000;

static Dataset slice(int64_t firstMillis, AttributeValue settingsId, const std::string &instrument = "EK80") {
    Dataset dataset;
    dataset.setVariable("timestamp", {"timestamp"},
                        {static_cast<double>(firstMillis), static_cast<double>(firstMillis + 1000)});
    dataset.setAttribute("instrument", instrument);
    dataset.setAttribute("settings_id", settingsId);
    return dataset;
}

class AppendabilityClassifierTest : public ::testing::Test {
 protected:
    SignificantAttributes keys = SignificantAttributes::parse("instrument:nocase, settings_id:numeric");
};

TEST_F(AppendabilityClassifierTest, TestParseSignificantKeys) {
    ASSERT_EQ(keys.keys().size(), 2);
    ASSERT_EQ(keys.keys()[0].key, "instrument");
    ASSERT_EQ(keys.keys()[0].comparer, AttributeComparer::CASE_INSENSITIVE);
    ASSERT_EQ(keys.keys()[1].comparer, AttributeComparer::NUMERIC);
    ASSERT_EQ(SignificantAttributes::parse("a,b").keys()[1].comparer, AttributeComparer::EXACT);
    ASSERT_THROW(SignificantAttributes::parse("instrument:fuzzy"), std::invalid_argument);
    ASSERT_THROW(SignificantAttributes::parse(":numeric"), std::invalid_argument);
}

TEST_F(AppendabilityClassifierTest, TestAppendableWhenKeysMatch) {
    Dataset prior = slice(MARCH_FIRST, int64_t(7));
    ASSERT_TRUE(AppendabilityClassifier::isAppendable(&prior, slice(MARCH_FIRST + HOUR, 7.0, "ek80"), keys));
    ASSERT_TRUE(AppendabilityClassifier::isAppendable(&prior, slice(MARCH_FIRST + HOUR, std::string("7")), keys));
}

TEST_F(AppendabilityClassifierTest, TestNotAppendable) {
    Dataset prior = slice(MARCH_FIRST, int64_t(7));
    ASSERT_FALSE(AppendabilityClassifier::isAppendable(nullptr, prior, keys));
    ASSERT_FALSE(AppendabilityClassifier::isAppendable(&prior, slice(MARCH_FIRST, int64_t(8)), keys));
    ASSERT_FALSE(AppendabilityClassifier::isAppendable(&prior, slice(MARCH_FIRST, std::string("seven")), keys));

    Dataset missing;
    missing.setVariable("timestamp", {"timestamp"}, {static_cast<double>(MARCH_FIRST)});
    missing.setAttribute("instrument", std::string("EK80"));
    ASSERT_FALSE(AppendabilityClassifier::isAppendable(&prior, missing, keys));
}

TEST_F(AppendabilityClassifierTest, TestExactComparer) {
    SignificantAttributes exact = SignificantAttributes::parse("instrument");
    Dataset prior = slice(MARCH_FIRST, int64_t(1));
    ASSERT_FALSE(AppendabilityClassifier::isAppendable(&prior, slice(MARCH_FIRST, int64_t(1), "ek80"), exact));
    ASSERT_TRUE(attributesEqual(int64_t(3), 3.0, AttributeComparer::EXACT));
    ASSERT_FALSE(attributesEqual(std::string("3"), int64_t(3), AttributeComparer::EXACT));
}

TEST_F(AppendabilityClassifierTest, TestWithinTimeframe) {
    Dataset prior = slice(MARCH_FIRST + 5 * HOUR, int64_t(7));
    int span = 1;

    ASSERT_TRUE(AppendabilityClassifier::isWithinTimeframe(&prior, slice(MARCH_FIRST + 23 * HOUR, int64_t(7)),
                                                           span, DayBoundary::UTC));
    // The limit is inclusive
    ASSERT_TRUE(AppendabilityClassifier::isWithinTimeframe(&prior, slice(MARCH_FIRST + 24 * HOUR, int64_t(7)),
                                                           span, DayBoundary::UTC));
    ASSERT_FALSE(AppendabilityClassifier::isWithinTimeframe(&prior, slice(MARCH_FIRST + 24 * HOUR + 1, int64_t(7)),
                                                            span, DayBoundary::UTC));
    ASSERT_TRUE(AppendabilityClassifier::isWithinTimeframe(&prior, slice(MARCH_FIRST + 30 * HOUR, int64_t(7)),
                                                           2, DayBoundary::UTC));
    ASSERT_FALSE(AppendabilityClassifier::isWithinTimeframe(nullptr, prior, span, DayBoundary::UTC));

    Dataset empty;
    ASSERT_FALSE(AppendabilityClassifier::isWithinTimeframe(&prior, empty, span, DayBoundary::UTC));
}

TEST_F(AppendabilityClassifierTest, TestSettingsFingerprint) {
    std::string first = AppendabilityClassifier::settingsFingerprint(slice(MARCH_FIRST, int64_t(7)), keys);
    ASSERT_EQ(first.size(), 12);
    ASSERT_EQ(first, AppendabilityClassifier::settingsFingerprint(slice(MARCH_FIRST + HOUR, int64_t(7)), keys));
    ASSERT_NE(first, AppendabilityClassifier::settingsFingerprint(slice(MARCH_FIRST, int64_t(8)), keys));
}
