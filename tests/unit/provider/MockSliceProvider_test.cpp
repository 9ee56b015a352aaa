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

#include "../../../src/provider/MockSliceProvider.h"

#include <stdexcept>

#include "../../../src/dataset/DatasetSerializer.h"
#include "../../../src/util/Utils.h"
#include "gtest/gtest.h"

using namespace icestream;

// 2024-03-01T00:00:00Z
static const int64_t MARCH_FIRST = 1709251200000;

class MockSliceProviderTest : public ::testing::Test {
 protected:
    std::string localDir = TEST_RESOURCE_DIR "temp/mock";

    void TearDown() override { Utils::deleteDirectory(localDir); }
};

TEST_F(MockSliceProviderTest, TestGenerateOnCadenceGrid) {
    MockSliceProvider provider(MockSliceConfig{});
    Dataset slice =
        provider.generate(DateTime::fromMillis(MARCH_FIRST + 1), DateTime::fromMillis(MARCH_FIRST + 60000), 3);

    ASSERT_EQ(slice.coordinate("timestamp"),
              (std::vector<double>{MARCH_FIRST + 10000.0, MARCH_FIRST + 20000.0, MARCH_FIRST + 30000.0,
                                   MARCH_FIRST + 40000.0, MARCH_FIRST + 50000.0}));
    ASSERT_EQ(slice.size("wave"), 4);
    ASSERT_EQ(slice.variable("backscatter").values.size(), 20);
    ASSERT_EQ(slice.size("high_res_timestamp"), 20);
    ASSERT_EQ(slice.coordinate("high_res_timestamp")[1], MARCH_FIRST + 12500.0);
    ASSERT_EQ(slice.coordinate("retro"), (std::vector<double>{30, 31}));
    ASSERT_EQ(slice.coordinate("settings_id"), (std::vector<double>{3}));
    ASSERT_EQ(attributeToString(*slice.attribute("settings_id")), "3");
    ASSERT_EQ(attributeToString(*slice.attribute("instrument")), "EK80");
    ASSERT_NO_THROW(slice.validate());

    ASSERT_TRUE(provider.generate(DateTime::fromMillis(MARCH_FIRST + 1), DateTime::fromMillis(MARCH_FIRST + 9999), 1)
                    .empty());
}

TEST_F(MockSliceProviderTest, TestGenerateIsDeterministic) {
    MockSliceProvider provider(MockSliceConfig{});
    Timestamp since = DateTime::fromMillis(MARCH_FIRST);
    Timestamp until = DateTime::fromMillis(MARCH_FIRST + 600000);
    Dataset first = provider.generate(since, until, 1);
    Dataset second = provider.generate(since, until, 1);
    ASSERT_EQ(first.variable("backscatter").values, second.variable("backscatter").values);
    ASSERT_EQ(first.variable("high_res_signal").values, second.variable("high_res_signal").values);
}

TEST_F(MockSliceProviderTest, TestFetchSlicesWritesNamedSlices) {
    MockSliceProvider provider(MockSliceConfig{});
    std::vector<std::string> paths =
        provider.fetchSlices(localDir, DateTime::fromMillis(MARCH_FIRST), DateTime::fromMillis(MARCH_FIRST + 3600000));

    ASSERT_EQ(paths.size(), 1);
    ASSERT_EQ(paths[0], localDir + "/EK80/demo/inst-EK80-prj-demo-2024-03-01t00-00-00zl1b.zarr");
    Dataset slice;
    ASSERT_TRUE(DatasetSerializer::read(paths[0], slice));
    ASSERT_EQ(slice.size("timestamp"), 360);
}

TEST_F(MockSliceProviderTest, TestSettingsChangeSplitsSlices) {
    MockSliceConfig config;
    config.settingsChangeAt = DateTime::fromMillis(MARCH_FIRST + 1800000);
    MockSliceProvider provider(config);
    std::vector<std::string> paths =
        provider.fetchSlices(localDir, DateTime::fromMillis(MARCH_FIRST), DateTime::fromMillis(MARCH_FIRST + 3600000));

    ASSERT_EQ(paths.size(), 2);
    ASSERT_EQ(paths[1], localDir + "/EK80/demo/inst-EK80-prj-demo-2024-03-01t00-30-00zl1b.zarr");
    Dataset before;
    Dataset after;
    ASSERT_TRUE(DatasetSerializer::read(paths[0], before));
    ASSERT_TRUE(DatasetSerializer::read(paths[1], after));
    ASSERT_EQ(before.size("timestamp"), 180);
    ASSERT_EQ(after.size("timestamp"), 180);
    ASSERT_EQ(attributeToString(*before.attribute("settings_id")), "1");
    ASSERT_EQ(attributeToString(*after.attribute("settings_id")), "2");

    std::vector<std::string> later = provider.fetchSlices(localDir, DateTime::fromMillis(MARCH_FIRST + 3600000),
                                                          DateTime::fromMillis(MARCH_FIRST + 3660000));
    ASSERT_EQ(later.size(), 1);
    Dataset changed;
    ASSERT_TRUE(DatasetSerializer::read(later[0], changed));
    ASSERT_EQ(changed.coordinate("retro"), (std::vector<double>{20, 21}));
}

TEST_F(MockSliceProviderTest, TestRejectsInvalidConfig) {
    MockSliceConfig config;
    config.cadenceSeconds = 0;
    ASSERT_THROW(MockSliceProvider{config}, std::invalid_argument);
    config.cadenceSeconds = 10;
    config.highResFactor = -1;
    ASSERT_THROW(MockSliceProvider{config}, std::invalid_argument);
}
