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

#include "../../../src/provider/CommandSliceProvider.h"

#include <stdexcept>

#include "../../../src/util/Utils.h"
#include "gtest/gtest.h"

using namespace icestream;

// 2024-03-01T00:00:00Z
static const int64_t MARCH_FIRST = 1709251200000;

class CommandSliceProviderTest : public ::testing::Test {
 protected:
    std::string localDir = TEST_RESOURCE_DIR "temp/command";

    void SetUp() override { Utils::createDirectory(localDir); }

    void TearDown() override { Utils::deleteDirectory(localDir); }
};

TEST_F(CommandSliceProviderTest, TestRender) {
    CommandSliceProvider provider("backup --since={since} --until={until} --out={dir}");
    ASSERT_EQ(provider.render("/tmp/w", DateTime::fromMillis(MARCH_FIRST), DateTime::fromMillis(MARCH_FIRST + 1500)),
              "backup --since=2024-03-01T00:00:00.000Z --until=2024-03-01T00:00:01.500Z --out='/tmp/w'");
}

TEST_F(CommandSliceProviderTest, TestFetchSlicesCollectsOutput) {
    CommandSliceProvider provider(
        "mkdir -p {dir}/EK80/b.zarr {dir}/EK80/a.zarr {dir}/EK80/notes && "
        "touch {dir}/EK80/b.zarr/dataset.json {dir}/EK80/a.zarr/dataset.json {dir}/EK80/notes/dataset.json");
    std::vector<std::string> slices =
        provider.fetchSlices(localDir, DateTime::fromMillis(MARCH_FIRST), DateTime::fromMillis(MARCH_FIRST + 1000));
    ASSERT_EQ(slices, (std::vector<std::string>{localDir + "/EK80/a.zarr", localDir + "/EK80/b.zarr"}));
}

TEST_F(CommandSliceProviderTest, TestFailingCommandThrows) {
    CommandSliceProvider provider("echo cannot reach instrument; exit 3");
    ASSERT_THROW(provider.fetchSlices(localDir, DateTime::fromMillis(MARCH_FIRST),
                                      DateTime::fromMillis(MARCH_FIRST + 1000)),
                 SliceProviderError);
}

TEST_F(CommandSliceProviderTest, TestEmptyOutputDirectory) {
    ASSERT_TRUE(CommandSliceProvider::collectSlices(localDir + "/absent").empty());
    ASSERT_THROW(CommandSliceProvider(""), std::invalid_argument);
}
