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

#include "../../../src/util/Utils.h"

#include <cstdlib>
#include <stdexcept>

#include "gtest/gtest.h"

class UtilsTest : public ::testing::Test {
 protected:
    void SetUp() override {
        setenv("ICESTREAM_CONF", TEST_RESOURCE_DIR "icestream-test.properties", 1);
        Utils::resetProperties();
    }

    void TearDown() override {
        unsetenv("ICESTREAM_CONF");
        Utils::resetProperties();
        Utils::deleteDirectory(TEST_RESOURCE_DIR "temp/utils");
    }
};

TEST_F(UtilsTest, TestGetIceStreamProperty) {
    ASSERT_EQ(Utils::getIceStreamPropertiesPath(), TEST_RESOURCE_DIR "icestream-test.properties");
    ASSERT_EQ(Utils::getIceStreamProperty("org.icestream.mock.instrument"), "EK60");
    ASSERT_EQ(Utils::getIceStreamProperty("org.icestream.no.such.key"), "");
}

TEST_F(UtilsTest, TestPropertyValueMayContainSeparator) {
    ASSERT_EQ(Utils::getIceStreamProperty("org.icestream.provider.command"),
              "generate --range={since}..{until} --out={dir}");
}

TEST_F(UtilsTest, TestGetIceStreamIntProperty) {
    ASSERT_EQ(Utils::getIceStreamIntProperty("org.icestream.chunk.timestamp", 100), 50);
    ASSERT_EQ(Utils::getIceStreamIntProperty("org.icestream.no.such.key", 7), 7);
    ASSERT_THROW(Utils::getIceStreamIntProperty("org.icestream.mock.instrument", 1), std::invalid_argument);
}

TEST_F(UtilsTest, TestReplaceAll) {
    std::string actual = Utils::replaceAll("backup {dir} && ls {dir}", "{dir}", "/data");
    ASSERT_EQ(actual, "backup /data && ls /data");
}

TEST_F(UtilsTest, TestSplitAndTrim) {
    auto parts = Utils::split("instrument, settings_id", ',');
    ASSERT_EQ(parts.size(), 2);
    ASSERT_EQ(Utils::trim_copy(parts[1]), "settings_id");
    ASSERT_EQ(Utils::trim_copy("\t value \n"), "value");
}

TEST_F(UtilsTest, TestGetFileName) {
    ASSERT_EQ(Utils::getFileName("/root/EK80/demo/a.zarr/"), "a.zarr");
    ASSERT_EQ(Utils::getFileName("a.zarr"), "a.zarr");
}

TEST_F(UtilsTest, TestWriteFileContentAndFolderSize) {
    ASSERT_EQ(Utils::createDirectory(TEST_RESOURCE_DIR "temp/utils/nested"), 0);
    Utils::writeFileContent(TEST_RESOURCE_DIR "temp/utils/one.txt", "12345");
    Utils::writeFileContent(TEST_RESOURCE_DIR "temp/utils/nested/two.txt", "123");

    ASSERT_EQ(Utils::getFolderSize(TEST_RESOURCE_DIR "temp/utils"), 8);
}

TEST_F(UtilsTest, TestCopyToDirectory) {
    ASSERT_EQ(Utils::createDirectory(TEST_RESOURCE_DIR "temp/utils/source"), 0);
    Utils::writeFileContent(TEST_RESOURCE_DIR "temp/utils/source/slice.bin", "abc");
    ASSERT_EQ(Utils::copyToDirectory(TEST_RESOURCE_DIR "temp/utils/source/.", TEST_RESOURCE_DIR "temp/utils/kept"), 0);
    ASSERT_TRUE(Utils::fileExists(TEST_RESOURCE_DIR "temp/utils/kept/slice.bin"));
}
