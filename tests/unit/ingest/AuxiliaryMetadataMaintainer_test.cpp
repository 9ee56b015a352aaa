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

#include "../../../src/ingest/AuxiliaryMetadataMaintainer.h"

#include <memory>

#include "../../../src/blob/LocalBlobStore.h"
#include "../../../src/ingest/StoreOperations.h"
#include "../../../src/storage/ChunkedArrayStore.h"
#include "../../../src/util/Utils.h"
#include "gtest/gtest.h"

using namespace icestream;

static Dataset withSetup(std::vector<double> retro, double firstMillis = 0, size_t highResRows = 0) {
    Dataset dataset;
    dataset.setVariable("timestamp", {"timestamp"}, {firstMillis, firstMillis + 1000});
    std::vector<double> gains;
    for (double value : retro) gains.push_back(value / 100);
    dataset.setVariable("retro", {"retro"}, retro);
    dataset.setVariable("retro_gain", {"retro"}, gains);
    dataset.setVariable("settings_id", {"settings_id"}, {1});
    if (highResRows > 0) {
        std::vector<double> highRes;
        for (size_t i = 0; i < highResRows; i++) highRes.push_back(firstMillis + 250.0 * static_cast<double>(i));
        dataset.setVariable("high_res_timestamp", {"high_res_timestamp"}, highRes);
    }
    return dataset;
}

class AuxiliaryMetadataMaintainerTest : public ::testing::Test {
 protected:
    std::string root = TEST_RESOURCE_DIR "temp/aux";
    std::string target = root + "/EK80/demo/inst-EK80-prj-demo-2024-03-01t00-00-00zl1b.zarr";
    std::shared_ptr<ChunkedArrayStore> store;
    IngestionConfig config;

    void SetUp() override {
        ChunkPolicy policy;
        policy.chunkSizes["high_res_timestamp"] = 4;
        store = std::make_shared<ChunkedArrayStore>(std::make_shared<LocalBlobStore>(), policy);
    }

    void TearDown() override { Utils::deleteDirectory(root); }
};

TEST_F(AuxiliaryMetadataMaintainerTest, TestMissingSetupData) {
    std::set<std::string> setupDims = {"retro", "settings_id"};
    Dataset missing =
        AuxiliaryMetadataMaintainer::missingSetupData(withSetup({11, 12, 13}), withSetup({10, 11}), setupDims);

    ASSERT_EQ(missing.coordinate("retro"), (std::vector<double>{10, 11, 12, 13}));
    ASSERT_EQ(missing.variable("retro_gain").values, (std::vector<double>{0.1, 0.11, 0.12, 0.13}));
    ASSERT_FALSE(missing.hasDimension("settings_id"));
    ASSERT_FALSE(missing.hasDimension("timestamp"));

    ASSERT_TRUE(
        AuxiliaryMetadataMaintainer::missingSetupData(withSetup({10}), withSetup({10, 11}), setupDims).empty());

    Dataset bare;
    bare.setVariable("timestamp", {"timestamp"}, {0});
    Dataset fresh = AuxiliaryMetadataMaintainer::missingSetupData(withSetup({5}), bare, setupDims);
    ASSERT_EQ(fresh.coordinate("retro"), (std::vector<double>{5}));
    ASSERT_EQ(fresh.coordinate("settings_id"), (std::vector<double>{1}));
}

TEST_F(AuxiliaryMetadataMaintainerTest, TestConformForAppend) {
    Dataset conformed = AuxiliaryMetadataMaintainer::conformForAppend(
        withSetup({11, 12}, 5000, 8), withSetup({10}), {"retro", "settings_id"}, "high_res_timestamp");
    ASSERT_EQ(conformed.coordinate("timestamp"), (std::vector<double>{5000, 6000}));
    ASSERT_EQ(conformed.coordinate("retro"), (std::vector<double>{10}));
    ASSERT_FALSE(conformed.hasDimension("high_res_timestamp"));
}

TEST_F(AuxiliaryMetadataMaintainerTest, TestMaintainCreatesThenExtendsSideload) {
    AuxiliaryMetadataMaintainer maintainer(store, config);
    std::string sideload = root + "/EK80/demo/setup.zarr";

    ASSERT_GT(maintainer.maintain(withSetup({10, 11}), target), 0);
    StoreResult<Dataset> created = store->readValues(sideload, Selection{});
    ASSERT_TRUE(created.ok());
    ASSERT_EQ(created->coordinate("retro"), (std::vector<double>{10, 11}));
    ASSERT_FALSE(created->hasDimension("timestamp"));

    ASSERT_EQ(maintainer.maintain(withSetup({11}), target), 0);

    ASSERT_GT(maintainer.maintain(withSetup({11, 12}), target), 0);
    StoreResult<Dataset> extended = store->readValues(sideload, Selection{});
    ASSERT_TRUE(extended.ok());
    ASSERT_EQ(extended->coordinate("retro"), (std::vector<double>{10, 11, 12}));
    ASSERT_EQ(extended->variable("retro_gain").values, (std::vector<double>{0.1, 0.11, 0.12}));
}

TEST_F(AuxiliaryMetadataMaintainerTest, TestAppendHighRes) {
    AuxiliaryMetadataMaintainer maintainer(store, config);
    size_t bytes = 0;

    ASSERT_FALSE(maintainer.appendHighRes(withSetup({10}), target, bytes).has_value());
    ASSERT_EQ(bytes, 0);

    std::optional<VersionId> first = maintainer.appendHighRes(withSetup({10}, 0, 8), target, bytes);
    ASSERT_TRUE(first.has_value());
    std::optional<VersionId> second = maintainer.appendHighRes(withSetup({10}, 2000, 8), target, bytes);
    ASSERT_TRUE(second.has_value());
    ASSERT_NE(*first, *second);
    ASSERT_GT(bytes, 0);

    std::string sibling = root + "/EK80/demo/inst-EK80-prj-demo-2024-03-01t00-00-00zl1b_high_res.zarr";
    StoreResult<DatasetMetadata> metadata = store->readMetadata(sibling);
    ASSERT_TRUE(metadata.ok());
    ASSERT_EQ(metadata->version, *second);
    ASSERT_EQ(metadata->dimensionSizes.at("high_res_timestamp"), 16);
    ASSERT_EQ(metadata->variables.count("retro"), 0);
}

TEST_F(AuxiliaryMetadataMaintainerTest, TestMergeMissingSetupIntoTarget) {
    AuxiliaryMetadataMaintainer maintainer(store, config);
    size_t bytes = 0;
    Dataset existing = withSetup({10});
    ASSERT_TRUE(
        StoreOperations::writeAndCommit(*store, target, existing, CreateMode{}, "create", true, bytes).ok());

    ASSERT_GT(maintainer.mergeMissingSetup(withSetup({10, 20}), existing, target), 0);
    StoreResult<Dataset> values = store->readValues(target, Selection{});
    ASSERT_TRUE(values.ok());
    ASSERT_EQ(values->coordinate("retro"), (std::vector<double>{10, 20}));
    ASSERT_EQ(values->size("timestamp"), 2);
}
