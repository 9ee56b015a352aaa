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

#include "../../../src/ingest/StreamDriver.h"

#include <memory>

#include "../../../src/ingest/IngestionErrors.h"
#include "../../../src/ingest/TargetPaths.h"
#include "../../../src/provider/MockSliceProvider.h"
#include "../../../src/storage/ChunkedArrayStore.h"
#include "../../../src/util/Utils.h"
#include "IngestTestHelpers.h"
#include "gtest/gtest.h"

using namespace icestream;

// 2024-03-01T00:00:00Z
static const int64_t MARCH_FIRST = 1709251200000;
static const int64_t HOUR = 3600000;
static const int64_t DAY = 24 * HOUR;
static const char *FIRST_TARGET = "EK80/demo/inst-EK80-prj-demo-2024-03-01t00-00-00zl1b.zarr";
static const char *SECOND_TARGET = "EK80/demo/inst-EK80-prj-demo-2024-03-01t01-00-00zl1b.zarr";

class FailingProvider : public SliceProvider {
 public:
    std::vector<std::string> fetchSlices(const std::string &localDir, Timestamp since, Timestamp until) override {
        throw SliceProviderError("provider exited with status 2");
    }
};

static void expectGrid(const std::vector<double> &times, double first, double step, size_t count) {
    ASSERT_EQ(times.size(), count);
    for (size_t i = 0; i < times.size(); i++) {
        ASSERT_EQ(times[i], first + step * static_cast<double>(i)) << "row " << i;
    }
}

class StreamDriverTest : public ::testing::Test {
 protected:
    std::string root = TEST_RESOURCE_DIR "temp/driver";
    std::shared_ptr<LocalBlobStore> blobs = std::make_shared<LocalBlobStore>();
    std::shared_ptr<CrashingArrayStore> store;
    IngestionConfig config;
    MockSliceConfig mock;
    DriverOptions options;
    Timestamp now = DateTime::fromMillis(MARCH_FIRST + HOUR);

    void SetUp() override {
        config.dayBoundary = DayBoundary::UTC;
        config.daysPerFile = 1;
        config.streamingMinutes = 30;
        config.chunkSize = 100;
        config.highResChunkSize = 40;
        createStore();

        options.localRoot = root + "/local";
        options.targetRoot = root + "/targets";
        options.hints.since = DateTime::fromMillis(MARCH_FIRST);
    }

    void TearDown() override { Utils::deleteDirectory(root); }

    void createStore() {
        ChunkPolicy policy;
        policy.chunkSizes[config.timeDim] = config.chunkSize;
        policy.chunkSizes[config.highResDim] = config.highResChunkSize;
        store = std::make_shared<CrashingArrayStore>(std::make_shared<ChunkedArrayStore>(blobs, policy));
    }

    std::unique_ptr<StreamDriver> driver(std::shared_ptr<SliceProvider> provider = nullptr) {
        if (!provider) {
            provider = std::make_shared<MockSliceProvider>(mock);
        }
        return std::make_unique<StreamDriver>(options, config, store, blobs, provider, [this]() { return now; });
    }

    std::string pathOf(const std::string &pointer) { return TargetPaths::resolve(options.targetRoot, pointer); }

    Dataset contents(const std::string &path) {
        StoreResult<Dataset> values = store->readValues(path, Selection{});
        EXPECT_TRUE(values.ok()) << values.status.toString();
        return values.value;
    }

    TransactionState persistedState() {
        return TransactionLog::loadState(options.localRoot + "/" + config.stateFileName);
    }
};

TEST_F(StreamDriverTest, TestColdStartThenResume) {
    RunSummary first = driver()->run();
    ASSERT_EQ(first.commits, 1);
    ASSERT_EQ(first.slicesIngested, 1);
    ASSERT_EQ(first.windows, 2);
    ASSERT_GT(first.bytes, 0);

    // 360 rows in the first hour, aligned down to 300
    Dataset created = contents(pathOf(FIRST_TARGET));
    expectGrid(created.coordinate("timestamp"), MARCH_FIRST, 10000, 300);
    ASSERT_EQ(created.size("wave"), 4);
    expectGrid(contents(TargetPaths::highResSibling(pathOf(FIRST_TARGET))).coordinate("high_res_timestamp"),
               MARCH_FIRST, 2500, 1200);

    Dataset setup = contents(TargetPaths::sideloadPath(pathOf(FIRST_TARGET)));
    ASSERT_EQ(setup.coordinate("retro"), (std::vector<double>{10, 11}));
    ASSERT_EQ(setup.coordinate("settings_id"), (std::vector<double>{1}));

    std::string tag = "settings-" + AppendabilityClassifier::settingsFingerprint(created, config.significantKeys) +
                      "-start";
    VersionId head = store->resolveBranch(pathOf(FIRST_TARGET), "main").value;
    ASSERT_EQ(store->createTag(RepositoryHandle{pathOf(FIRST_TARGET)}, tag, head).code, ErrorCode::ALREADY_EXISTS);

    TransactionState state = persistedState();
    ASSERT_TRUE(state.isClean());
    ASSERT_EQ(state.lastValidTarget, FIRST_TARGET);

    now = DateTime::fromMillis(MARCH_FIRST + 2 * HOUR);
    RunSummary second = driver()->run();
    ASSERT_EQ(second.commits, 1);

    // The deferred tail of the first run is picked up again, nothing is duplicated
    Dataset appended = contents(pathOf(FIRST_TARGET));
    expectGrid(appended.coordinate("timestamp"), MARCH_FIRST, 10000, 700);
    ASSERT_EQ(appended.variable("backscatter").values.size(), 700 * 4);
    ASSERT_EQ(appended.coordinate("retro"), (std::vector<double>{10, 11}));
    expectGrid(contents(TargetPaths::highResSibling(pathOf(FIRST_TARGET))).coordinate("high_res_timestamp"),
               MARCH_FIRST, 2500, 2800);
    ASSERT_EQ(persistedState().lastValidTarget, FIRST_TARGET);

    RunSummary idle = driver()->run();
    ASSERT_EQ(idle.commits, 0);
    ASSERT_EQ(contents(pathOf(FIRST_TARGET)).size("timestamp"), 700);
}

TEST_F(StreamDriverTest, TestCrashDuringAppendIsRolledBack) {
    driver()->run();

    now = DateTime::fromMillis(MARCH_FIRST + 2 * HOUR);
    store->crashOnCommit = store->commits + 1;
    ASSERT_THROW(driver()->run(), FatalIngestionError);

    TransactionState crashed = persistedState();
    ASSERT_EQ(crashed.incompleteTarget, FIRST_TARGET);
    ASSERT_EQ(crashed.lastValidTarget, "");
    ASSERT_EQ(store->readMetadata(pathOf(FIRST_TARGET))->dimensionSizes.at("timestamp"), 700);

    store->crashOnCommit = -1;
    RunSummary recovered = driver()->run();
    ASSERT_EQ(recovered.commits, 1);

    expectGrid(contents(pathOf(FIRST_TARGET)).coordinate("timestamp"), MARCH_FIRST, 10000, 700);
    expectGrid(contents(TargetPaths::highResSibling(pathOf(FIRST_TARGET))).coordinate("high_res_timestamp"),
               MARCH_FIRST, 2500, 2800);
    TransactionState state = persistedState();
    ASSERT_TRUE(state.isClean());
    ASSERT_EQ(state.lastValidTarget, FIRST_TARGET);
}

TEST_F(StreamDriverTest, TestCrashRecordingHighResolutionVersionIsRolledBack) {
    driver()->run();

    now = DateTime::fromMillis(MARCH_FIRST + 2 * HOUR);
    std::string highRes = TargetPaths::highResSibling(pathOf(FIRST_TARGET));
    store->crashOnRef = [highRes](const std::string &location, const std::string &ref) {
        return location == highRes && ref.rfind("checkpoint-", 0) == 0;
    };
    ASSERT_THROW(driver()->run(), FatalIngestionError);
    ASSERT_EQ(persistedState().incompleteTarget, FIRST_TARGET);

    store->crashOnRef = nullptr;
    RunSummary recovered = driver()->run();
    ASSERT_EQ(recovered.commits, 1);

    expectGrid(contents(pathOf(FIRST_TARGET)).coordinate("timestamp"), MARCH_FIRST, 10000, 700);
    expectGrid(contents(highRes).coordinate("high_res_timestamp"), MARCH_FIRST, 2500, 2800);
    ASSERT_TRUE(persistedState().isClean());
}

TEST_F(StreamDriverTest, TestCrashAfterCheckpointKeepsHighResolutionData) {
    std::string target = pathOf(FIRST_TARGET);
    store->crashOnRef = [target](const std::string &location, const std::string &ref) {
        return location == target && ref == "valid";
    };
    store->refBeforeCrash = true;
    ASSERT_THROW(driver()->run(), FatalIngestionError);
    ASSERT_EQ(persistedState().incompleteTarget, FIRST_TARGET);

    store->crashOnRef = nullptr;
    RunSummary recovered = driver()->run();
    ASSERT_EQ(recovered.commits, 0);

    expectGrid(contents(target).coordinate("timestamp"), MARCH_FIRST, 10000, 300);
    expectGrid(contents(TargetPaths::highResSibling(target)).coordinate("high_res_timestamp"), MARCH_FIRST, 2500,
               1200);
    TransactionState state = persistedState();
    ASSERT_TRUE(state.isClean());
    ASSERT_EQ(state.lastValidTarget, FIRST_TARGET);

    now = DateTime::fromMillis(MARCH_FIRST + 2 * HOUR);
    driver()->run();
    expectGrid(contents(target).coordinate("timestamp"), MARCH_FIRST, 10000, 700);
    expectGrid(contents(TargetPaths::highResSibling(target)).coordinate("high_res_timestamp"), MARCH_FIRST, 2500,
               2800);
}

TEST_F(StreamDriverTest, TestCrashCreatingTargetIsDeleted) {
    mock.settingsChangeAt = DateTime::fromMillis(MARCH_FIRST + HOUR);
    now = DateTime::fromMillis(MARCH_FIRST + 2 * HOUR);
    // Main, high resolution and sideload commits of the first target precede the fourth
    store->crashOnCommit = 4;
    ASSERT_THROW(driver()->run(), FatalIngestionError);

    TransactionState crashed = persistedState();
    ASSERT_EQ(crashed.incompleteTarget, SECOND_TARGET);
    ASSERT_EQ(crashed.lastValidTarget, FIRST_TARGET);
    ASSERT_TRUE(Utils::fileExists(pathOf(SECOND_TARGET)));

    RunSummary recovered = driver()->run();
    ASSERT_EQ(recovered.commits, 1);

    expectGrid(contents(pathOf(FIRST_TARGET)).coordinate("timestamp"), MARCH_FIRST, 10000, 300);
    Dataset second = contents(pathOf(SECOND_TARGET));
    expectGrid(second.coordinate("timestamp"), MARCH_FIRST + HOUR, 10000, 300);
    ASSERT_EQ(attributeToString(*second.attribute("settings_id")), "2");
    expectGrid(contents(TargetPaths::highResSibling(pathOf(SECOND_TARGET))).coordinate("high_res_timestamp"),
               MARCH_FIRST + HOUR, 2500, 1200);

    Dataset setup = contents(TargetPaths::sideloadPath(pathOf(SECOND_TARGET)));
    ASSERT_EQ(setup.coordinate("retro"), (std::vector<double>{10, 11, 20, 21}));
    ASSERT_EQ(setup.coordinate("settings_id"), (std::vector<double>{1, 2}));

    TransactionState state = persistedState();
    ASSERT_TRUE(state.isClean());
    ASSERT_EQ(state.lastValidTarget, SECOND_TARGET);
    ASSERT_EQ(state.penultimateValidTarget, FIRST_TARGET);
}

TEST_F(StreamDriverTest, TestHighResolutionTailIsDeferredWithPrimaryTail) {
    config.highResChunkSize = 1000;
    createStore();

    for (int64_t hours = 1; hours <= 4; hours++) {
        now = DateTime::fromMillis(MARCH_FIRST + hours * HOUR);
        driver()->run();
    }

    // 4 high resolution rows per primary row fill chunks of 1000 every 500 primary rows
    expectGrid(contents(pathOf(FIRST_TARGET)).coordinate("timestamp"), MARCH_FIRST, 10000, 1000);
    expectGrid(contents(TargetPaths::highResSibling(pathOf(FIRST_TARGET))).coordinate("high_res_timestamp"),
               MARCH_FIRST, 2500, 4000);
}

TEST_F(StreamDriverTest, TestCatchUpOverSeveralDays) {
    now = DateTime::fromMillis(MARCH_FIRST + 2 * DAY + 2 * HOUR);
    RunSummary summary = driver()->run();
    ASSERT_EQ(summary.commits, 3);
    // The last window holds no complete row and moves on by one day
    ASSERT_EQ(summary.windows, 4);

    const std::string second = "EK80/demo/inst-EK80-prj-demo-2024-03-02t00-26-40zl1b.zarr";
    const std::string third = "EK80/demo/inst-EK80-prj-demo-2024-03-03t00-20-00zl1b.zarr";
    // Every window reaches 30 minutes past midnight and every day starts a new target
    expectGrid(contents(pathOf(FIRST_TARGET)).coordinate("timestamp"), MARCH_FIRST, 10000, 8800);
    expectGrid(contents(pathOf(second)).coordinate("timestamp"), MARCH_FIRST + DAY + 1600000, 10000, 8600);
    expectGrid(contents(pathOf(third)).coordinate("timestamp"), MARCH_FIRST + 2 * DAY + 1200000, 10000, 600);
    expectGrid(contents(TargetPaths::highResSibling(pathOf(third))).coordinate("high_res_timestamp"),
               MARCH_FIRST + 2 * DAY + 1200000, 2500, 2400);

    TransactionState state = persistedState();
    ASSERT_TRUE(state.isClean());
    ASSERT_EQ(state.lastValidTarget, third);
    ASSERT_EQ(state.penultimateValidTarget, second);

    RunSummary idle = driver()->run();
    ASSERT_EQ(idle.commits, 0);
}

TEST_F(StreamDriverTest, TestProviderFailureIsFatal) {
    ASSERT_THROW(driver(std::make_shared<FailingProvider>())->run(), FatalIngestionError);
    ASSERT_EQ(persistedState(), TransactionState{});
    ASSERT_FALSE(Utils::fileExists(options.targetRoot));
}

TEST_F(StreamDriverTest, TestKeepFiles) {
    options.keepFilesDir = root + "/kept";
    driver()->run();
    ASSERT_TRUE(Utils::fileExists(options.keepFilesDir + "/" + FIRST_TARGET + "/dataset.json"));
    ASSERT_TRUE(Utils::fileExists(pathOf(FIRST_TARGET)));
}

TEST_F(StreamDriverTest, TestHistoryIsRecorded) {
    auto history = std::make_shared<IngestionHistoryDB>(root + "/history.db");
    Utils::createDirectory(root);
    ASSERT_EQ(history->init(), 0);

    std::unique_ptr<StreamDriver> first = driver();
    first->setHistory(history);
    first->run();

    now = DateTime::fromMillis(MARCH_FIRST + 2 * HOUR);
    store->crashOnCommit = store->commits + 1;
    std::unique_ptr<StreamDriver> second = driver();
    second->setHistory(history);
    ASSERT_THROW(second->run(), FatalIngestionError);

    auto runs = history->runSelect("SELECT status, commits, windows FROM ingestion_run ORDER BY idrun;");
    ASSERT_EQ(runs.size(), 2);
    ASSERT_EQ(runs[0][0].second, "completed");
    ASSERT_EQ(runs[0][1].second, "1");
    ASSERT_EQ(runs[0][2].second, "2");
    ASSERT_EQ(runs[1][0].second, "failed");

    auto transactions = history->runSelect("SELECT target, mode FROM ingestion_transaction;");
    ASSERT_EQ(transactions.size(), 1);
    ASSERT_EQ(transactions[0][0].second, FIRST_TARGET);
    ASSERT_EQ(transactions[0][1].second, "create");
}

TEST(RunSummaryTest, TestToString) {
    RunSummary summary;
    summary.bytes = 3 * 1024 * 1024;
    summary.elapsedSeconds = 1.5;
    ASSERT_EQ(summary.toString(), "Streaming completed in 1.50 seconds, 3.00 MB uploaded, at 2.00 MB/s");
}
