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

#ifndef ICESTREAM_STREAMDRIVER_H
#define ICESTREAM_STREAMDRIVER_H

#include <memory>
#include <optional>
#include <string>

#include "../blob/BlobStore.h"
#include "../historydb/IngestionHistoryDB.h"
#include "../provider/SliceProvider.h"
#include "../storage/ArrayStore.h"
#include "AuxiliaryMetadataMaintainer.h"
#include "ChunkAligner.h"
#include "IngestionConfig.h"
#include "TimeWindowDiscoverer.h"
#include "TransactionLog.h"

namespace icestream {

struct RunSummary {
    size_t bytes = 0;
    double elapsedSeconds = 0;
    size_t slicesIngested = 0;
    size_t commits = 0;
    size_t windows = 0;

    double megabytes() const { return static_cast<double>(bytes) / (1024.0 * 1024.0); }

    std::string toString() const;
};

struct DriverOptions {
    // Holds the transaction log file and per window scratch directories
    std::string localRoot;
    std::string targetRoot;
    TimeHints hints;
    // Copy of every fetched window when not empty
    std::string keepFilesDir;
};

/**
 * One catch-up run: recovery, then windows from the last ingested timestamp until the wall clock
 * or the until hint. FatalIngestionError leaves the transaction log in its last persisted state.
 */
class StreamDriver {
 public:
    StreamDriver(DriverOptions options, IngestionConfig config, std::shared_ptr<ArrayStore> store,
                 std::shared_ptr<BlobStore> blobs, std::shared_ptr<SliceProvider> provider,
                 Clock clock = DateTime::now);

    // Optional; recording failures never abort ingestion
    void setHistory(std::shared_ptr<IngestionHistoryDB> history);

    RunSummary run();

    const TransactionLog *transactionLog() const { return log.get(); }

 private:
    DriverOptions options;
    IngestionConfig config;
    std::shared_ptr<ArrayStore> store;
    std::shared_ptr<BlobStore> blobs;
    std::shared_ptr<SliceProvider> provider;
    Clock clock;
    ChunkAligner aligner;
    AuxiliaryMetadataMaintainer maintainer;
    std::shared_ptr<IngestionHistoryDB> history;
    std::unique_ptr<TransactionLog> log;
    std::optional<ValidatedTarget> last;
    long runId = -1;

    bool streamWindow(const TimeWindow &window, RunSummary &summary);
    bool ingestSlice(const std::string &slicePath, const std::string &localDir, RunSummary &summary);
    void appendToTarget(const Dataset &aligned, RunSummary &summary);
    void startTarget(const Dataset &aligned, const std::string &pointer, RunSummary &summary);
    void completeTarget(const Dataset &aligned, const std::string &path, const VersionId &version,
                        const std::string &mode, size_t bytes, bool newStream, RunSummary &summary);
    void tagStreamStart(const Dataset &aligned, const std::string &path, const VersionId &version);
    void keepFiles(const std::string &localDir);
    Dataset dropIngested(const Dataset &slice) const;
    void finishHistory(const RunSummary &summary, const std::string &status, const std::string &message);
};

}  // namespace icestream

#endif  // ICESTREAM_STREAMDRIVER_H
