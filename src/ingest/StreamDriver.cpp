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

#include "StreamDriver.h"

#include <chrono>
#include <iomanip>
#include <sstream>

#include "../dataset/DatasetSerializer.h"
#include "../util/Utils.h"
#include "../util/logger/Logger.h"
#include "AppendabilityClassifier.h"
#include "IngestionErrors.h"
#include "StoreOperations.h"
#include "TargetPaths.h"

Logger driver_logger;

namespace icestream {

namespace {

// Scratch directory of one window, removed when the window is done
class WorkDirectory {
 public:
    explicit WorkDirectory(const std::string &path) : path(path) {
        if (Utils::fileExists(path)) {
            Utils::deleteDirectory(path);
        }
        if (Utils::createDirectory(path) != 0) {
            throw FatalIngestionError("Cannot create work directory " + path);
        }
    }

    ~WorkDirectory() {
        if (Utils::deleteDirectory(path) != 0) {
            driver_logger.warn("Could not remove work directory " + path);
        }
    }

    WorkDirectory(const WorkDirectory &) = delete;
    WorkDirectory &operator=(const WorkDirectory &) = delete;

 private:
    std::string path;
};

}  // namespace

std::string RunSummary::toString() const {
    double rate = elapsedSeconds > 0 ? megabytes() / elapsedSeconds : 0;
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << "Streaming completed in " << elapsedSeconds << " seconds, "
        << megabytes() << " MB uploaded, at " << rate << " MB/s";
    return out.str();
}

StreamDriver::StreamDriver(DriverOptions options, IngestionConfig config, std::shared_ptr<ArrayStore> store,
                           std::shared_ptr<BlobStore> blobs, std::shared_ptr<SliceProvider> provider, Clock clock)
    : options(std::move(options)),
      config(config),
      store(store),
      blobs(std::move(blobs)),
      provider(std::move(provider)),
      clock(std::move(clock)),
      aligner(config.timeDim, config.chunkSize, config.highResDim, config.highResChunkSize),
      maintainer(store, config) {}

void StreamDriver::setHistory(std::shared_ptr<IngestionHistoryDB> history) { this->history = std::move(history); }

RunSummary StreamDriver::run() {
    auto started = std::chrono::steady_clock::now();
    RunSummary summary;

    if (Utils::createDirectory(options.localRoot) != 0) {
        throw FatalIngestionError("Cannot create local root " + options.localRoot);
    }
    log = std::make_unique<TransactionLog>(options.localRoot + "/" + config.stateFileName, store, blobs,
                                           options.targetRoot, config);
    if (history) {
        runId = history->startRun(options.localRoot, options.targetRoot);
        if (runId < 0) {
            driver_logger.warn("Could not record the start of this run");
        }
    }

    try {
        RecoveryResult recovery = log->initializeAndValidatePaths();
        last.reset();
        if (recovery.available) {
            last = recovery.target;
        }

        TimeWindowDiscoverer discoverer(config, clock);
        std::optional<Timestamp> lastIngested;
        if (last) {
            lastIngested = last->slice.lastTimestamp(config.timeDim);
        }
        TimeWindow window = discoverer.discover(lastIngested, options.hints);
        while (!window.empty()) {
            summary.windows++;
            bool wrote = streamWindow(window, summary);

            Timestamp since = config.spanEnd(window.since);
            if (wrote) {
                since = last->slice.lastTimestamp(config.timeDim) + DateTime::SMALLEST_INCREMENT;
                if (since <= window.since) {
                    since = config.spanEnd(window.since);
                }
            } else {
                driver_logger.info("Nothing ingested for " + window.toString() + ", moving on by " +
                                   std::to_string(config.daysPerFile) + " day(s)");
            }
            window = TimeWindow{since, discoverer.untilFor(since, options.hints)};
        }
        driver_logger.info("Caught up to " + DateTime::toIsoString(window.until));
    } catch (const std::exception &ex) {
        summary.elapsedSeconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        finishHistory(summary, "failed", ex.what());
        throw;
    }

    summary.elapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    finishHistory(summary, "completed", "");
    driver_logger.info(summary.toString());
    return summary;
}

bool StreamDriver::streamWindow(const TimeWindow &window, RunSummary &summary) {
    driver_logger.info("Fetching data for " + window.toString());
    std::string localDir = options.localRoot + "/window-" + DateTime::targetToken(window.since);
    WorkDirectory workDirectory(localDir);

    std::vector<std::string> slices;
    try {
        slices = provider->fetchSlices(localDir, window.since, window.until);
    } catch (const SliceProviderError &ex) {
        throw FatalIngestionError(std::string("Fetching slices failed: ") + ex.what());
    }
    if (slices.empty()) {
        driver_logger.info("No data available for " + window.toString());
        return false;
    }
    if (!options.keepFilesDir.empty()) {
        keepFiles(localDir);
    }

    bool wrote = false;
    for (const auto &slicePath : slices) {
        if (ingestSlice(slicePath, localDir, summary)) {
            wrote = true;
        }
    }
    return wrote;
}

void StreamDriver::keepFiles(const std::string &localDir) {
    if (Utils::createDirectory(options.keepFilesDir) != 0 ||
        Utils::copyToDirectory(localDir + "/.", options.keepFilesDir) != 0) {
        driver_logger.warn("Could not keep a copy of " + localDir + " in " + options.keepFilesDir);
        return;
    }
    driver_logger.info("Kept a copy of " + localDir + " in " + options.keepFilesDir);
}

Dataset StreamDriver::dropIngested(const Dataset &slice) const {
    if (!last || slice.size(config.timeDim) == 0) {
        return slice;
    }
    double boundary = static_cast<double>(DateTime::toMillis(last->slice.lastTimestamp(config.timeDim)));
    auto firstNewRow = [boundary](const std::vector<double> &times) {
        size_t index = 0;
        while (index < times.size() && times[index] <= boundary) index++;
        return index;
    };

    Dataset result = slice;
    size_t skip = firstNewRow(slice.coordinate(config.timeDim));
    if (skip > 0) {
        driver_logger.warn("Skipping " + std::to_string(skip) + " rows that are already ingested");
        result = result.isel(config.timeDim, skip, result.size(config.timeDim));
    }
    if (result.hasVariable(config.highResDim)) {
        size_t skipHighRes = firstNewRow(result.coordinate(config.highResDim));
        if (skipHighRes > 0) {
            result = result.isel(config.highResDim, skipHighRes, result.size(config.highResDim));
        }
    }
    return result;
}

bool StreamDriver::ingestSlice(const std::string &slicePath, const std::string &localDir, RunSummary &summary) {
    Dataset raw;
    if (!DatasetSerializer::read(slicePath, raw)) {
        throw FatalIngestionError("Cannot read slice " + slicePath);
    }

    Dataset slice = dropIngested(raw);
    Dataset aligned = aligner.alignSlice(slice);
    size_t rows = aligned.size(config.timeDim);
    if (rows == 0) {
        driver_logger.warn("Slice " + slicePath + " has " + std::to_string(slice.size(config.timeDim)) +
                           " rows, less than one chunk of " + std::to_string(config.chunkSize) + ", deferring it");
        return false;
    }
    driver_logger.info("Aligned " + slicePath + " from " + std::to_string(slice.size(config.timeDim)) + " to " +
                       std::to_string(rows) + " rows");

    const Dataset *prior = last ? &last->slice : nullptr;
    bool appendable = AppendabilityClassifier::isAppendable(prior, aligned, config.significantKeys);
    bool within = prior != nullptr && AppendabilityClassifier::isWithinTimeframe(
                                          prior, aligned, config.daysPerFile, config.dayBoundary, config.timeDim);

    if (appendable && within) {
        appendToTarget(aligned, summary);
    } else {
        if (prior == nullptr) {
            driver_logger.info("No previous target, starting a new one");
        } else if (!appendable) {
            driver_logger.info("Settings changed since " + last->pointer + ", starting a new target");
        } else {
            driver_logger.info("Data would span more than " + std::to_string(config.daysPerFile) + " day(s) in " +
                               last->pointer + ", starting a new target");
        }
        startTarget(aligned, TargetPaths::relativePointer(localDir, slicePath), summary);
    }

    summary.slicesIngested++;
    summary.bytes += static_cast<size_t>(Utils::getFolderSize(slicePath));
    return true;
}

void StreamDriver::appendToTarget(const Dataset &aligned, RunSummary &summary) {
    const std::string pointer = last->pointer;
    const std::string path = TargetPaths::resolve(options.targetRoot, pointer);
    requireOk(StoreOperations::ensureCheckpoint(*store, path, TargetPaths::highResSibling(path)),
              "Checkpointing " + pointer);

    log->onAppendTransaction();
    driver_logger.info("Appending " + std::to_string(aligned.size(config.timeDim)) + " rows to " + pointer);

    Dataset conformed =
        AuxiliaryMetadataMaintainer::conformForAppend(aligned, last->slice, config.setupDims, config.highResDim);
    size_t bytes = 0;
    std::string message = "Append from " + DateTime::toIsoString(aligned.firstTimestamp(config.timeDim));
    StoreResult<VersionId> version = StoreOperations::writeAndCommit(*store, path, conformed,
                                                                     AppendAlongDim{config.timeDim}, message, false,
                                                                     bytes);
    requireOk(version.status, "Appending to " + pointer);
    bytes += maintainer.mergeMissingSetup(aligned, last->slice, path);

    completeTarget(aligned, path, version.value, "append", bytes, false, summary);
}

void StreamDriver::startTarget(const Dataset &aligned, const std::string &pointer, RunSummary &summary) {
    const std::string path = TargetPaths::resolve(options.targetRoot, pointer);
    bool newStream = !last || AppendabilityClassifier::settingsFingerprint(last->slice, config.significantKeys) !=
                                  AppendabilityClassifier::settingsFingerprint(aligned, config.significantKeys);

    log->onNewTransaction(pointer);
    driver_logger.info("Creating " + pointer + " with " + std::to_string(aligned.size(config.timeDim)) + " rows");

    size_t bytes = 0;
    StoreResult<VersionId> version =
        StoreOperations::writeAndCommit(*store, path, aligned.dropDims({config.highResDim}), CreateMode{},
                                        "Create " + pointer, true, bytes);
    requireOk(version.status, "Creating " + pointer);

    completeTarget(aligned, path, version.value, "create", bytes, newStream, summary);
}

void StreamDriver::completeTarget(const Dataset &aligned, const std::string &path, const VersionId &version,
                                  const std::string &mode, size_t bytes, bool newStream, RunSummary &summary) {
    std::optional<VersionId> highResVersion = maintainer.appendHighRes(aligned, path, bytes);
    if (highResVersion) {
        driver_logger.debug("High resolution data of " + path + " is at version " + *highResVersion);
    }
    bytes += maintainer.maintain(aligned, path);
    if (newStream) {
        tagStreamStart(aligned, path, version);
    }

    StoreResult<VersionId> head =
        withRetry("Resolving head of " + path, [&]() { return store->resolveBranch(path, Conts::MAIN_BRANCH); });
    requireOk(head.status, "Resolving head of " + path);
    // The checkpoint of the main target also fixes the version of its high resolution sibling
    requireOk(StoreOperations::checkpoint(*store, path, TargetPaths::highResSibling(path), head.value),
              "Checkpointing " + path);

    last = log->onCompleteTransaction();
    summary.commits++;
    driver_logger.info("Committed " + mode + " of " + last->pointer + " at version " + version);

    if (history && runId >= 0) {
        TransactionRecord record;
        record.target = last->pointer;
        record.mode = mode;
        record.version = version;
        record.firstTimestamp = DateTime::toIsoString(aligned.firstTimestamp(config.timeDim));
        record.lastTimestamp = DateTime::toIsoString(aligned.lastTimestamp(config.timeDim));
        record.bytes = bytes;
        if (!history->recordTransaction(runId, record)) {
            driver_logger.warn("Could not record the transaction on " + record.target);
        }
    }
}

void StreamDriver::tagStreamStart(const Dataset &aligned, const std::string &path, const VersionId &version) {
    std::string tag = "settings-" + AppendabilityClassifier::settingsFingerprint(aligned, config.significantKeys) +
                      "-start";
    StoreStatus status =
        withRetry("Tagging " + path, [&]() { return store->createTag(RepositoryHandle{path}, tag, version); });
    if (status.code == ErrorCode::ALREADY_EXISTS) {
        driver_logger.debug("Tag " + tag + " already exists in " + path);
    } else if (!status.ok()) {
        driver_logger.warn("Could not tag " + path + " with " + tag + ": " + status.toString());
    } else {
        driver_logger.info("Tagged " + path + " with " + tag);
    }
}

void StreamDriver::finishHistory(const RunSummary &summary, const std::string &status, const std::string &message) {
    if (!history || runId < 0) {
        return;
    }
    RunRecord record;
    record.status = status;
    record.bytes = summary.bytes;
    record.slices = summary.slicesIngested;
    record.commits = summary.commits;
    record.windows = summary.windows;
    record.message = message;
    if (!history->finishRun(runId, record)) {
        driver_logger.warn("Could not record the end of run " + std::to_string(runId));
    }
}

}  // namespace icestream
