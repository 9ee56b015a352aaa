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

#ifndef ICESTREAM_TRANSACTIONLOG_H
#define ICESTREAM_TRANSACTIONLOG_H

#include <memory>
#include <optional>
#include <string>

#include "../blob/BlobStore.h"
#include "../dataset/Dataset.h"
#include "../storage/ArrayStore.h"
#include "IngestionConfig.h"
#include "TransactionState.h"

namespace icestream {

// A target pointer together with what was read back from it
struct ValidatedTarget {
    std::string pointer;
    Dataset slice;
};

struct RecoveryResult {
    bool available = false;
    ValidatedTarget target;
};

/**
 * Durable TransactionState. Every mutation is persisted with write-temp-then-rename before it
 * becomes visible through state(); a failed persist throws FatalIngestionError and leaves the
 * previous state in place.
 */
class TransactionLog {
 public:
    TransactionLog(const std::string &stateFilePath, std::shared_ptr<ArrayStore> store,
                   std::shared_ptr<BlobStore> blobs, const std::string &targetRoot, const IngestionConfig &config);

    const TransactionState &state() const { return current; }

    const std::string &statePath() const { return stateFilePath; }

    void onNewTransaction(const std::string &target);

    void onAppendTransaction();

    // Promotes the incomplete target, then reads it back; throws FatalIngestionError when it is unreadable
    ValidatedTarget onCompleteTransaction();

    void onDeleted();

    void onRolledBack();

    /**
     * Runs once before ingestion. Resolves an incomplete target (rolled back to its checkpoint when one
     * exists, deleted otherwise), checks the penultimate target best-effort and validates the last valid
     * target, falling back to a listing of the target root. available is false on a cold start.
     * Connectivity or permission failures throw FatalIngestionError.
     */
    RecoveryResult initializeAndValidatePaths();

    // Reads a target's time coordinate, setup variables and attributes; nullopt when absent or empty
    std::optional<Dataset> loadValidateTarget(const std::string &pointer);

    static TransactionState loadState(const std::string &path);

    static void saveState(const std::string &path, const TransactionState &state);

 private:
    std::string stateFilePath;
    std::shared_ptr<ArrayStore> store;
    std::shared_ptr<BlobStore> blobs;
    std::string targetRoot;
    IngestionConfig config;
    TransactionState current;

    void transition(const TransactionEvent &event);
    void recoverIncomplete();
    // Moves the high resolution sibling to the version recorded with the checkpoint, or deletes it
    void recoverHighRes(const std::string &targetPath, const VersionId &checkpoint);
    void deleteObject(const std::string &path);
};

}  // namespace icestream

#endif  // ICESTREAM_TRANSACTIONLOG_H
