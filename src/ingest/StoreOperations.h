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

#ifndef ICESTREAM_STOREOPERATIONS_H
#define ICESTREAM_STOREOPERATIONS_H

#include <string>

#include "../storage/ArrayStore.h"

namespace icestream {

// Retried multi-step operations against an ArrayStore
class StoreOperations {
 public:
    /**
     * Opens the target (creating the repository when createRepository is set), stages the dataset and
     * commits it. bytes is increased by the staged size once the commit succeeds.
     * @return the committed version, or the status of the first failing step
     */
    static StoreResult<VersionId> writeAndCommit(ArrayStore &store, const std::string &path, const Dataset &dataset,
                                                 const WriteMode &mode, const std::string &message,
                                                 bool createRepository, size_t &bytes);

    static std::string siblingCheckpointTag(const VersionId &version);

    /**
     * Tags the current head of siblingPath with siblingCheckpointTag(version), then moves the checkpoint
     * branch of path to version. Moving the branch commits both objects; a missing sibling records nothing.
     */
    static StoreStatus checkpoint(ArrayStore &store, const std::string &path, const std::string &siblingPath,
                                  const VersionId &version);

    // Checkpoints the current main version unless a checkpoint exists; a missing target is OK
    static StoreStatus ensureCheckpoint(ArrayStore &store, const std::string &path, const std::string &siblingPath);
};

}  // namespace icestream

#endif  // ICESTREAM_STOREOPERATIONS_H
