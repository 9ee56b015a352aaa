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

#include "StoreOperations.h"

#include "../util/Conts.h"
#include "../util/logger/Logger.h"
#include "IngestionErrors.h"

Logger store_ops_logger;

namespace icestream {

StoreResult<VersionId> StoreOperations::writeAndCommit(ArrayStore &store, const std::string &path,
                                                       const Dataset &dataset, const WriteMode &mode,
                                                       const std::string &message, bool createRepository,
                                                       size_t &bytes) {
    StoreResult<RepositoryHandle> handle = withRetry("Opening " + path, [&]() {
        return createRepository ? store.openOrCreate(path) : store.open(path);
    });
    if (!handle.ok()) {
        return handle.status;
    }
    StoreResult<PendingWrite> pending =
        withRetry("Writing " + path, [&]() { return store.write(handle.value, dataset, mode); });
    if (!pending.ok()) {
        return pending.status;
    }
    StoreResult<VersionId> version =
        withRetry("Committing " + path, [&]() { return store.commit(pending.value, message); });
    if (version.ok()) {
        bytes += pending->bytesWritten;
        store_ops_logger.debug("Committed " + version.value + " (" + writeModeName(mode) + ") to " + path);
    }
    return version;
}

std::string StoreOperations::siblingCheckpointTag(const VersionId &version) {
    return Conts::CHECKPOINT_TAG_PREFIX + version;
}

StoreStatus StoreOperations::checkpoint(ArrayStore &store, const std::string &path, const std::string &siblingPath,
                                        const VersionId &version) {
    StoreResult<VersionId> siblingHead = withRetry("Resolving head of " + siblingPath, [&]() {
        return store.resolveBranch(siblingPath, Conts::MAIN_BRANCH);
    });
    if (siblingHead.ok()) {
        std::string tag = siblingCheckpointTag(version);
        StoreStatus tagged = withRetry("Tagging " + siblingPath, [&]() {
            return store.createTag(RepositoryHandle{siblingPath}, tag, siblingHead.value);
        });
        if (tagged.code == ErrorCode::ALREADY_EXISTS) {
            StoreResult<VersionId> recorded = withRetry("Resolving " + tag + " of " + siblingPath, [&]() {
                return store.resolveTag(siblingPath, tag);
            });
            if (!recorded.ok()) {
                return recorded.status;
            }
            if (recorded.value != siblingHead.value) {
                return StoreStatus(ErrorCode::FATAL, "Tag " + tag + " of " + siblingPath + " points to " +
                                                         recorded.value + ", not to " + siblingHead.value);
            }
        } else if (!tagged.ok()) {
            return tagged;
        }
    } else if (!siblingHead.status.notFound()) {
        return siblingHead.status;
    }

    return withRetry("Moving checkpoint of " + path, [&]() {
        return store.resetBranch(RepositoryHandle{path}, Conts::CHECKPOINT_BRANCH, version);
    });
}

StoreStatus StoreOperations::ensureCheckpoint(ArrayStore &store, const std::string &path,
                                              const std::string &siblingPath) {
    StoreResult<VersionId> existing = withRetry("Resolving checkpoint of " + path, [&]() {
        return store.resolveBranch(path, Conts::CHECKPOINT_BRANCH);
    });
    if (existing.ok()) {
        return StoreStatus::success();
    }
    if (!existing.status.notFound()) {
        return existing.status;
    }
    StoreResult<VersionId> head =
        withRetry("Resolving head of " + path, [&]() { return store.resolveBranch(path, Conts::MAIN_BRANCH); });
    if (head.status.notFound()) {
        return StoreStatus::success();
    }
    if (!head.ok()) {
        return head.status;
    }
    store_ops_logger.info("Creating checkpoint of " + path + " at " + head.value);
    return checkpoint(store, path, siblingPath, head.value);
}

}  // namespace icestream
