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

#ifndef ICESTREAM_INGESTTESTHELPERS_H
#define ICESTREAM_INGESTTESTHELPERS_H

#include <functional>
#include <memory>
#include <string>

#include "../../../src/blob/LocalBlobStore.h"
#include "../../../src/storage/ArrayStore.h"

namespace icestream {

// Local store whose removals can be made to fail
class FaultyBlobStore : public LocalBlobStore {
 public:
    ErrorCode removeFailure = ErrorCode::OK;
    int removals = 0;

    StoreStatus remove(const std::string &path, bool recursive) override {
        removals++;
        if (removeFailure != ErrorCode::OK) {
            return StoreStatus(removeFailure, "injected failure removing " + path);
        }
        return LocalBlobStore::remove(path, recursive);
    }
};

/**
 * Forwards to another store and simulates a crash on the crashOnCommit-th commit. With commitBeforeCrash
 * the commit reaches the inner store before the failure is reported. crashOnRef does the same for the
 * branch resets and tags it matches, with refBeforeCrash deciding whether the reference is written.
 */
class CrashingArrayStore : public ArrayStore {
 public:
    explicit CrashingArrayStore(std::shared_ptr<ArrayStore> inner) : inner(std::move(inner)) {}

    int crashOnCommit = -1;
    bool commitBeforeCrash = true;
    int commits = 0;
    int transientReads = 0;
    std::function<bool(const std::string &location, const std::string &ref)> crashOnRef;
    bool refBeforeCrash = false;
    // Metadata reads of matching targets fail with FATAL
    std::function<bool(const std::string &target)> failReads;

    StoreResult<RepositoryHandle> openOrCreate(const std::string &location) override {
        return inner->openOrCreate(location);
    }

    StoreResult<RepositoryHandle> open(const std::string &location) override { return inner->open(location); }

    StoreResult<PendingWrite> write(const RepositoryHandle &handle, const Dataset &dataset,
                                    const WriteMode &mode) override {
        return inner->write(handle, dataset, mode);
    }

    StoreResult<VersionId> commit(const PendingWrite &pending, const std::string &message) override {
        commits++;
        if (commits == crashOnCommit) {
            if (commitBeforeCrash) {
                StoreResult<VersionId> committed = inner->commit(pending, message);
                if (!committed.ok()) return committed;
            }
            return StoreStatus(ErrorCode::FATAL, "injected crash on commit " + std::to_string(commits));
        }
        return inner->commit(pending, message);
    }

    StoreResult<DatasetMetadata> readMetadata(const std::string &target) override {
        if (transientReads > 0) {
            transientReads--;
            return StoreStatus(ErrorCode::TRANSIENT_IO, "injected timeout reading " + target);
        }
        if (failReads && failReads(target)) {
            return StoreStatus(ErrorCode::FATAL, "injected permission failure reading " + target);
        }
        return inner->readMetadata(target);
    }

    StoreResult<Dataset> readValues(const std::string &target, const Selection &selection) override {
        return inner->readValues(target, selection);
    }

    StoreStatus createTag(const RepositoryHandle &handle, const std::string &name, const VersionId &version) override {
        if (crashOnRef && crashOnRef(handle.location, name)) {
            return crashAfter(refBeforeCrash ? inner->createTag(handle, name, version) : StoreStatus::success(),
                              "tag " + name);
        }
        return inner->createTag(handle, name, version);
    }

    StoreResult<VersionId> resolveBranch(const std::string &target, const std::string &branch) override {
        return inner->resolveBranch(target, branch);
    }

    StoreResult<VersionId> resolveTag(const std::string &target, const std::string &name) override {
        return inner->resolveTag(target, name);
    }

    StoreStatus resetBranch(const RepositoryHandle &handle, const std::string &branch,
                            const VersionId &version) override {
        if (crashOnRef && crashOnRef(handle.location, branch)) {
            return crashAfter(refBeforeCrash ? inner->resetBranch(handle, branch, version) : StoreStatus::success(),
                              "branch " + branch);
        }
        return inner->resetBranch(handle, branch, version);
    }

 private:
    std::shared_ptr<ArrayStore> inner;

    static StoreStatus crashAfter(const StoreStatus &applied, const std::string &what) {
        if (!applied.ok()) return applied;
        return StoreStatus(ErrorCode::FATAL, "injected crash updating " + what);
    }
};

}  // namespace icestream

#endif  // ICESTREAM_INGESTTESTHELPERS_H
