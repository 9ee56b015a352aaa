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

#ifndef ICESTREAM_CHUNKEDARRAYSTORE_H
#define ICESTREAM_CHUNKEDARRAYSTORE_H

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <random>
#include <string>

#include "../blob/BlobStore.h"
#include "ArrayStore.h"

using json = nlohmann::json;

namespace icestream {

struct ChunkPolicy {
    // Rows per chunk along a variable's first dimension, fixed when a target is created
    std::map<std::string, size_t> chunkSizes;
    size_t defaultChunkSize = 1000;

    size_t chunkSizeFor(const std::string &dim) const;
};

/**
 * ArrayStore over plain blobs. Layout below a target:
 *   repo.json                 repository marker
 *   refs/branch.<name>        {"snapshot": id}
 *   refs/tag.<name>           {"snapshot": id}
 *   snapshots/<id>.json       manifest: dims, attrs, chunk sizes and chunk keys per variable
 *   chunks/<write>/<var>.<i>  raw doubles for rows [i*chunk, (i+1)*chunk) of the variable
 * A commit writes its manifest before moving the branch ref, so an interrupted commit
 * leaves the previous version visible.
 */
class ChunkedArrayStore : public ArrayStore {
 public:
    ChunkedArrayStore(std::shared_ptr<BlobStore> blobs, ChunkPolicy policy);

    StoreResult<RepositoryHandle> openOrCreate(const std::string &location) override;

    StoreResult<RepositoryHandle> open(const std::string &location) override;

    StoreResult<PendingWrite> write(const RepositoryHandle &handle, const Dataset &dataset,
                                    const WriteMode &mode) override;

    StoreResult<VersionId> commit(const PendingWrite &pending, const std::string &message) override;

    StoreResult<DatasetMetadata> readMetadata(const std::string &target) override;

    StoreResult<Dataset> readValues(const std::string &target, const Selection &selection) override;

    StoreStatus createTag(const RepositoryHandle &handle, const std::string &name, const VersionId &version) override;

    StoreResult<VersionId> resolveBranch(const std::string &target, const std::string &branch) override;

    StoreResult<VersionId> resolveTag(const std::string &target, const std::string &name) override;

    StoreStatus resetBranch(const RepositoryHandle &handle, const std::string &branch,
                            const VersionId &version) override;

 private:
    std::shared_ptr<BlobStore> blobs;
    ChunkPolicy policy;
    std::mt19937_64 random;

    std::string newId();
    StoreResult<json> loadJson(const std::string &path);
    StoreResult<json> loadManifest(const std::string &target, const std::string &branch);
    StoreStatus putRef(const std::string &target, const std::string &kind, const std::string &name,
                       const VersionId &version);
    StoreResult<VersionId> resolveRef(const std::string &target, const std::string &kind, const std::string &name);

    StoreStatus writeRows(const std::string &target, const std::string &writeId, const std::string &name,
                          const std::vector<double> &values, size_t offsetRows, size_t rows, size_t inner,
                          size_t chunkSize, json &chunks, size_t &bytes);
    StoreStatus writeVariable(const std::string &target, const std::string &writeId, const std::string &name,
                              const Variable &var, const Dataset &dataset, json &manifest, size_t &bytes);
    StoreStatus appendVariable(const std::string &target, const std::string &writeId, const std::string &name,
                               const Variable &var, const Dataset &dataset, const std::string &dim,
                               json &manifest, size_t &bytes);
    StoreResult<std::vector<double>> readVariable(const std::string &target, const json &descriptor,
                                                  size_t chunkSize, size_t inner, size_t start, size_t stop);
};

}  // namespace icestream

#endif  // ICESTREAM_CHUNKEDARRAYSTORE_H
