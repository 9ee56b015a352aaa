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

#ifndef ICESTREAM_ARRAYSTORE_H
#define ICESTREAM_ARRAYSTORE_H

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../blob/StoreResult.h"
#include "../dataset/Dataset.h"

namespace icestream {

using VersionId = std::string;

struct RepositoryHandle {
    std::string location;
};

struct CreateMode {};
struct AppendAlongDim {
    std::string dim;
};
struct AddVariables {};

// How a dataset is combined with what the target already holds
using WriteMode = std::variant<CreateMode, AppendAlongDim, AddVariables>;

std::string writeModeName(const WriteMode &mode);

// Data staged by write() that becomes visible only when committed
struct PendingWrite {
    RepositoryHandle handle;
    std::string branch;
    std::string manifest;
    size_t bytesWritten = 0;
};

struct DatasetMetadata {
    VersionId version;
    std::map<std::string, AttributeValue> attrs;
    std::map<std::string, size_t> dimensionSizes;
    std::map<std::string, std::vector<std::string>> variables;
};

struct RowRange {
    std::string dim;
    size_t start = 0;
    size_t stop = 0;
};

struct Selection {
    // Empty means every variable
    std::vector<std::string> variables;
    std::optional<RowRange> rows;
    std::string branch = "main";
};

/**
 * Versioned, chunked array storage. Every method reports failures through its result;
 * NOT_FOUND is always distinguishable from other errors.
 */
class ArrayStore {
 public:
    virtual ~ArrayStore() = default;

    virtual StoreResult<RepositoryHandle> openOrCreate(const std::string &location) = 0;

    virtual StoreResult<RepositoryHandle> open(const std::string &location) = 0;

    virtual StoreResult<PendingWrite> write(const RepositoryHandle &handle, const Dataset &dataset,
                                            const WriteMode &mode) = 0;

    virtual StoreResult<VersionId> commit(const PendingWrite &pending, const std::string &message) = 0;

    virtual StoreResult<DatasetMetadata> readMetadata(const std::string &target) = 0;

    virtual StoreResult<Dataset> readValues(const std::string &target, const Selection &selection) = 0;

    // ALREADY_EXISTS when the tag is taken
    virtual StoreStatus createTag(const RepositoryHandle &handle, const std::string &name,
                                  const VersionId &version) = 0;

    virtual StoreResult<VersionId> resolveBranch(const std::string &target, const std::string &branch) = 0;

    virtual StoreResult<VersionId> resolveTag(const std::string &target, const std::string &name) = 0;

    // Points branch at version, creating the branch when needed
    virtual StoreStatus resetBranch(const RepositoryHandle &handle, const std::string &branch,
                                    const VersionId &version) = 0;
};

}  // namespace icestream

#endif  // ICESTREAM_ARRAYSTORE_H
