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

#ifndef ICESTREAM_BLOBSTORE_H
#define ICESTREAM_BLOBSTORE_H

#include <memory>
#include <string>
#include <vector>

#include "StoreResult.h"

namespace icestream {

/**
 * Filesystem-like object primitives. Paths are absolute within the store, '/' separated.
 * A missing object yields NOT_FOUND, never FATAL.
 */
class BlobStore {
 public:
    virtual ~BlobStore() = default;

    virtual StoreResult<bool> exists(const std::string &path) = 0;

    virtual StoreStatus remove(const std::string &path, bool recursive) = 0;

    // Every object key below root, recursively. NOT_FOUND when root does not exist.
    virtual StoreResult<std::vector<std::string>> listByPrefix(const std::string &root) = 0;

    // Whole-object replace; readers see either the old or the new content
    virtual StoreStatus put(const std::string &path, const std::string &bytes) = 0;

    virtual StoreResult<std::string> get(const std::string &path) = 0;

    virtual std::string describe() const = 0;
};

struct BlobLocation {
    std::string scheme;  // "file" or "hdfs"
    std::string host;
    std::string port;
    std::string path;
};

// Accepts /abs/path, file:///abs/path and hdfs://host:port/path
BlobLocation parseBlobUrl(const std::string &url);

// Opens the store that serves the given location; throws std::invalid_argument for unsupported schemes
std::shared_ptr<BlobStore> openBlobStore(const BlobLocation &location);

std::string joinPath(const std::string &parent, const std::string &child);

std::string parentPath(const std::string &path);

}  // namespace icestream

#endif  // ICESTREAM_BLOBSTORE_H
