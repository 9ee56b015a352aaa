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

#ifndef ICESTREAM_LOCALBLOBSTORE_H
#define ICESTREAM_LOCALBLOBSTORE_H

#include <string>
#include <vector>

#include "BlobStore.h"

namespace icestream {

class LocalBlobStore : public BlobStore {
 public:
    StoreResult<bool> exists(const std::string &path) override;

    StoreStatus remove(const std::string &path, bool recursive) override;

    StoreResult<std::vector<std::string>> listByPrefix(const std::string &root) override;

    StoreStatus put(const std::string &path, const std::string &bytes) override;

    StoreResult<std::string> get(const std::string &path) override;

    std::string describe() const override { return "file://"; }

    // Maps an errno value from a failed filesystem call to a store error code
    static ErrorCode classifyErrno(int error);

 private:
    StoreStatus makeDirectories(const std::string &path);
    StoreStatus removeTree(const std::string &path);
    StoreStatus collect(const std::string &dir, std::vector<std::string> &out);
};

}  // namespace icestream

#endif  // ICESTREAM_LOCALBLOBSTORE_H
