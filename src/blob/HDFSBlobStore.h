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

#ifndef ICESTREAM_HDFSBLOBSTORE_H
#define ICESTREAM_HDFSBLOBSTORE_H

#include <string>
#include <vector>

#include "BlobStore.h"
#include "hdfs.h"

namespace icestream {

class HDFSBlobStore : public BlobStore {
 public:
    HDFSBlobStore(const std::string &hdfsServerIP, const std::string &hdfsServerPort);
    ~HDFSBlobStore() override;

    StoreResult<bool> exists(const std::string &path) override;

    StoreStatus remove(const std::string &path, bool recursive) override;

    StoreResult<std::vector<std::string>> listByPrefix(const std::string &root) override;

    StoreStatus put(const std::string &path, const std::string &bytes) override;

    StoreResult<std::string> get(const std::string &path) override;

    std::string describe() const override { return "hdfs://" + serverIP + ":" + serverPort; }

 private:
    hdfsFS fileSystem;
    std::string serverIP;
    std::string serverPort;

    StoreStatus notConnected() const;
    StoreStatus collect(const std::string &dir, std::vector<std::string> &out);
    static std::string stripAuthority(const std::string &name);
};

}  // namespace icestream

#endif  // ICESTREAM_HDFSBLOBSTORE_H
