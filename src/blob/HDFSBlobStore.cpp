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

#include "HDFSBlobStore.h"

#include <errno.h>
#include <fcntl.h>

#include <algorithm>
#include <cstring>

#include "../util/logger/Logger.h"
#include "LocalBlobStore.h"

Logger hdfs_blob_logger;

namespace icestream {

static StoreStatus hdfsErrnoStatus(const std::string &operation, const std::string &path) {
    int error = errno;
    if (error == 0) {
        return StoreStatus(ErrorCode::TRANSIENT_IO, operation + " " + path + " failed without an error code");
    }
    return StoreStatus(LocalBlobStore::classifyErrno(error), operation + " " + path + ": " + strerror(error));
}

HDFSBlobStore::HDFSBlobStore(const std::string &hdfsServerIP, const std::string &hdfsServerPort)
    : serverIP(hdfsServerIP), serverPort(hdfsServerPort) {
    fileSystem = hdfsConnect(hdfsServerIP.c_str(), std::stoi(hdfsServerPort));
    if (!fileSystem) {
        hdfs_blob_logger.error("Failed to connect to HDFS server at " + hdfsServerIP);
    } else {
        hdfs_blob_logger.info("Connected to HDFS server at " + hdfsServerIP + ":" + hdfsServerPort);
    }
}

HDFSBlobStore::~HDFSBlobStore() {
    if (fileSystem) {
        hdfsDisconnect(fileSystem);
        hdfs_blob_logger.info("Disconnected from HDFS server");
    }
}

StoreStatus HDFSBlobStore::notConnected() const {
    return StoreStatus(ErrorCode::FATAL, "HDFS connection to " + serverIP + ":" + serverPort + " is not established");
}

std::string HDFSBlobStore::stripAuthority(const std::string &name) {
    size_t scheme = name.find("://");
    if (scheme == std::string::npos) return name;
    size_t pathStart = name.find('/', scheme + 3);
    return pathStart == std::string::npos ? "/" : name.substr(pathStart);
}

StoreResult<bool> HDFSBlobStore::exists(const std::string &path) {
    if (!fileSystem) return notConnected();
    errno = 0;
    if (hdfsExists(fileSystem, path.c_str()) == 0) {
        return true;
    }
    if (errno == 0 || errno == ENOENT) {
        return false;
    }
    return hdfsErrnoStatus("exists", path);
}

StoreStatus HDFSBlobStore::remove(const std::string &path, bool recursive) {
    if (!fileSystem) return notConnected();
    errno = 0;
    if (hdfsExists(fileSystem, path.c_str()) != 0) {
        if (errno == 0 || errno == ENOENT) {
            return StoreStatus(ErrorCode::NOT_FOUND, path);
        }
        return hdfsErrnoStatus("exists", path);
    }
    if (hdfsDelete(fileSystem, path.c_str(), recursive ? 1 : 0) != 0) {
        return hdfsErrnoStatus("delete", path);
    }
    return StoreStatus::success();
}

StoreStatus HDFSBlobStore::collect(const std::string &dir, std::vector<std::string> &out) {
    int numEntries = 0;
    errno = 0;
    hdfsFileInfo *entries = hdfsListDirectory(fileSystem, dir.c_str(), &numEntries);
    if (!entries) {
        // An empty directory also yields NULL, with errno left at 0
        if (errno == 0) return StoreStatus::success();
        return hdfsErrnoStatus("list", dir);
    }
    std::vector<std::string> subdirs;
    for (int i = 0; i < numEntries; i++) {
        std::string path = stripAuthority(entries[i].mName);
        if (entries[i].mKind == kObjectKindDirectory) {
            subdirs.push_back(path);
        } else {
            out.push_back(path);
        }
    }
    hdfsFreeFileInfo(entries, numEntries);
    for (const auto &sub : subdirs) {
        StoreStatus status = collect(sub, out);
        if (!status.ok()) return status;
    }
    return StoreStatus::success();
}

StoreResult<std::vector<std::string>> HDFSBlobStore::listByPrefix(const std::string &root) {
    if (!fileSystem) return notConnected();
    StoreResult<bool> present = exists(root);
    if (!present.ok()) return present.status;
    if (!present.value) return StoreStatus(ErrorCode::NOT_FOUND, root);

    std::vector<std::string> keys;
    StoreStatus status = collect(root, keys);
    if (!status.ok()) return status;
    std::sort(keys.begin(), keys.end());
    return keys;
}

StoreStatus HDFSBlobStore::put(const std::string &path, const std::string &bytes) {
    if (!fileSystem) return notConnected();
    std::string parent = parentPath(path);
    if (hdfsCreateDirectory(fileSystem, parent.c_str()) != 0) {
        return hdfsErrnoStatus("mkdir", parent);
    }

    std::string tmpPath = path + ".tmp";
    hdfsFile file = hdfsOpenFile(fileSystem, tmpPath.c_str(), O_WRONLY | O_CREAT, 0, 0, 0);
    if (!file) {
        return hdfsErrnoStatus("open", tmpPath);
    }
    size_t written = 0;
    while (written < bytes.size()) {
        tSize n = hdfsWrite(fileSystem, file, bytes.data() + written, static_cast<tSize>(bytes.size() - written));
        if (n < 0) {
            StoreStatus status = hdfsErrnoStatus("write", tmpPath);
            hdfsCloseFile(fileSystem, file);
            hdfsDelete(fileSystem, tmpPath.c_str(), 0);
            return status;
        }
        written += static_cast<size_t>(n);
    }
    if (hdfsHSync(fileSystem, file) != 0 || hdfsCloseFile(fileSystem, file) != 0) {
        StoreStatus status = hdfsErrnoStatus("sync", tmpPath);
        hdfsDelete(fileSystem, tmpPath.c_str(), 0);
        return status;
    }
    // HDFS rename does not overwrite
    if (hdfsExists(fileSystem, path.c_str()) == 0 && hdfsDelete(fileSystem, path.c_str(), 0) != 0) {
        StoreStatus status = hdfsErrnoStatus("replace", path);
        hdfsDelete(fileSystem, tmpPath.c_str(), 0);
        return status;
    }
    if (hdfsRename(fileSystem, tmpPath.c_str(), path.c_str()) != 0) {
        StoreStatus status = hdfsErrnoStatus("rename", path);
        hdfsDelete(fileSystem, tmpPath.c_str(), 0);
        return status;
    }
    return StoreStatus::success();
}

StoreResult<std::string> HDFSBlobStore::get(const std::string &path) {
    if (!fileSystem) return notConnected();
    errno = 0;
    hdfsFileInfo *info = hdfsGetPathInfo(fileSystem, path.c_str());
    if (!info) {
        if (errno == 0 || errno == ENOENT) return StoreStatus(ErrorCode::NOT_FOUND, path);
        return hdfsErrnoStatus("stat", path);
    }
    tOffset size = info->mSize;
    hdfsFreeFileInfo(info, 1);

    hdfsFile file = hdfsOpenFile(fileSystem, path.c_str(), O_RDONLY, 0, 0, 0);
    if (!file) {
        return hdfsErrnoStatus("open", path);
    }
    std::string bytes;
    bytes.reserve(static_cast<size_t>(size));
    char buffer[65536];
    while (true) {
        tSize n = hdfsRead(fileSystem, file, buffer, sizeof(buffer));
        if (n < 0) {
            StoreStatus status = hdfsErrnoStatus("read", path);
            hdfsCloseFile(fileSystem, file);
            return status;
        }
        if (n == 0) break;
        bytes.append(buffer, static_cast<size_t>(n));
    }
    hdfsCloseFile(fileSystem, file);
    return bytes;
}

}  // namespace icestream
