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

#include "LocalBlobStore.h"

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>

#include "../util/logger/Logger.h"

Logger local_blob_logger;

namespace icestream {

static StoreStatus errnoStatus(const std::string &operation, const std::string &path, int error) {
    return StoreStatus(LocalBlobStore::classifyErrno(error), operation + " " + path + ": " + strerror(error));
}

ErrorCode LocalBlobStore::classifyErrno(int error) {
    switch (error) {
        case ENOENT:
        case ENOTDIR:
            return ErrorCode::NOT_FOUND;
        case EEXIST:
            return ErrorCode::ALREADY_EXISTS;
        case EAGAIN:
        case EINTR:
        case EIO:
        case EBUSY:
        case ETIMEDOUT:
        case EMFILE:
        case ENFILE:
            return ErrorCode::TRANSIENT_IO;
        default:
            return ErrorCode::FATAL;
    }
}

StoreResult<bool> LocalBlobStore::exists(const std::string &path) {
    struct stat sb;
    if (stat(path.c_str(), &sb) == 0) {
        return true;
    }
    if (errno == ENOENT || errno == ENOTDIR) {
        return false;
    }
    return errnoStatus("stat", path, errno);
}

StoreStatus LocalBlobStore::removeTree(const std::string &path) {
    struct stat sb;
    if (lstat(path.c_str(), &sb) != 0) {
        return errnoStatus("lstat", path, errno);
    }
    if (!S_ISDIR(sb.st_mode)) {
        if (unlink(path.c_str()) != 0) return errnoStatus("unlink", path, errno);
        return StoreStatus::success();
    }
    DIR *d = opendir(path.c_str());
    if (!d) {
        return errnoStatus("opendir", path, errno);
    }
    std::vector<std::string> children;
    const struct dirent *entry;
    while ((entry = readdir(d)) != nullptr) {
        std::string name = entry->d_name;
        if (name != "." && name != "..") children.push_back(name);
    }
    (void)closedir(d);
    for (const auto &child : children) {
        StoreStatus status = removeTree(path + "/" + child);
        if (!status.ok() && !status.notFound()) return status;
    }
    if (rmdir(path.c_str()) != 0) {
        return errnoStatus("rmdir", path, errno);
    }
    return StoreStatus::success();
}

StoreStatus LocalBlobStore::remove(const std::string &path, bool recursive) {
    struct stat sb;
    if (lstat(path.c_str(), &sb) != 0) {
        return errnoStatus("lstat", path, errno);
    }
    if (S_ISDIR(sb.st_mode)) {
        if (!recursive) {
            if (rmdir(path.c_str()) != 0) return errnoStatus("rmdir", path, errno);
            return StoreStatus::success();
        }
        local_blob_logger.debug("Removing directory tree " + path);
        return removeTree(path);
    }
    if (unlink(path.c_str()) != 0) {
        return errnoStatus("unlink", path, errno);
    }
    return StoreStatus::success();
}

StoreStatus LocalBlobStore::collect(const std::string &dir, std::vector<std::string> &out) {
    DIR *d = opendir(dir.c_str());
    if (!d) {
        return errnoStatus("opendir", dir, errno);
    }
    const struct dirent *entry;
    std::vector<std::string> subdirs;
    while ((entry = readdir(d)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") continue;
        std::string path = dir + "/" + name;
        struct stat sb;
        if (stat(path.c_str(), &sb) != 0) {
            // Entries can vanish while listing
            continue;
        }
        if (S_ISDIR(sb.st_mode)) {
            subdirs.push_back(path);
        } else if (S_ISREG(sb.st_mode)) {
            out.push_back(path);
        }
    }
    (void)closedir(d);
    for (const auto &sub : subdirs) {
        StoreStatus status = collect(sub, out);
        if (!status.ok() && !status.notFound()) return status;
    }
    return StoreStatus::success();
}

StoreResult<std::vector<std::string>> LocalBlobStore::listByPrefix(const std::string &root) {
    std::vector<std::string> keys;
    std::string base = root;
    while (base.length() > 1 && base.back() == '/') base.pop_back();
    StoreStatus status = collect(base, keys);
    if (!status.ok()) {
        return status;
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

StoreStatus LocalBlobStore::makeDirectories(const std::string &path) {
    if (path.empty() || path == "/") return StoreStatus::success();
    struct stat sb;
    if (stat(path.c_str(), &sb) == 0) {
        if (S_ISDIR(sb.st_mode)) return StoreStatus::success();
        return StoreStatus(ErrorCode::FATAL, path + " exists and is not a directory");
    }
    StoreStatus parent = makeDirectories(parentPath(path));
    if (!parent.ok()) return parent;
    if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
        return errnoStatus("mkdir", path, errno);
    }
    return StoreStatus::success();
}

StoreStatus LocalBlobStore::put(const std::string &path, const std::string &bytes) {
    StoreStatus dirs = makeDirectories(parentPath(path));
    if (!dirs.ok()) {
        return dirs;
    }

    std::string tmpPath = path + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
    int fd = open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        return errnoStatus("open", tmpPath, errno);
    }
    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = write(fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int error = errno;
            close(fd);
            (void)unlink(tmpPath.c_str());
            return errnoStatus("write", tmpPath, error);
        }
        written += static_cast<size_t>(n);
    }
    if (fsync(fd) != 0) {
        int error = errno;
        close(fd);
        (void)unlink(tmpPath.c_str());
        return errnoStatus("fsync", tmpPath, error);
    }
    if (close(fd) != 0) {
        int error = errno;
        (void)unlink(tmpPath.c_str());
        return errnoStatus("close", tmpPath, error);
    }
    if (rename(tmpPath.c_str(), path.c_str()) != 0) {
        int error = errno;
        (void)unlink(tmpPath.c_str());
        return errnoStatus("rename", path, error);
    }
    return StoreStatus::success();
}

StoreResult<std::string> LocalBlobStore::get(const std::string &path) {
    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return errnoStatus("open", path, errno);
    }
    std::string bytes;
    char buffer[65536];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            int error = errno;
            close(fd);
            return errnoStatus("read", path, error);
        }
        if (n == 0) break;
        bytes.append(buffer, static_cast<size_t>(n));
    }
    close(fd);
    return bytes;
}

}  // namespace icestream
