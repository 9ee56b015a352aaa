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

#include "BlobStore.h"

#include <stdexcept>

#include "../util/Conts.h"
#include "../util/Utils.h"
#include "../util/logger/Logger.h"
#include "LocalBlobStore.h"
#ifdef ICESTREAM_WITH_HDFS
#include "HDFSBlobStore.h"
#endif

Logger blob_logger;

namespace icestream {

BlobLocation parseBlobUrl(const std::string &url) {
    BlobLocation location;
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        location.scheme = "file";
        location.path = url;
    } else {
        location.scheme = url.substr(0, schemeEnd);
        std::string rest = url.substr(schemeEnd + 3);
        size_t pathStart = rest.find('/');
        std::string authority = pathStart == std::string::npos ? rest : rest.substr(0, pathStart);
        location.path = pathStart == std::string::npos ? "/" : rest.substr(pathStart);
        size_t colon = authority.find(':');
        location.host = colon == std::string::npos ? authority : authority.substr(0, colon);
        location.port = colon == std::string::npos ? "" : authority.substr(colon + 1);
    }
    while (location.path.length() > 1 && location.path.back() == '/') {
        location.path.pop_back();
    }
    if (location.scheme == "file" && (location.path.empty() || location.path[0] != '/')) {
        throw std::invalid_argument("Local target root must be an absolute path: " + url);
    }
    return location;
}

std::shared_ptr<BlobStore> openBlobStore(const BlobLocation &location) {
    if (location.scheme == "file") {
        return std::make_shared<LocalBlobStore>();
    }
    if (location.scheme == "hdfs") {
#ifdef ICESTREAM_WITH_HDFS
        std::string host = location.host.empty() ? Utils::getIceStreamProperty(Conts::PROPERTIES::HDFS_HOST)
                                                  : location.host;
        std::string port = location.port.empty() ? Utils::getIceStreamProperty(Conts::PROPERTIES::HDFS_PORT)
                                                 : location.port;
        if (port.empty()) port = "9000";
        blob_logger.info("Using HDFS blob store at " + host + ":" + port);
        return std::make_shared<HDFSBlobStore>(host, port);
#else
        throw std::invalid_argument("This build does not include HDFS support");
#endif
    }
    throw std::invalid_argument("Unsupported target scheme: " + location.scheme);
}

std::string joinPath(const std::string &parent, const std::string &child) {
    if (parent.empty()) return child;
    if (child.empty()) return parent;
    std::string result = parent;
    if (result.back() == '/') result.pop_back();
    return child.front() == '/' ? result + child : result + "/" + child;
}

std::string parentPath(const std::string &path) {
    std::string trimmed = path;
    while (trimmed.length() > 1 && trimmed.back() == '/') trimmed.pop_back();
    size_t slash = trimmed.find_last_of('/');
    if (slash == std::string::npos) return "";
    if (slash == 0) return "/";
    return trimmed.substr(0, slash);
}

}  // namespace icestream
