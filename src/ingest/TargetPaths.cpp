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

#include "TargetPaths.h"

#include <algorithm>
#include <set>

#include "../blob/BlobStore.h"
#include "../util/Conts.h"
#include "../util/Utils.h"

namespace icestream {

static bool endsWith(const std::string &text, const std::string &suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string TargetPaths::resolve(const std::string &root, const std::string &pointer) {
    if (pointer.empty()) return "";
    return joinPath(root, pointer);
}

std::string TargetPaths::highResSibling(const std::string &target) {
    if (endsWith(target, Conts::TARGET_EXTENSION)) {
        return target.substr(0, target.size() - Conts::TARGET_EXTENSION.size()) + Conts::HIGH_RES_SUFFIX +
               Conts::TARGET_EXTENSION;
    }
    return target + Conts::HIGH_RES_SUFFIX;
}

std::string TargetPaths::sideloadPath(const std::string &target) {
    std::string parent = parentPath(target);
    return parent.empty() ? Conts::SETUP_SIDELOAD_NAME : joinPath(parent, Conts::SETUP_SIDELOAD_NAME);
}

bool TargetPaths::isAuxiliary(const std::string &target) {
    std::string name = Utils::getFileName(target);
    return name == Conts::SETUP_SIDELOAD_NAME || endsWith(name, Conts::HIGH_RES_SUFFIX + Conts::TARGET_EXTENSION) ||
           endsWith(name, Conts::HIGH_RES_SUFFIX);
}

std::string TargetPaths::relativePointer(const std::string &localDir, const std::string &slicePath) {
    std::string base = localDir;
    while (base.length() > 1 && base.back() == '/') base.pop_back();
    std::string path = slicePath;
    while (path.length() > 1 && path.back() == '/') path.pop_back();
    if (path.compare(0, base.size() + 1, base + "/") == 0) {
        return path.substr(base.size() + 1);
    }
    return Utils::getFileName(path);
}

std::vector<std::string> TargetPaths::candidateTargets(const std::string &root, const std::vector<std::string> &keys) {
    const std::string marker = "/refs/branch." + Conts::MAIN_BRANCH;
    std::string base = root;
    while (base.length() > 1 && base.back() == '/') base.pop_back();

    std::set<std::string> pointers;
    for (const auto &key : keys) {
        if (!endsWith(key, marker)) continue;
        std::string target = key.substr(0, key.size() - marker.size());
        if (isAuxiliary(target)) continue;
        if (target.compare(0, base.size() + 1, base + "/") != 0) continue;
        pointers.insert(target.substr(base.size() + 1));
    }

    std::vector<std::string> ordered(pointers.begin(), pointers.end());
    std::stable_sort(ordered.begin(), ordered.end(), [](const std::string &left, const std::string &right) {
        return Utils::getFileName(left) < Utils::getFileName(right);
    });
    return ordered;
}

}  // namespace icestream
