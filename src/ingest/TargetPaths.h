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

#ifndef ICESTREAM_TARGETPATHS_H
#define ICESTREAM_TARGETPATHS_H

#include <string>
#include <vector>

namespace icestream {

// Naming rules for targets below a target root and their sibling objects
class TargetPaths {
 public:
    static std::string resolve(const std::string &root, const std::string &pointer);

    // a/b/name.zarr -> a/b/name_high_res.zarr
    static std::string highResSibling(const std::string &target);

    // a/b/name.zarr -> a/b/setup.zarr
    static std::string sideloadPath(const std::string &target);

    static bool isAuxiliary(const std::string &target);

    // Path of slicePath relative to localDir, or its file name when it lies elsewhere
    static std::string relativePointer(const std::string &localDir, const std::string &slicePath);

    /**
     * Target pointers (relative to root) found in a recursive object listing, ordered by target file name
     * so that the last element is the latest target.
     */
    static std::vector<std::string> candidateTargets(const std::string &root, const std::vector<std::string> &keys);
};

}  // namespace icestream

#endif  // ICESTREAM_TARGETPATHS_H
