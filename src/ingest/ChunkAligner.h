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

#ifndef ICESTREAM_CHUNKALIGNER_H
#define ICESTREAM_CHUNKALIGNER_H

#include <string>

#include "../dataset/Dataset.h"

namespace icestream {

class ChunkAligner {
 public:
    // Throws std::invalid_argument for a zero chunk size
    ChunkAligner(const std::string &timeDim, size_t chunkSize, const std::string &highResDim,
                 size_t highResChunkSize);

    // Trims the trailing remainder of dim so its length is a multiple of chunkSize
    static Dataset align(const Dataset &slice, const std::string &dim, size_t chunkSize);

    static size_t alignedLength(size_t length, size_t chunkSize);

    /**
     * Cuts the slice at the last primary chunk boundary where the high resolution rows before it also
     * fill whole chunks of their own. Rows after the cut are deferred in both dimensions.
     * A result with an empty primary dimension is meant to be dropped by the caller.
     */
    Dataset alignSlice(const Dataset &slice) const;

 private:
    std::string timeDim;
    size_t chunkSize;
    std::string highResDim;
    size_t highResChunkSize;
};

}  // namespace icestream

#endif  // ICESTREAM_CHUNKALIGNER_H
