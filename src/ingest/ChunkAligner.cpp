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

#include "ChunkAligner.h"

#include <cmath>
#include <stdexcept>
#include <vector>

#include "../util/logger/Logger.h"

Logger aligner_logger;

namespace icestream {

ChunkAligner::ChunkAligner(const std::string &timeDim, size_t chunkSize, const std::string &highResDim,
                           size_t highResChunkSize)
    : timeDim(timeDim), chunkSize(chunkSize), highResDim(highResDim), highResChunkSize(highResChunkSize) {
    if (chunkSize == 0 || highResChunkSize == 0) {
        throw std::invalid_argument("Chunk sizes must be positive");
    }
}

size_t ChunkAligner::alignedLength(size_t length, size_t chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    return length - length % chunkSize;
}

Dataset ChunkAligner::align(const Dataset &slice, const std::string &dim, size_t chunkSize) {
    size_t length = slice.size(dim);
    size_t aligned = alignedLength(length, chunkSize);
    if (aligned == length) {
        return slice;
    }
    return slice.isel(dim, 0, aligned);
}

Dataset ChunkAligner::alignSlice(const Dataset &slice) const {
    size_t before = slice.size(timeDim);
    if (!slice.hasDimension(highResDim)) {
        Dataset aligned = align(slice, timeDim, chunkSize);
        if (aligned.size(timeDim) != before) {
            aligner_logger.debug("Deferred " + std::to_string(before - aligned.size(timeDim)) + " trailing " +
                                 timeDim + " rows");
        }
        return aligned;
    }

    // Both dimensions are cut at the same instant so whatever is deferred is fetched again as a whole
    const std::vector<double> &times = slice.coordinate(timeDim);
    const std::vector<double> &highRes = slice.coordinate(highResDim);
    size_t cut = alignedLength(before, chunkSize);
    size_t covered = 0;
    for (; cut > 0; cut -= chunkSize) {
        covered = highRes.size();
        if (cut < before) {
            covered = 0;
            while (covered < highRes.size() && highRes[covered] < times[cut]) {
                covered++;
            }
        }
        if (covered % highResChunkSize == 0) {
            break;
        }
    }
    if (cut == 0) {
        covered = 0;
    }

    if (cut != before || covered != highRes.size()) {
        aligner_logger.debug("Deferred " + std::to_string(before - cut) + " trailing " + timeDim + " rows and " +
                             std::to_string(highRes.size() - covered) + " " + highResDim + " rows");
    }
    return slice.isel(timeDim, 0, cut).isel(highResDim, 0, covered);
}

}  // namespace icestream
