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

#ifndef ICESTREAM_AUXILIARYMETADATAMAINTAINER_H
#define ICESTREAM_AUXILIARYMETADATAMAINTAINER_H

#include <memory>
#include <optional>
#include <set>
#include <string>

#include "../storage/ArrayStore.h"
#include "IngestionConfig.h"

namespace icestream {

/**
 * Keeps the objects stored beside a main target in step with it: the setup sideload in the same
 * parent directory and the high resolution sibling.
 */
class AuxiliaryMetadataMaintainer {
 public:
    AuxiliaryMetadataMaintainer(std::shared_ptr<ArrayStore> store, const IngestionConfig &config);

    /**
     * Grows the sideload next to targetPath with setup values of source it does not hold yet, creating
     * it on first use. Problems are logged and the step is skipped.
     * @return bytes written
     */
    size_t maintain(const Dataset &source, const std::string &targetPath);

    /**
     * Appends the high resolution rows of source to the sibling of targetPath, creating the sibling
     * when it does not exist. Throws FatalIngestionError on any other failure.
     * @return the committed version, nothing when source has no high resolution rows
     */
    std::optional<VersionId> appendHighRes(const Dataset &source, const std::string &targetPath, size_t &bytes);

    // Adds setup values of source missing from existing to the main target; problems are logged only
    size_t mergeMissingSetup(const Dataset &source, const Dataset &existing, const std::string &targetPath);

    /**
     * For every setup dimension, the full variables of existing extended with the entries of incoming whose
     * coordinate value existing lacks. Dimensions without new entries are left out, so an empty result
     * means nothing to add. Throws std::invalid_argument when the variables of a dimension differ.
     */
    static Dataset missingSetupData(const Dataset &incoming, const Dataset &existing,
                                    const std::set<std::string> &setupDims);

    // Incoming slice shaped for an append: setup variables taken from prior, high resolution data removed
    static Dataset conformForAppend(const Dataset &source, const Dataset &prior, const std::set<std::string> &setupDims,
                                    const std::string &highResDim);

 private:
    std::shared_ptr<ArrayStore> store;
    IngestionConfig config;
};

}  // namespace icestream

#endif  // ICESTREAM_AUXILIARYMETADATAMAINTAINER_H
