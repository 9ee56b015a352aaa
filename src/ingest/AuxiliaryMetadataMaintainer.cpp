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

#include "AuxiliaryMetadataMaintainer.h"

#include <stdexcept>
#include <unordered_set>
#include <vector>

#include "../util/logger/Logger.h"
#include "IngestionErrors.h"
#include "StoreOperations.h"
#include "TargetPaths.h"

Logger aux_logger;

namespace icestream {

AuxiliaryMetadataMaintainer::AuxiliaryMetadataMaintainer(std::shared_ptr<ArrayStore> store,
                                                         const IngestionConfig &config)
    : store(std::move(store)), config(config) {}

Dataset AuxiliaryMetadataMaintainer::missingSetupData(const Dataset &incoming, const Dataset &existing,
                                                      const std::set<std::string> &setupDims) {
    Dataset result;
    for (const auto &dim : setupDims) {
        if (!incoming.hasDimension(dim) || !incoming.hasVariable(dim)) continue;

        if (!existing.hasDimension(dim) || !existing.hasVariable(dim)) {
            result = result.merge(incoming.selectDims({dim}));
            continue;
        }

        const auto &known = existing.coordinate(dim);
        std::unordered_set<double> knownValues(known.begin(), known.end());
        const auto &offered = incoming.coordinate(dim);
        std::vector<size_t> missing;
        for (size_t i = 0; i < offered.size(); i++) {
            if (knownValues.insert(offered[i]).second) {
                missing.push_back(i);
            }
        }
        if (missing.empty()) continue;

        Dataset additions = incoming.selectDims({dim}).take(dim, missing);
        result = result.merge(Dataset::concat(existing.selectDims({dim}), additions, dim));
    }
    return result;
}

Dataset AuxiliaryMetadataMaintainer::conformForAppend(const Dataset &source, const Dataset &prior,
                                                      const std::set<std::string> &setupDims,
                                                      const std::string &highResDim) {
    std::set<std::string> dropped = setupDims;
    dropped.insert(highResDim);
    return source.dropDims(dropped).merge(prior.selectDims(setupDims));
}

size_t AuxiliaryMetadataMaintainer::maintain(const Dataset &source, const std::string &targetPath) {
    Dataset setup = source.selectDims(config.setupDims);
    if (setup.empty()) {
        return 0;
    }

    std::string sideload = TargetPaths::sideloadPath(targetPath);
    size_t bytes = 0;
    StoreResult<Dataset> existing =
        withRetry("Reading sideload " + sideload, [&]() { return store->readValues(sideload, Selection{}); });
    if (existing.status.notFound()) {
        aux_logger.info("No sideload found at " + sideload + ", creating it");
        StoreResult<VersionId> created = StoreOperations::writeAndCommit(*store, sideload, setup, CreateMode{},
                                                                         "Create setup sideload", true, bytes);
        if (!created.ok()) {
            aux_logger.warn("Could not create sideload " + sideload + ": " + created.status.toString());
            return 0;
        }
        return bytes;
    }
    if (!existing.ok()) {
        aux_logger.warn("Could not read sideload " + sideload + ", skipping: " + existing.status.toString());
        return 0;
    }

    Dataset missing;
    try {
        missing = missingSetupData(source, existing.value, config.setupDims);
    } catch (const std::invalid_argument &ex) {
        aux_logger.warn("Sideload " + sideload + " does not match the incoming setup data, skipping: " + ex.what());
        return 0;
    }
    if (missing.empty()) {
        return 0;
    }

    StoreResult<VersionId> version = StoreOperations::writeAndCommit(*store, sideload, missing, AddVariables{},
                                                                     "Add setup entries", false, bytes);
    if (!version.ok()) {
        aux_logger.warn("Could not update sideload " + sideload + ": " + version.status.toString());
        return 0;
    }
    aux_logger.info("Added new setup entries to " + sideload);
    return bytes;
}

std::optional<VersionId> AuxiliaryMetadataMaintainer::appendHighRes(const Dataset &source,
                                                                    const std::string &targetPath, size_t &bytes) {
    if (source.size(config.highResDim) == 0) {
        return std::nullopt;
    }

    Dataset highRes = source.selectDims({config.highResDim});
    std::string path = TargetPaths::highResSibling(targetPath);
    StoreResult<VersionId> version = StoreOperations::writeAndCommit(
        *store, path, highRes, AppendAlongDim{config.highResDim}, "Append high resolution data", false, bytes);
    if (version.status.notFound()) {
        aux_logger.info("No high resolution target at " + path + " yet, creating it");
        version = StoreOperations::writeAndCommit(*store, path, highRes, CreateMode{}, "Create high resolution data",
                                                  true, bytes);
    }
    requireOk(version.status, "Writing high resolution data to " + path);
    return version.value;
}

size_t AuxiliaryMetadataMaintainer::mergeMissingSetup(const Dataset &source, const Dataset &existing,
                                                      const std::string &targetPath) {
    Dataset missing;
    try {
        missing = missingSetupData(source, existing, config.setupDims);
    } catch (const std::invalid_argument &ex) {
        aux_logger.warn("Setup data of " + targetPath + " cannot be extended: " + ex.what());
        return 0;
    }
    if (missing.empty()) {
        return 0;
    }

    size_t bytes = 0;
    StoreResult<VersionId> version = StoreOperations::writeAndCommit(*store, targetPath, missing, AddVariables{},
                                                                     "Add setup entries", false, bytes);
    if (!version.ok()) {
        aux_logger.warn("Could not add setup entries to " + targetPath + ": " + version.status.toString());
        return 0;
    }
    aux_logger.info("Added new setup entries to " + targetPath);
    return bytes;
}

}  // namespace icestream
