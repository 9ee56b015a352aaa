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

#include "TransactionLog.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>

#include "../blob/LocalBlobStore.h"
#include "../util/Utils.h"
#include "../util/logger/Logger.h"
#include "IngestionErrors.h"
#include "StoreOperations.h"
#include "TargetPaths.h"

Logger transaction_logger;

namespace icestream {

static const char *LAST_VALID_TARGET = "last_valid_target";
static const char *PENULTIMATE_VALID_TARGET = "penultimate_valid_target";
static const char *INCOMPLETE_TARGET = "incomplete_target";

TransactionLog::TransactionLog(const std::string &stateFilePath, std::shared_ptr<ArrayStore> store,
                               std::shared_ptr<BlobStore> blobs, const std::string &targetRoot,
                               const IngestionConfig &config)
    : stateFilePath(stateFilePath), store(std::move(store)), blobs(std::move(blobs)), targetRoot(targetRoot),
      config(config) {
    bool existed = Utils::fileExists(stateFilePath);
    current = loadState(stateFilePath);
    if (!existed) {
        saveState(stateFilePath, current);
    }
}

TransactionState TransactionLog::loadState(const std::string &path) {
    TransactionState state;
    if (!Utils::fileExists(path)) {
        transaction_logger.warn("Could not find an existing streaming state file " + path);
        return state;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception &ex) {
        throw FatalIngestionError("Streaming state file " + path + " is unreadable: " + ex.what());
    }
    if (root.IsNull()) {
        return state;
    }
    if (!root.IsMap()) {
        throw FatalIngestionError("Streaming state file " + path + " is not a mapping");
    }

    auto field = [&root, &path](const char *key) -> std::string {
        YAML::Node node = root[key];
        if (!node || node.IsNull()) return "";
        if (!node.IsScalar()) {
            throw FatalIngestionError("Field " + std::string(key) + " in " + path + " is not a string");
        }
        return node.as<std::string>();
    };
    state.lastValidTarget = field(LAST_VALID_TARGET);
    state.penultimateValidTarget = field(PENULTIMATE_VALID_TARGET);
    state.incompleteTarget = field(INCOMPLETE_TARGET);
    return state;
}

void TransactionLog::saveState(const std::string &path, const TransactionState &state) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << INCOMPLETE_TARGET << YAML::Value << YAML::DoubleQuoted << state.incompleteTarget;
    out << YAML::Key << LAST_VALID_TARGET << YAML::Value << YAML::DoubleQuoted << state.lastValidTarget;
    out << YAML::Key << PENULTIMATE_VALID_TARGET << YAML::Value << YAML::DoubleQuoted << state.penultimateValidTarget;
    out << YAML::EndMap;
    if (!out.good()) {
        throw FatalIngestionError("Cannot encode streaming state: " + out.GetLastError());
    }

    LocalBlobStore local;
    StoreStatus status = local.put(path, std::string(out.c_str()) + "\n");
    if (!status.ok()) {
        throw FatalIngestionError("Cannot persist streaming state to " + path + ": " + status.toString());
    }
}

void TransactionLog::transition(const TransactionEvent &event) {
    TransactionState next = current.apply(event);
    saveState(stateFilePath, next);
    current = next;
    transaction_logger.debug("Transaction " + transactionEventName(event) + ": last_valid_target='" +
                             current.lastValidTarget + "' penultimate_valid_target='" +
                             current.penultimateValidTarget + "' incomplete_target='" + current.incompleteTarget +
                             "'");
}

void TransactionLog::onNewTransaction(const std::string &target) { transition(NewTransaction{target}); }

void TransactionLog::onAppendTransaction() { transition(AppendTransaction{}); }

void TransactionLog::onDeleted() { transition(DeletedTransaction{}); }

void TransactionLog::onRolledBack() { transition(RolledBackTransaction{}); }

ValidatedTarget TransactionLog::onCompleteTransaction() {
    transition(CompleteTransaction{});
    std::optional<Dataset> slice = loadValidateTarget(current.lastValidTarget);
    if (!slice) {
        throw FatalIngestionError("Completed target " + current.lastValidTarget + " could not be validated");
    }
    return ValidatedTarget{current.lastValidTarget, *slice};
}

std::optional<Dataset> TransactionLog::loadValidateTarget(const std::string &pointer) {
    if (pointer.empty()) {
        return std::nullopt;
    }
    std::string path = TargetPaths::resolve(targetRoot, pointer);

    StoreResult<DatasetMetadata> metadata = withRetry("Reading metadata of " + pointer,
                                                      [&]() { return store->readMetadata(path); });
    if (metadata.status.notFound()) {
        transaction_logger.warn("Could not find the specified target " + pointer);
        return std::nullopt;
    }
    requireOk(metadata.status, "Validating " + pointer);

    auto sizeIt = metadata->dimensionSizes.find(config.timeDim);
    if (sizeIt == metadata->dimensionSizes.end() || sizeIt->second == 0) {
        transaction_logger.warn("No usable data found in the target " + pointer);
        return std::nullopt;
    }

    Selection selection;
    for (const auto &variable : metadata->variables) {
        const auto &dims = variable.second;
        bool coordinate = variable.first == config.timeDim;
        bool setup = !dims.empty() && std::all_of(dims.begin(), dims.end(), [this](const std::string &dim) {
            return config.setupDims.count(dim) > 0;
        });
        if (coordinate || setup) {
            selection.variables.push_back(variable.first);
        }
    }
    StoreResult<Dataset> values = withRetry("Reading " + pointer, [&]() { return store->readValues(path, selection); });
    if (values.status.notFound()) {
        transaction_logger.warn("Target " + pointer + " disappeared while validating");
        return std::nullopt;
    }
    requireOk(values.status, "Reading " + pointer);
    if (values->size(config.timeDim) == 0 || !values->hasVariable(config.timeDim)) {
        transaction_logger.warn("No usable data found in the target " + pointer);
        return std::nullopt;
    }
    return values.value;
}

void TransactionLog::deleteObject(const std::string &path) {
    StoreStatus status = withRetry("Deleting " + path, [&]() { return blobs->remove(path, true); });
    if (status.notFound()) {
        transaction_logger.info("Could not find " + path + ", assuming it is already deleted");
        return;
    }
    requireOk(status, "Deleting " + path);
    transaction_logger.info("Deleted " + path);
}

void TransactionLog::recoverHighRes(const std::string &targetPath, const VersionId &checkpoint) {
    std::string highRes = TargetPaths::highResSibling(targetPath);
    std::string tag = StoreOperations::siblingCheckpointTag(checkpoint);
    StoreResult<VersionId> recorded =
        withRetry("Resolving " + tag + " of " + highRes, [&]() { return store->resolveTag(highRes, tag); });
    if (recorded.ok()) {
        transaction_logger.warn("Resetting " + highRes + " to version " + recorded.value);
        requireOk(withRetry("Resetting " + highRes,
                            [&]() {
                                return store->resetBranch(RepositoryHandle{highRes}, Conts::MAIN_BRANCH,
                                                          recorded.value);
                            }),
                  "Resetting " + highRes);
        return;
    }
    if (!recorded.status.notFound()) {
        requireOk(recorded.status, "Resolving " + tag + " of " + highRes);
    }
    // No high resolution data belongs to the checkpoint
    deleteObject(highRes);
}

void TransactionLog::recoverIncomplete() {
    const std::string pointer = current.incompleteTarget;
    const std::string path = TargetPaths::resolve(targetRoot, pointer);

    StoreResult<VersionId> checkpoint = withRetry("Resolving checkpoint of " + pointer, [&]() {
        return store->resolveBranch(path, Conts::CHECKPOINT_BRANCH);
    });
    if (checkpoint.ok()) {
        transaction_logger.warn("Rolling back interrupted write to " + pointer + " to checkpoint " +
                                checkpoint.value);
        requireOk(withRetry("Rolling back " + pointer,
                            [&]() {
                                return store->resetBranch(RepositoryHandle{path}, Conts::MAIN_BRANCH,
                                                          checkpoint.value);
                            }),
                  "Rolling back " + pointer);
        recoverHighRes(path, checkpoint.value);
        onRolledBack();
        return;
    }
    if (!checkpoint.status.notFound()) {
        requireOk(checkpoint.status, "Resolving checkpoint of " + pointer);
    }

    transaction_logger.warn("Deleting corrupt target: " + pointer);
    deleteObject(path);
    deleteObject(TargetPaths::highResSibling(path));
    onDeleted();
}

RecoveryResult TransactionLog::initializeAndValidatePaths() {
    if (!current.incompleteTarget.empty()) {
        recoverIncomplete();
    }

    if (!current.penultimateValidTarget.empty()) {
        try {
            if (!loadValidateTarget(current.penultimateValidTarget)) {
                transaction_logger.warn("Penultimate target " + current.penultimateValidTarget + " is not valid");
            }
        } catch (const FatalIngestionError &ex) {
            transaction_logger.warn("Could not check penultimate target " + current.penultimateValidTarget + ": " +
                                    ex.what());
        }
    }

    RecoveryResult result;
    std::optional<Dataset> slice = loadValidateTarget(current.lastValidTarget);
    if (slice) {
        transaction_logger.info("Using last valid target: " + current.lastValidTarget);
        result.available = true;
        result.target = ValidatedTarget{current.lastValidTarget, *slice};
        return result;
    }

    transaction_logger.warn("Could not validate the last valid target '" + current.lastValidTarget +
                            "', searching " + targetRoot + ", depending on the number of files this may take a while");
    StoreResult<std::vector<std::string>> listing =
        withRetry("Listing " + targetRoot, [&]() { return blobs->listByPrefix(targetRoot); });
    std::vector<std::string> keys;
    if (!listing.status.notFound()) {
        requireOk(listing.status, "Listing " + targetRoot);
        keys = listing.value;
    }

    std::vector<std::string> candidates = TargetPaths::candidateTargets(targetRoot, keys);
    for (auto it = candidates.rbegin(); it != candidates.rend(); ++it) {
        slice = loadValidateTarget(*it);
        if (slice) {
            transition(AdoptTarget{*it});
            transaction_logger.info("Using last valid target found by listing: " + *it);
            result.available = true;
            result.target = ValidatedTarget{*it, *slice};
            return result;
        }
        transaction_logger.warn("Skipping unusable target " + *it);
    }

    if (!current.lastValidTarget.empty()) {
        transition(AdoptTarget{""});
    }
    transaction_logger.info("No valid target found under " + targetRoot + ", starting cold");
    return result;
}

}  // namespace icestream
