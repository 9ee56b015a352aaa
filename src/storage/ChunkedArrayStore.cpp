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

#include "ChunkedArrayStore.h"

#include <algorithm>
#include <cstdio>

#include "../dataset/DatasetSerializer.h"
#include "../util/Conts.h"
#include "../util/logger/Logger.h"

Logger chunked_store_logger;

namespace icestream {

static const char *REPOSITORY_MARKER = "repo.json";

std::string writeModeName(const WriteMode &mode) {
    if (std::holds_alternative<CreateMode>(mode)) return "create";
    if (const auto *append = std::get_if<AppendAlongDim>(&mode)) return "append(" + append->dim + ")";
    return "add-variables";
}

size_t ChunkPolicy::chunkSizeFor(const std::string &dim) const {
    auto it = chunkSizes.find(dim);
    size_t size = it == chunkSizes.end() ? defaultChunkSize : it->second;
    return size == 0 ? 1 : size;
}

static StoreResult<json> jsonFailure(StoreStatus status) {
    StoreResult<json> result;
    result.status = std::move(status);
    return result;
}

static StoreResult<json> jsonValue(json value) {
    StoreResult<json> result;
    result.value = std::move(value);
    return result;
}

static StoreStatus fatal(const std::string &message) { return StoreStatus(ErrorCode::FATAL, message); }

static size_t innerOf(const json &shape) {
    size_t inner = 1;
    for (size_t i = 1; i < shape.size(); i++) {
        inner *= shape[i].get<size_t>();
    }
    return inner;
}

ChunkedArrayStore::ChunkedArrayStore(std::shared_ptr<BlobStore> blobs, ChunkPolicy policy)
    : blobs(std::move(blobs)), policy(std::move(policy)), random(std::random_device{}()) {}

std::string ChunkedArrayStore::newId() {
    char buffer[17];
    snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(random()));
    return std::string(buffer);
}

StoreResult<json> ChunkedArrayStore::loadJson(const std::string &path) {
    StoreResult<std::string> bytes = blobs->get(path);
    if (!bytes.ok()) {
        return jsonFailure(bytes.status);
    }
    try {
        return jsonValue(json::parse(bytes.value));
    } catch (const json::exception &ex) {
        return jsonFailure(fatal("Corrupt document " + path + ": " + ex.what()));
    }
}

StoreResult<json> ChunkedArrayStore::loadManifest(const std::string &target, const std::string &branch) {
    StoreResult<json> ref = loadJson(joinPath(target, "refs/branch." + branch));
    if (!ref.ok()) {
        return ref;
    }
    if (!ref.value.contains("snapshot") || !ref.value["snapshot"].is_string()) {
        return jsonFailure(fatal("Branch " + branch + " of " + target + " has no snapshot"));
    }
    std::string snapshot = ref.value["snapshot"].get<std::string>();
    StoreResult<json> manifest = loadJson(joinPath(target, "snapshots/" + snapshot + ".json"));
    if (manifest.status.notFound()) {
        return jsonFailure(fatal("Branch " + branch + " of " + target + " points to missing snapshot " + snapshot));
    }
    return manifest;
}

StoreStatus ChunkedArrayStore::putRef(const std::string &target, const std::string &kind, const std::string &name,
                                      const VersionId &version) {
    json ref = {{"snapshot", version}};
    return blobs->put(joinPath(target, "refs/" + kind + "." + name), ref.dump());
}

StoreResult<RepositoryHandle> ChunkedArrayStore::openOrCreate(const std::string &location) {
    std::string marker = joinPath(location, REPOSITORY_MARKER);
    StoreResult<bool> present = blobs->exists(marker);
    if (!present.ok()) {
        return present.status;
    }
    if (!present.value) {
        json descriptor = {{"format", "icestream-chunked"}, {"version", 1}};
        StoreStatus status = blobs->put(marker, descriptor.dump());
        if (!status.ok()) {
            return status;
        }
        chunked_store_logger.debug("Created repository " + location);
    }
    return RepositoryHandle{location};
}

StoreResult<RepositoryHandle> ChunkedArrayStore::open(const std::string &location) {
    StoreResult<bool> present = blobs->exists(joinPath(location, REPOSITORY_MARKER));
    if (!present.ok()) {
        return present.status;
    }
    if (!present.value) {
        return StoreStatus(ErrorCode::NOT_FOUND, location);
    }
    return RepositoryHandle{location};
}

StoreStatus ChunkedArrayStore::writeRows(const std::string &target, const std::string &writeId,
                                         const std::string &name, const std::vector<double> &values,
                                         size_t offsetRows, size_t rows, size_t inner, size_t chunkSize,
                                         json &chunks, size_t &bytes) {
    for (size_t row = 0; row < rows; row += chunkSize) {
        size_t count = std::min(chunkSize, rows - row);
        auto begin = values.begin() + (offsetRows + row) * inner;
        std::vector<double> chunk(begin, begin + count * inner);
        std::string key = writeId + "/" + name + "." + std::to_string(chunks.size());
        std::string payload = DatasetSerializer::encodeValues(chunk);
        StoreStatus status = blobs->put(joinPath(target, "chunks/" + key), payload);
        if (!status.ok()) {
            return status;
        }
        chunks.push_back(key);
        bytes += payload.size();
    }
    return StoreStatus::success();
}

StoreStatus ChunkedArrayStore::writeVariable(const std::string &target, const std::string &writeId,
                                             const std::string &name, const Variable &var, const Dataset &dataset,
                                             json &manifest, size_t &bytes) {
    json shape = json::array();
    for (const auto &dim : var.dims) {
        shape.push_back(dataset.size(dim));
    }
    size_t rows = var.dims.empty() ? 1 : dataset.size(var.dims[0]);
    size_t inner = var.dims.empty() ? 1 : innerOf(shape);
    size_t chunkSize = 1;
    if (!var.dims.empty()) {
        const std::string &dim = var.dims[0];
        chunkSize = manifest["chunk_sizes"].contains(dim) ? manifest["chunk_sizes"][dim].get<size_t>()
                                                          : policy.chunkSizeFor(dim);
    }

    json descriptor = {{"dims", var.dims}, {"shape", shape}, {"chunk_size", chunkSize}, {"chunks", json::array()}};
    StoreStatus status = writeRows(target, writeId, name, var.values, 0, rows, inner, chunkSize,
                                   descriptor["chunks"], bytes);
    if (!status.ok()) {
        return status;
    }
    manifest["variables"][name] = descriptor;
    return StoreStatus::success();
}

StoreStatus ChunkedArrayStore::appendVariable(const std::string &target, const std::string &writeId,
                                              const std::string &name, const Variable &var, const Dataset &dataset,
                                              const std::string &dim, json &manifest, size_t &bytes) {
    if (!manifest["variables"].contains(name)) {
        return fatal("Cannot append new variable " + name + " along " + dim);
    }
    json &descriptor = manifest["variables"][name];
    if (descriptor["dims"].get<std::vector<std::string>>() != var.dims) {
        return fatal("Variable " + name + " changed dimensions");
    }
    if (var.dims[0] != dim) {
        return fatal("Variable " + name + " can only be appended along its first dimension");
    }
    json &shape = descriptor["shape"];
    for (size_t i = 1; i < var.dims.size(); i++) {
        if (shape[i].get<size_t>() != dataset.size(var.dims[i])) {
            return fatal("Variable " + name + " differs from the target along " + var.dims[i]);
        }
    }

    size_t oldRows = shape[0].get<size_t>();
    size_t newRows = dataset.size(dim);
    size_t inner = innerOf(shape);
    size_t chunkSize = descriptor["chunk_size"].get<size_t>();
    json &chunks = descriptor["chunks"];

    size_t offset = 0;
    size_t remainder = oldRows % chunkSize;
    if (remainder != 0 && newRows > 0 && !chunks.empty()) {
        // Top up the partial trailing chunk with a rewritten copy
        std::string lastKey = chunks.back().get<std::string>();
        StoreResult<std::string> bytesRead = blobs->get(joinPath(target, "chunks/" + lastKey));
        if (!bytesRead.ok()) {
            return bytesRead.status.notFound() ? fatal("Missing chunk " + lastKey) : bytesRead.status;
        }
        std::vector<double> merged;
        if (!DatasetSerializer::decodeValues(bytesRead.value, merged) || merged.size() != remainder * inner) {
            return fatal("Corrupt chunk " + lastKey);
        }
        size_t fill = std::min(chunkSize - remainder, newRows);
        merged.insert(merged.end(), var.values.begin(), var.values.begin() + fill * inner);
        chunks.erase(chunks.size() - 1);
        StoreStatus status =
            writeRows(target, writeId, name, merged, 0, remainder + fill, inner, chunkSize, chunks, bytes);
        if (!status.ok()) {
            return status;
        }
        offset = fill;
    }
    StoreStatus status =
        writeRows(target, writeId, name, var.values, offset, newRows - offset, inner, chunkSize, chunks, bytes);
    if (!status.ok()) {
        return status;
    }
    shape[0] = oldRows + newRows;
    return StoreStatus::success();
}

StoreResult<PendingWrite> ChunkedArrayStore::write(const RepositoryHandle &handle, const Dataset &dataset,
                                                   const WriteMode &mode) {
    try {
        dataset.validate();
    } catch (const std::invalid_argument &ex) {
        return fatal(std::string("Refusing to write inconsistent dataset: ") + ex.what());
    }

    const std::string &target = handle.location;
    bool creating = std::holds_alternative<CreateMode>(mode);
    StoreResult<json> head = loadManifest(target, Conts::MAIN_BRANCH);
    if (!head.ok() && !(creating && head.status.notFound())) {
        return head.status;
    }

    std::string writeId = newId();
    size_t bytes = 0;
    json manifest;

    if (creating) {
        manifest["parent"] = head.ok() ? head.value["id"] : json("");
        manifest["attrs"] = DatasetSerializer::attributesToJson(dataset.attributes());
        manifest["dims"] = json::object();
        manifest["chunk_sizes"] = json::object();
        manifest["variables"] = json::object();
        for (const auto &dim : dataset.dimensions()) {
            manifest["dims"][dim.first] = dim.second;
            manifest["chunk_sizes"][dim.first] = policy.chunkSizeFor(dim.first);
        }
        for (const auto &entry : dataset.variables()) {
            StoreStatus status = writeVariable(target, writeId, entry.first, entry.second, dataset, manifest, bytes);
            if (!status.ok()) return status;
        }
    } else if (const auto *append = std::get_if<AppendAlongDim>(&mode)) {
        manifest = head.value;
        manifest["parent"] = head.value["id"];
        const std::string &dim = append->dim;
        if (!dataset.hasDimension(dim) || !manifest["dims"].contains(dim)) {
            return fatal("Append dimension " + dim + " missing from " + target + " or the incoming data");
        }
        for (const auto &other : dataset.dimensions()) {
            if (other.first == dim) continue;
            if (manifest["dims"].contains(other.first)) {
                if (manifest["dims"][other.first].get<size_t>() != other.second) {
                    return fatal("Dimension " + other.first + " differs from " + target);
                }
            } else {
                manifest["dims"][other.first] = other.second;
                manifest["chunk_sizes"][other.first] = policy.chunkSizeFor(other.first);
            }
        }
        for (auto it = manifest["variables"].begin(); it != manifest["variables"].end(); ++it) {
            auto dims = it.value()["dims"].get<std::vector<std::string>>();
            if (std::find(dims.begin(), dims.end(), dim) != dims.end() && !dataset.hasVariable(it.key())) {
                return fatal("Append would leave variable " + it.key() + " short along " + dim);
            }
        }
        for (const auto &entry : dataset.variables()) {
            const auto &dims = entry.second.dims;
            StoreStatus status;
            if (std::find(dims.begin(), dims.end(), dim) != dims.end()) {
                status = appendVariable(target, writeId, entry.first, entry.second, dataset, dim, manifest, bytes);
            } else if (!manifest["variables"].contains(entry.first)) {
                status = writeVariable(target, writeId, entry.first, entry.second, dataset, manifest, bytes);
            }
            if (!status.ok()) return status;
        }
        manifest["dims"][dim] = manifest["dims"][dim].get<size_t>() + dataset.size(dim);
    } else {
        manifest = head.value;
        manifest["parent"] = head.value["id"];
        for (const auto &dim : dataset.dimensions()) {
            manifest["dims"][dim.first] = dim.second;
            if (!manifest["chunk_sizes"].contains(dim.first)) {
                manifest["chunk_sizes"][dim.first] = policy.chunkSizeFor(dim.first);
            }
        }
        for (const auto &entry : dataset.variables()) {
            StoreStatus status = writeVariable(target, writeId, entry.first, entry.second, dataset, manifest, bytes);
            if (!status.ok()) return status;
        }
        json attributes = DatasetSerializer::attributesToJson(dataset.attributes());
        for (auto it = attributes.begin(); it != attributes.end(); ++it) {
            manifest["attrs"][it.key()] = it.value();
        }
        for (auto it = manifest["variables"].begin(); it != manifest["variables"].end(); ++it) {
            auto dims = it.value()["dims"].get<std::vector<std::string>>();
            for (size_t i = 0; i < dims.size(); i++) {
                if (it.value()["shape"][i].get<size_t>() != manifest["dims"][dims[i]].get<size_t>()) {
                    return fatal("Adding variables leaves " + it.key() + " inconsistent along " + dims[i]);
                }
            }
        }
    }

    PendingWrite pending;
    pending.handle = handle;
    pending.branch = Conts::MAIN_BRANCH;
    pending.manifest = manifest.dump();
    pending.bytesWritten = bytes;
    chunked_store_logger.debug("Staged " + writeModeName(mode) + " of " + std::to_string(bytes) + " bytes to " +
                               target);
    return pending;
}

StoreResult<VersionId> ChunkedArrayStore::commit(const PendingWrite &pending, const std::string &message) {
    json manifest;
    try {
        manifest = json::parse(pending.manifest);
    } catch (const json::exception &ex) {
        return fatal(std::string("Corrupt pending write: ") + ex.what());
    }
    VersionId version = newId();
    manifest["id"] = version;
    manifest["message"] = message;
    manifest["committed_at"] = DateTime::toIsoString(DateTime::now());

    const std::string &target = pending.handle.location;
    StoreStatus status = blobs->put(joinPath(target, "snapshots/" + version + ".json"), manifest.dump());
    if (!status.ok()) {
        return status;
    }
    status = putRef(target, "branch", pending.branch, version);
    if (!status.ok()) {
        return status;
    }
    chunked_store_logger.debug("Committed " + version + " to " + target + " (" + message + ")");
    return version;
}

StoreResult<DatasetMetadata> ChunkedArrayStore::readMetadata(const std::string &target) {
    StoreResult<json> manifest = loadManifest(target, Conts::MAIN_BRANCH);
    if (!manifest.ok()) {
        return manifest.status;
    }
    DatasetMetadata metadata;
    try {
        metadata.version = manifest.value.at("id").get<std::string>();
        metadata.attrs = DatasetSerializer::attributesFromJson(manifest.value.at("attrs"));
        metadata.dimensionSizes = manifest.value.at("dims").get<std::map<std::string, size_t>>();
        for (auto it = manifest.value.at("variables").begin(); it != manifest.value.at("variables").end(); ++it) {
            metadata.variables[it.key()] = it.value().at("dims").get<std::vector<std::string>>();
        }
    } catch (const json::exception &ex) {
        return fatal("Corrupt manifest for " + target + ": " + ex.what());
    }
    return metadata;
}

StoreResult<std::vector<double>> ChunkedArrayStore::readVariable(const std::string &target, const json &descriptor,
                                                                 size_t chunkSize, size_t inner, size_t start,
                                                                 size_t stop) {
    std::vector<double> values;
    if (stop <= start) {
        return values;
    }
    const json &chunks = descriptor.at("chunks");
    for (size_t index = start / chunkSize; index <= (stop - 1) / chunkSize; index++) {
        if (index >= chunks.size()) {
            return fatal("Variable in " + target + " is missing chunk " + std::to_string(index));
        }
        std::string key = chunks[index].get<std::string>();
        StoreResult<std::string> bytes = blobs->get(joinPath(target, "chunks/" + key));
        if (!bytes.ok()) {
            return bytes.status.notFound() ? fatal("Missing chunk " + key) : bytes.status;
        }
        std::vector<double> chunk;
        if (!DatasetSerializer::decodeValues(bytes.value, chunk)) {
            return fatal("Corrupt chunk " + key);
        }
        size_t chunkStart = index * chunkSize;
        size_t from = std::max(start, chunkStart) - chunkStart;
        size_t to = std::min(stop, chunkStart + chunkSize) - chunkStart;
        if (to * inner > chunk.size()) {
            return fatal("Short chunk " + key);
        }
        values.insert(values.end(), chunk.begin() + from * inner, chunk.begin() + to * inner);
    }
    return values;
}

StoreResult<Dataset> ChunkedArrayStore::readValues(const std::string &target, const Selection &selection) {
    StoreResult<json> loaded = loadManifest(target, selection.branch);
    if (!loaded.ok()) {
        return loaded.status;
    }
    const json &manifest = loaded.value;

    Dataset result;
    try {
        std::map<std::string, size_t> fullDims = manifest.at("dims").get<std::map<std::string, size_t>>();
        size_t rowStart = 0;
        size_t rowStop = 0;
        if (selection.rows) {
            size_t length = fullDims.count(selection.rows->dim) ? fullDims[selection.rows->dim] : 0;
            rowStop = std::min(selection.rows->stop, length);
            rowStart = std::min(selection.rows->start, rowStop);
        }
        for (const auto &dim : fullDims) {
            bool restricted = selection.rows && dim.first == selection.rows->dim;
            result.setDimension(dim.first, restricted ? rowStop - rowStart : dim.second);
        }
        result.setAttributes(DatasetSerializer::attributesFromJson(manifest.at("attrs")));

        for (auto it = manifest.at("variables").begin(); it != manifest.at("variables").end(); ++it) {
            const std::string &name = it.key();
            if (!selection.variables.empty() &&
                std::find(selection.variables.begin(), selection.variables.end(), name) == selection.variables.end()) {
                continue;
            }
            const json &descriptor = it.value();
            auto dims = descriptor.at("dims").get<std::vector<std::string>>();
            const json &shape = descriptor.at("shape");
            size_t rows = dims.empty() ? 1 : shape[0].get<size_t>();
            size_t inner = dims.empty() ? 1 : innerOf(shape);
            size_t chunkSize = descriptor.at("chunk_size").get<size_t>();

            bool usesRows = selection.rows && std::find(dims.begin(), dims.end(), selection.rows->dim) != dims.end();
            bool leading = usesRows && dims[0] == selection.rows->dim;
            size_t start = leading ? rowStart : 0;
            size_t stop = leading ? rowStop : rows;

            StoreResult<std::vector<double>> values = readVariable(target, descriptor, chunkSize, inner, start, stop);
            if (!values.ok()) {
                return values.status;
            }
            if (usesRows && !leading) {
                Dataset full;
                for (size_t i = 0; i < dims.size(); i++) {
                    full.setDimension(dims[i], shape[i].get<size_t>());
                }
                full.setVariable(name, dims, values.value);
                Dataset sliced = full.isel(selection.rows->dim, rowStart, rowStop);
                result.setVariable(name, dims, sliced.variable(name).values);
            } else {
                result.setVariable(name, dims, values.value);
            }
        }
    } catch (const json::exception &ex) {
        return fatal("Corrupt manifest for " + target + ": " + ex.what());
    } catch (const std::invalid_argument &ex) {
        return fatal("Inconsistent data in " + target + ": " + ex.what());
    }
    return result;
}

StoreStatus ChunkedArrayStore::createTag(const RepositoryHandle &handle, const std::string &name,
                                         const VersionId &version) {
    std::string tagPath = joinPath(handle.location, "refs/tag." + name);
    StoreResult<bool> present = blobs->exists(tagPath);
    if (!present.ok()) {
        return present.status;
    }
    if (present.value) {
        return StoreStatus(ErrorCode::ALREADY_EXISTS, "Tag " + name + " exists in " + handle.location);
    }
    StoreResult<bool> snapshot = blobs->exists(joinPath(handle.location, "snapshots/" + version + ".json"));
    if (!snapshot.ok()) {
        return snapshot.status;
    }
    if (!snapshot.value) {
        return StoreStatus(ErrorCode::NOT_FOUND, "Snapshot " + version + " in " + handle.location);
    }
    return putRef(handle.location, "tag", name, version);
}

StoreResult<VersionId> ChunkedArrayStore::resolveRef(const std::string &target, const std::string &kind,
                                                     const std::string &name) {
    StoreResult<json> ref = loadJson(joinPath(target, "refs/" + kind + "." + name));
    if (!ref.ok()) {
        return ref.status;
    }
    if (!ref.value.contains("snapshot") || !ref.value["snapshot"].is_string()) {
        return fatal("Reference " + kind + "." + name + " of " + target + " has no snapshot");
    }
    return ref.value["snapshot"].get<std::string>();
}

StoreResult<VersionId> ChunkedArrayStore::resolveBranch(const std::string &target, const std::string &branch) {
    return resolveRef(target, "branch", branch);
}

StoreResult<VersionId> ChunkedArrayStore::resolveTag(const std::string &target, const std::string &name) {
    return resolveRef(target, "tag", name);
}

StoreStatus ChunkedArrayStore::resetBranch(const RepositoryHandle &handle, const std::string &branch,
                                           const VersionId &version) {
    StoreResult<bool> snapshot = blobs->exists(joinPath(handle.location, "snapshots/" + version + ".json"));
    if (!snapshot.ok()) {
        return snapshot.status;
    }
    if (!snapshot.value) {
        return StoreStatus(ErrorCode::NOT_FOUND, "Snapshot " + version + " in " + handle.location);
    }
    return putRef(handle.location, "branch", branch, version);
}

}  // namespace icestream
