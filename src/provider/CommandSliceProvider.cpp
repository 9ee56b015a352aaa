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

#include "CommandSliceProvider.h"

#include <sys/wait.h>

#include <algorithm>
#include <cstdio>

#include "../blob/LocalBlobStore.h"
#include "../dataset/DatasetSerializer.h"
#include "../util/Conts.h"
#include "../util/Utils.h"
#include "../util/logger/Logger.h"

Logger command_provider_logger;

namespace icestream {

CommandSliceProvider::CommandSliceProvider(std::string commandTemplate) : commandTemplate(std::move(commandTemplate)) {
    if (this->commandTemplate.empty()) {
        throw std::invalid_argument("Slice provider command is empty");
    }
}

std::string CommandSliceProvider::render(const std::string &localDir, Timestamp since, Timestamp until) const {
    std::string command = Utils::replaceAll(commandTemplate, "{dir}", "'" + localDir + "'");
    command = Utils::replaceAll(command, "{since}", DateTime::toIsoString(since));
    return Utils::replaceAll(command, "{until}", DateTime::toIsoString(until));
}

std::vector<std::string> CommandSliceProvider::collectSlices(const std::string &localDir) {
    LocalBlobStore local;
    StoreResult<std::vector<std::string>> listing = local.listByPrefix(localDir);
    std::vector<std::string> slices;
    if (!listing.ok()) {
        if (!listing.status.notFound()) {
            throw SliceProviderError("Cannot list " + localDir + ": " + listing.status.toString());
        }
        return slices;
    }

    const std::string descriptor = std::string("/") + DatasetSerializer::DESCRIPTOR_FILE;
    const std::string &extension = Conts::TARGET_EXTENSION;
    for (const auto &key : listing.value) {
        if (key.length() <= descriptor.length() ||
            key.compare(key.length() - descriptor.length(), descriptor.length(), descriptor) != 0) {
            continue;
        }
        std::string dir = key.substr(0, key.length() - descriptor.length());
        if (dir.length() > extension.length() &&
            dir.compare(dir.length() - extension.length(), extension.length(), extension) == 0) {
            slices.push_back(dir);
        }
    }
    std::sort(slices.begin(), slices.end());
    return slices;
}

std::vector<std::string> CommandSliceProvider::fetchSlices(const std::string &localDir, Timestamp since,
                                                           Timestamp until) {
    std::string command = render(localDir, since, until) + " 2>&1";
    command_provider_logger.info("Running backup command: " + command);

    char buffer[128];
    std::string output;
    FILE *input = popen(command.c_str(), "r");
    if (!input) {
        throw SliceProviderError("Cannot start backup command: " + command);
    }
    while (fgets(buffer, sizeof(buffer), input) != nullptr) {
        output.append(buffer);
    }
    int status = pclose(input);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        command_provider_logger.error("Backup command output: " + output);
        throw SliceProviderError("Backup command failed with status " + std::to_string(status));
    }
    if (!output.empty()) {
        command_provider_logger.debug("Backup command output: " + output);
    }

    std::vector<std::string> slices = collectSlices(localDir);
    command_provider_logger.info("Backup command produced " + std::to_string(slices.size()) + " slices");
    return slices;
}

}  // namespace icestream
