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

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "src/blob/BlobStore.h"
#include "src/historydb/IngestionHistoryDB.h"
#include "src/ingest/IngestionErrors.h"
#include "src/ingest/StreamDriver.h"
#include "src/provider/CommandSliceProvider.h"
#include "src/provider/MockSliceProvider.h"
#include "src/storage/ChunkedArrayStore.h"
#include "src/util/Conts.h"
#include "src/util/Utils.h"
#include "src/util/logger/Logger.h"

using namespace icestream;

Logger main_logger;

enum args {
    LOCAL_ROOT_PATH = 1,
    TARGET_ROOT = 2,
    FIRST_OPTION = 3
};

static const char *USAGE =
    "Usage: icestream <local_root_path> <target_root> [--since-hint=<ISO8601>] [--until-hint=<ISO8601>] "
    "[--keep-files=<dir>]";

static bool optionValue(const std::string &arg, const std::string &name, std::string &value) {
    std::string prefix = "--" + name + "=";
    if (arg.compare(0, prefix.length(), prefix) != 0) {
        return false;
    }
    value = arg.substr(prefix.length());
    return true;
}

static bool parseHint(const std::string &text, DayBoundary boundary, std::optional<Timestamp> &hint) {
    Timestamp parsed;
    if (!DateTime::parseIso(text, boundary, parsed)) {
        main_logger.error("Invalid timestamp: " + text);
        return false;
    }
    hint = parsed;
    return true;
}

static std::shared_ptr<SliceProvider> createProvider() {
    std::string provider = Utils::getIceStreamProperty(Conts::PROPERTIES::PROVIDER);
    if (provider == "command") {
        return std::make_shared<CommandSliceProvider>(
            Utils::getIceStreamProperty(Conts::PROPERTIES::PROVIDER_COMMAND));
    }
    if (!provider.empty() && provider != "mock") {
        throw std::invalid_argument("Unknown slice provider: " + provider);
    }
    return std::make_shared<MockSliceProvider>(MockSliceConfig::fromProperties());
}

int main(int argc, char *argv[]) {
    if (argc <= args::TARGET_ROOT) {
        main_logger.error(USAGE);
        return -1;
    }

    IngestionConfig config;
    try {
        config = IngestionConfig::fromProperties();
    } catch (const std::invalid_argument &ex) {
        main_logger.error(std::string("Invalid configuration: ") + ex.what());
        return -1;
    }
    main_logger.info("Using ICESTREAM_HOME=" + Utils::getIceStreamHome());

    DriverOptions options;
    options.localRoot = argv[args::LOCAL_ROOT_PATH];
    for (int i = args::FIRST_OPTION; i < argc; i++) {
        std::string arg = argv[i];
        std::string value;
        if (optionValue(arg, "since-hint", value)) {
            if (!parseHint(value, config.dayBoundary, options.hints.since)) return -1;
        } else if (optionValue(arg, "until-hint", value)) {
            if (!parseHint(value, config.dayBoundary, options.hints.until)) return -1;
        } else if (optionValue(arg, "keep-files", value) && !value.empty()) {
            options.keepFilesDir = value;
        } else {
            main_logger.error("Unknown argument " + arg);
            main_logger.error(USAGE);
            return -1;
        }
    }

    try {
        BlobLocation location = parseBlobUrl(argv[args::TARGET_ROOT]);
        options.targetRoot = location.path;
        std::shared_ptr<BlobStore> blobs = openBlobStore(location);

        ChunkPolicy policy;
        policy.chunkSizes[config.timeDim] = config.chunkSize;
        policy.chunkSizes[config.highResDim] = config.highResChunkSize;
        auto store = std::make_shared<ChunkedArrayStore>(blobs, policy);

        StreamDriver driver(options, config, store, blobs, createProvider());
        if (!config.historyDbLocation.empty()) {
            auto history = std::make_shared<IngestionHistoryDB>(config.historyDbLocation);
            if (history->init() == 0) {
                driver.setHistory(history);
            } else {
                main_logger.warn("Ingestion history is disabled, cannot open " + config.historyDbLocation);
            }
        }

        main_logger.info("Streaming " + options.localRoot + " into " + blobs->describe() + options.targetRoot);
        driver.run();
    } catch (const FatalIngestionError &ex) {
        main_logger.error(std::string("Streaming aborted: ") + ex.what());
        return 1;
    } catch (const std::invalid_argument &ex) {
        main_logger.error(ex.what());
        main_logger.error(USAGE);
        return -1;
    } catch (const std::exception &ex) {
        main_logger.error(std::string("Streaming failed: ") + ex.what());
        return 1;
    }
    return 0;
}
