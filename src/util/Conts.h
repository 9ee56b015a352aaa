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

#ifndef ICESTREAM_CONTS_H
#define ICESTREAM_CONTS_H

#include <string>

class Conts {
 public:
    static std::string ICESTREAM_CONF;
    static std::string ICESTREAM_HOME;

    static int MAX_REMOTE_ATTEMPTS;

    static std::string TIME_DIM;
    static std::string HIGH_RES_TIME_DIM;
    static std::string RETRO_DIM;
    static std::string SETTINGS_ID_DIM;

    static std::string TARGET_EXTENSION;
    static std::string HIGH_RES_SUFFIX;
    static std::string SETUP_SIDELOAD_NAME;

    static std::string MAIN_BRANCH;
    static std::string CHECKPOINT_BRANCH;
    // Tag on a high resolution sibling naming the main version it was checkpointed with
    static std::string CHECKPOINT_TAG_PREFIX;

    struct PROPERTIES {
        static std::string STREAMING_MINUTES;
        static std::string STREAMING_DAYS_PER_FILE;
        static std::string CHUNK_TIMESTAMP;
        static std::string CHUNK_HIGH_RES_TIMESTAMP;
        static std::string SIGNIFICANT_KEYS;
        static std::string DAY_BOUNDARY;
        static std::string STATE_FILE;
        static std::string HISTORY_DB_LOCATION;
        static std::string PROVIDER;
        static std::string PROVIDER_COMMAND;
        static std::string MOCK_INSTRUMENT;
        static std::string MOCK_PROJECT;
        static std::string MOCK_SETTINGS_ID;
        static std::string MOCK_CADENCE_SECONDS;
        static std::string MOCK_HIGH_RES_FACTOR;
        static std::string HDFS_HOST;
        static std::string HDFS_PORT;
    };

    struct DEFAULTS {
        static int STREAMING_MINUTES;
        static int STREAMING_DAYS_PER_FILE;
        static int CHUNK_TIMESTAMP;
        static int CHUNK_HIGH_RES_TIMESTAMP;
        static std::string SIGNIFICANT_KEYS;
        static std::string STATE_FILE;
    };
};

#endif  // ICESTREAM_CONTS_H
