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

#include "Conts.h"

std::string Conts::ICESTREAM_CONF = "ICESTREAM_CONF";
std::string Conts::ICESTREAM_HOME = "ICESTREAM_HOME";

int Conts::MAX_REMOTE_ATTEMPTS = 3;

std::string Conts::TIME_DIM = "timestamp";
std::string Conts::HIGH_RES_TIME_DIM = "high_res_timestamp";
std::string Conts::RETRO_DIM = "retro";
std::string Conts::SETTINGS_ID_DIM = "settings_id";

std::string Conts::TARGET_EXTENSION = ".zarr";
std::string Conts::HIGH_RES_SUFFIX = "_high_res";
std::string Conts::SETUP_SIDELOAD_NAME = "setup.zarr";

std::string Conts::MAIN_BRANCH = "main";
std::string Conts::CHECKPOINT_BRANCH = "valid";
std::string Conts::CHECKPOINT_TAG_PREFIX = "checkpoint-";

std::string Conts::PROPERTIES::STREAMING_MINUTES = "org.icestream.streaming.minutes";
std::string Conts::PROPERTIES::STREAMING_DAYS_PER_FILE = "org.icestream.streaming.days_per_file";
std::string Conts::PROPERTIES::CHUNK_TIMESTAMP = "org.icestream.chunk.timestamp";
std::string Conts::PROPERTIES::CHUNK_HIGH_RES_TIMESTAMP = "org.icestream.chunk.high_res_timestamp";
std::string Conts::PROPERTIES::SIGNIFICANT_KEYS = "org.icestream.significant_keys";
std::string Conts::PROPERTIES::DAY_BOUNDARY = "org.icestream.day_boundary";
std::string Conts::PROPERTIES::STATE_FILE = "org.icestream.state.file";
std::string Conts::PROPERTIES::HISTORY_DB_LOCATION = "org.icestream.history.db.location";
std::string Conts::PROPERTIES::PROVIDER = "org.icestream.provider";
std::string Conts::PROPERTIES::PROVIDER_COMMAND = "org.icestream.provider.command";
std::string Conts::PROPERTIES::MOCK_INSTRUMENT = "org.icestream.mock.instrument";
std::string Conts::PROPERTIES::MOCK_PROJECT = "org.icestream.mock.project";
std::string Conts::PROPERTIES::MOCK_SETTINGS_ID = "org.icestream.mock.settings_id";
std::string Conts::PROPERTIES::MOCK_CADENCE_SECONDS = "org.icestream.mock.cadence_seconds";
std::string Conts::PROPERTIES::MOCK_HIGH_RES_FACTOR = "org.icestream.mock.high_res_factor";
std::string Conts::PROPERTIES::HDFS_HOST = "org.icestream.hdfs.host";
std::string Conts::PROPERTIES::HDFS_PORT = "org.icestream.hdfs.port";

int Conts::DEFAULTS::STREAMING_MINUTES = 30;
int Conts::DEFAULTS::STREAMING_DAYS_PER_FILE = 1;
int Conts::DEFAULTS::CHUNK_TIMESTAMP = 100;
int Conts::DEFAULTS::CHUNK_HIGH_RES_TIMESTAMP = 1000;
std::string Conts::DEFAULTS::SIGNIFICANT_KEYS = "instrument,settings_id";
std::string Conts::DEFAULTS::STATE_FILE = "streaming_state.yaml";
