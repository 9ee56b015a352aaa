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

#include "Logger.h"

#include <pthread.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <stdlib.h>
#include <unistd.h>

#include <memory>
#include <mutex>

using namespace std;

static string get_role_name();
static void init_loggers();

static std::shared_ptr<spdlog::logger> logger;
static std::shared_ptr<spdlog::logger> daily_logger;
static std::once_flag loggers_initialized;
string role_name = get_role_name();

static string get_role_name() {
    char *instance_id = getenv("ICESTREAM_INSTANCE_ID");
    if (instance_id) {
        return string("INGESTER ") + string(instance_id);
    }
    return string("INGESTER");
}

static void init_loggers() {
    logger = spdlog::stdout_color_mt("logger");
    char *log_file = getenv("ICESTREAM_LOG_FILE");
    string log_path = log_file ? string(log_file) : string("logs/icestream.log");
    try {
        daily_logger = spdlog::daily_logger_mt("IceStream", log_path, 00, 01);
    } catch (const spdlog::spdlog_ex &ex) {
        // Console output still works when the log directory is not writable
        logger->warn(string("File logging disabled: ") + ex.what());
    }

    string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [" + role_name + " : " + to_string(getpid()) + ":%t] %v";
    logger->set_pattern(pattern);
    if (daily_logger) daily_logger->set_pattern(pattern);

    char *level = getenv("ICESTREAM_LOG_LEVEL");
    if (level && string(level) == "debug") {
        logger->set_level(spdlog::level::debug);
        if (daily_logger) daily_logger->set_level(spdlog::level::debug);
    }
    spdlog::flush_every(std::chrono::seconds(5));
}

void Logger::log(std::string message, const std::string log_type) {
    std::call_once(loggers_initialized, init_loggers);

    if (log_type.compare("info") == 0) {
        if (daily_logger) daily_logger->info(message);
        logger->info(message);
    } else if (log_type.compare("warn") == 0) {
        if (daily_logger) daily_logger->warn(message);
        logger->warn(message);
    } else if (log_type.compare("trace") == 0) {
        if (daily_logger) daily_logger->trace(message);
        logger->trace(message);
    } else if (log_type.compare("error") == 0) {
        if (daily_logger) daily_logger->error(message);
        logger->error(message);
    } else if (log_type.compare("debug") == 0) {
        if (daily_logger) daily_logger->debug(message);
        logger->debug(message);
    }
}
