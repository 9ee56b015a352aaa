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

#include "IngestionErrors.h"

#include "../util/Conts.h"
#include "../util/logger/Logger.h"

Logger errors_logger;

namespace icestream {

void requireOk(const StoreStatus &status, const std::string &context) {
    if (status.ok()) {
        return;
    }
    errors_logger.error(context + " failed: " + status.toString());
    throw FatalIngestionError(context + " failed: " + status.toString());
}

void logRetry(const std::string &what, int attempt, const StoreStatus &status) {
    errors_logger.warn(what + " attempt " + std::to_string(attempt) + " of " + std::to_string(maxRemoteAttempts()) +
                       " failed, retrying: " + status.toString());
}

int maxRemoteAttempts() { return Conts::MAX_REMOTE_ATTEMPTS; }

}  // namespace icestream
