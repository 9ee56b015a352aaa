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

#ifndef ICESTREAM_INGESTIONERRORS_H
#define ICESTREAM_INGESTIONERRORS_H

#include <stdexcept>
#include <string>

#include "../blob/StoreResult.h"

namespace icestream {

// Aborts the current run; the transaction log keeps its last persisted state
class FatalIngestionError : public std::runtime_error {
 public:
    explicit FatalIngestionError(const std::string &message) : std::runtime_error(message) {}
};

// Throws FatalIngestionError unless status is OK
void requireOk(const StoreStatus &status, const std::string &context);

void logRetry(const std::string &what, int attempt, const StoreStatus &status);

int maxRemoteAttempts();

inline const StoreStatus &statusOf(const StoreStatus &status) { return status; }

template <typename T>
const StoreStatus &statusOf(const StoreResult<T> &result) {
    return result.status;
}

/**
 * Runs a remote call up to Conts::MAX_REMOTE_ATTEMPTS times while it reports TRANSIENT_IO.
 * The final result is returned as is; callers decide what a remaining failure means.
 */
template <typename Fn>
auto withRetry(const std::string &what, Fn fn) -> decltype(fn()) {
    auto result = fn();
    for (int attempt = 1; attempt < maxRemoteAttempts() && statusOf(result).code == ErrorCode::TRANSIENT_IO;
         attempt++) {
        logRetry(what, attempt, statusOf(result));
        result = fn();
    }
    return result;
}

}  // namespace icestream

#endif  // ICESTREAM_INGESTIONERRORS_H
