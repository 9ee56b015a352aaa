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

#ifndef ICESTREAM_STORERESULT_H
#define ICESTREAM_STORERESULT_H

#include <string>
#include <utility>

namespace icestream {

enum class ErrorCode { OK, NOT_FOUND, TRANSIENT_IO, ALREADY_EXISTS, FATAL };

inline const char *errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return "OK";
        case ErrorCode::NOT_FOUND:
            return "NOT_FOUND";
        case ErrorCode::TRANSIENT_IO:
            return "TRANSIENT_IO";
        case ErrorCode::ALREADY_EXISTS:
            return "ALREADY_EXISTS";
        case ErrorCode::FATAL:
            return "FATAL";
    }
    return "UNKNOWN";
}

struct StoreStatus {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    StoreStatus() = default;
    StoreStatus(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    static StoreStatus success() { return StoreStatus(); }

    bool ok() const { return code == ErrorCode::OK; }
    bool notFound() const { return code == ErrorCode::NOT_FOUND; }
    explicit operator bool() const { return ok(); }

    std::string toString() const { return std::string(errorCodeName(code)) + (message.empty() ? "" : ": " + message); }
};

// A value or the status that prevented producing it
template <typename T>
struct StoreResult {
    StoreStatus status;
    T value;

    StoreResult() = default;
    StoreResult(const T &val) : value(val) {}
    StoreResult(T &&val) : value(std::move(val)) {}
    StoreResult(StoreStatus st) : status(std::move(st)) {}

    bool ok() const { return status.ok(); }
    explicit operator bool() const { return status.ok(); }
    const T &operator*() const { return value; }
    const T *operator->() const { return &value; }
};

}  // namespace icestream

#endif  // ICESTREAM_STORERESULT_H
