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

#ifndef ICESTREAM_INGESTIONHISTORYDB_H
#define ICESTREAM_INGESTIONHISTORYDB_H

#include <string>

#include "../util/dbinterface/DBInterface.h"

namespace icestream {

struct TransactionRecord {
    std::string target;
    std::string mode;
    std::string version;
    std::string firstTimestamp;
    std::string lastTimestamp;
    size_t bytes = 0;
};

struct RunRecord {
    std::string status;
    size_t bytes = 0;
    size_t slices = 0;
    size_t commits = 0;
    size_t windows = 0;
    std::string message;
};

// Run and transaction history kept in SQLite, created from ddl/historydb.sql on first use
class IngestionHistoryDB : public DBInterface {
 public:
    explicit IngestionHistoryDB(const std::string &databaseLocation);

    ~IngestionHistoryDB() override;

    int init() override;

    // Returns the run id, -1 on error
    long startRun(const std::string &localRoot, const std::string &targetRoot);

    bool finishRun(long runId, const RunRecord &record);

    bool recordTransaction(long runId, const TransactionRecord &record);
};

}  // namespace icestream

#endif  // ICESTREAM_INGESTIONHISTORYDB_H
