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

#include "IngestionHistoryDB.h"

#include "../util/Utils.h"
#include "../util/logger/Logger.h"

Logger history_logger;

namespace icestream {

IngestionHistoryDB::IngestionHistoryDB(const std::string &databaseLocation) {
    this->databaseLocation = databaseLocation;
}

IngestionHistoryDB::~IngestionHistoryDB() { finalize(); }

int IngestionHistoryDB::init() {
    if (!Utils::fileExists(this->databaseLocation)) {
        if (Utils::createDatabaseFromDDL(this->databaseLocation.c_str(), ROOT_DIR "ddl/historydb.sql") != 0) {
            return -1;
        }
    }

    if (sqlite3_open(this->databaseLocation.c_str(), &database)) {
        history_logger.error("Cannot open database: " + string(sqlite3_errmsg(database)));
        sqlite3_close(database);
        database = nullptr;
        return -1;
    }
    history_logger.info("History database opened successfully: " + this->databaseLocation);
    return 0;
}

long IngestionHistoryDB::startRun(const std::string &localRoot, const std::string &targetRoot) {
    int rc = runPrepared(
        "INSERT INTO ingestion_run (local_root, target_root, started_at, status) VALUES (?, ?, ?, 'running');",
        {localRoot, targetRoot, Utils::getCurrentTimestamp()});
    if (rc != SQLITE_OK) {
        return -1;
    }
    return lastInsertId();
}

bool IngestionHistoryDB::finishRun(long runId, const RunRecord &record) {
    int rc = runPrepared(
        "UPDATE ingestion_run SET finished_at = ?, status = ?, bytes = ?, slices = ?, commits = ?, windows = ?, "
        "message = ? WHERE idrun = ?;",
        {Utils::getCurrentTimestamp(), record.status, std::to_string(record.bytes), std::to_string(record.slices),
         std::to_string(record.commits), std::to_string(record.windows), record.message, std::to_string(runId)});
    return rc == SQLITE_OK;
}

bool IngestionHistoryDB::recordTransaction(long runId, const TransactionRecord &record) {
    int rc = runPrepared(
        "INSERT INTO ingestion_transaction (idrun, target, mode, version, first_timestamp, last_timestamp, bytes, "
        "recorded_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?);",
        {std::to_string(runId), record.target, record.mode, record.version, record.firstTimestamp,
         record.lastTimestamp, std::to_string(record.bytes), Utils::getCurrentTimestamp()});
    return rc == SQLITE_OK;
}

}  // namespace icestream
