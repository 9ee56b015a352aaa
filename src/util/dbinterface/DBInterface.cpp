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

#include "DBInterface.h"

#include "../logger/Logger.h"

Logger interface_logger;

int DBInterface::finalize() {
    if (database == nullptr) {
        return SQLITE_OK;
    }
    int rc = sqlite3_close(database);
    database = nullptr;
    return rc;
}

typedef vector<vector<pair<string, string>>> table_type;

static int callback(void *ptr, int argc, char **argv, char **columnName) {
    table_type *dbResults = static_cast<table_type *>(ptr);
    vector<pair<string, string>> results;

    for (int i = 0; i < argc; i++) {
        results.push_back(make_pair(columnName[i], argv[i] ? argv[i] : "NULL"));
    }
    dbResults->push_back(results);
    return 0;
}

vector<vector<pair<string, string>>> DBInterface::runSelect(string query) {
    char *errorMessage = 0;
    vector<vector<pair<string, string>>> dbResults;

    if (sqlite3_exec(database, query.c_str(), callback, &dbResults, &errorMessage) != SQLITE_OK) {
        interface_logger.error("SQL Error: " + string(errorMessage) + " " + query);
        sqlite3_free(errorMessage);
    }
    return dbResults;
}

int DBInterface::runPrepared(const std::string &query, const std::vector<std::string> &params) {
    sqlite3_stmt *stmt;
    int rc = sqlite3_prepare_v2(database, query.c_str(), -1, &stmt, NULL);
    if (rc != SQLITE_OK) {
        interface_logger.error("SQL Error: Failed to prepare statement " + query + ": " + sqlite3_errmsg(database));
        return rc;
    }

    for (size_t i = 0; i < params.size(); i++) {
        rc = sqlite3_bind_text(stmt, static_cast<int>(i + 1), params[i].c_str(), -1, SQLITE_TRANSIENT);
        if (rc != SQLITE_OK) {
            interface_logger.error("SQL Error: Failed to bind parameter " + std::to_string(i + 1));
            sqlite3_finalize(stmt);
            return rc;
        }
    }

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        interface_logger.error("SQL Error: " + string(sqlite3_errmsg(database)) + " " + query);
        sqlite3_finalize(stmt);
        return rc;
    }
    sqlite3_finalize(stmt);
    return SQLITE_OK;
}

long DBInterface::lastInsertId() {
    return static_cast<long>(sqlite3_last_insert_rowid(database));
}
