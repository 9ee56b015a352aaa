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

#ifndef ICESTREAM_DBINTERFACE_H
#define ICESTREAM_DBINTERFACE_H

#include <sqlite3.h>

#include <string>
#include <utility>
#include <vector>

using namespace std;

class DBInterface {
 protected:
    sqlite3 *database = nullptr;
    std::string databaseLocation;

 public:
    virtual ~DBInterface() = default;

    virtual int init() = 0;

    int finalize();

    bool isOpen() const { return database != nullptr; }

    std::vector<std::vector<std::pair<std::string, std::string>>> runSelect(std::string);

    /**
     * Executes a statement with positional text parameters.
     * @return SQLITE_OK, or the sqlite error code of the failing step
     */
    int runPrepared(const std::string &query, const std::vector<std::string> &params);

    long lastInsertId();
};

#endif  // ICESTREAM_DBINTERFACE_H
