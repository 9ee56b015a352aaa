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
#ifndef ICESTREAM_UTILS_H
#define ICESTREAM_UTILS_H

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "Conts.h"

using std::map;
using std::unordered_map;

class Utils {
 private:
    static unordered_map<std::string, std::string> propertiesMap;

 public:
    static std::string getIceStreamProperty(std::string key);

    /**
     * Reads an integer property, falling back to defaultValue when the key is absent or blank.
     * Throws std::invalid_argument when the value is present but not a number.
     */
    static int getIceStreamIntProperty(const std::string &key, int defaultValue);

    static std::string getIceStreamPropertiesPath();

    static void resetProperties();

    static std::vector<std::string> getFileContent(std::string);

    static std::string replaceAll(std::string content, const std::string &oldValue, const std::string &newValue);

    static void writeFileContent(const std::string &filePath, const std::string &content);

    static std::vector<std::string> split(const std::string &, char delimiter);

    static std::string trim_copy(const std::string &, const std::string &delimiters = " \f\n\r\t\v");

    static bool fileExists(std::string fileName);

    static bool is_number(const std::string &compareString);

    static int createDirectory(const std::string dirName);

    static int deleteDirectory(const std::string dirName);

    static std::string getFileName(std::string filePath);

    static long getFolderSize(const std::string &dirName);

    static std::string getIceStreamHome();

    static int copyToDirectory(std::string currentPath, std::string destinationDir);

    static std::string getCurrentTimestamp();

    static int createDatabaseFromDDL(const char *dbLocation, const char *ddlFileLocation);
};

#endif  // ICESTREAM_UTILS_H
