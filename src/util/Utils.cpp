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

#include "Utils.h"

#include <dirent.h>
#include <sqlite3.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "logger/Logger.h"

using namespace std;
Logger util_logger;

unordered_map<std::string, std::string> Utils::propertiesMap;

std::vector<std::string> Utils::split(const std::string &s, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(s);
    while (std::getline(tokenStream, token, delimiter)) {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<std::string> Utils::getFileContent(std::string file) {
    ifstream in(file);

    std::string str;
    vector<std::string> vec;
    if (!in.is_open()) return vec;
    while (std::getline(in, str)) {
        if (str.length() > 0) {
            vec.push_back(str);
        }
    }
    return vec;
};

std::string Utils::replaceAll(std::string content, const std::string &oldValue, const std::string &newValue) {
    size_t pos = 0;
    while ((pos = content.find(oldValue, pos)) != std::string::npos) {
        content.replace(pos, oldValue.length(), newValue);
        pos += newValue.length();
    }
    return content;
}

void Utils::writeFileContent(const std::string &filePath, const std::string &content) {
    std::ofstream out(filePath);
    if (!out.is_open()) {
        util_logger.error("Cannot write to file path: " + filePath);
        return;
    }
    out << content;
    out.close();
}

std::string Utils::getIceStreamPropertiesPath() {
    char const *conf = getenv(Conts::ICESTREAM_CONF.c_str());
    if (conf != nullptr && string(conf).length() > 0) {
        return string(conf);
    }
    return ROOT_DIR "conf/icestream.properties";
}

static std::mutex propertiesMapMutex;
static bool propertiesMapInitialized = false;
std::string Utils::getIceStreamProperty(std::string key) {
    if (!propertiesMapInitialized) {
        propertiesMapMutex.lock();
        if (!propertiesMapInitialized) {  // double-checking lock
            const vector<std::string> &vec = Utils::getFileContent(getIceStreamPropertiesPath());
            for (auto it = vec.begin(); it < vec.end(); it++) {
                std::string item = trim_copy(*it);
                if (item.length() > 0 && !(item.rfind("#", 0) == 0)) {
                    size_t separator = item.find('=');
                    if (separator == std::string::npos) {
                        Utils::propertiesMap[item] = string("");
                    } else {
                        Utils::propertiesMap[trim_copy(item.substr(0, separator))] =
                            trim_copy(item.substr(separator + 1));
                    }
                }
            }
        }
        propertiesMapInitialized = true;
        propertiesMapMutex.unlock();
    }
    auto it = Utils::propertiesMap.find(key);
    if (it != Utils::propertiesMap.end()) {
        return it->second;
    }
    return "";
}

int Utils::getIceStreamIntProperty(const std::string &key, int defaultValue) {
    std::string value = getIceStreamProperty(key);
    if (value.empty()) {
        return defaultValue;
    }
    if (!is_number(value)) {
        throw std::invalid_argument("Property " + key + " must be a non-negative integer, got '" + value + "'");
    }
    return std::stoi(value);
}

void Utils::resetProperties() {
    std::lock_guard<std::mutex> lock(propertiesMapMutex);
    Utils::propertiesMap.clear();
    propertiesMapInitialized = false;
}

static inline std::string trim_right_copy(const std::string &s, const std::string &delimiters) {
    size_t end = s.find_last_not_of(delimiters);
    if (end == std::string::npos) {
        return "";
    }
    return s.substr(0, end + 1);
}

static inline std::string trim_left_copy(const std::string &s, const std::string &delimiters) {
    size_t start = s.find_first_not_of(delimiters);
    if (start == std::string::npos) {
        return "";
    }
    return s.substr(start);
}

std::string Utils::trim_copy(const std::string &s, const std::string &delimiters) {
    return trim_left_copy(trim_right_copy(s, delimiters), delimiters);
}

/**
 * This method checks if a file with the given path exists.
 * @param fileName
 * @return
 */
bool Utils::fileExists(std::string fileName) { return access(fileName.c_str(), F_OK) == 0; }

bool Utils::is_number(const std::string &compareString) {
    return !compareString.empty() && std::find_if(compareString.begin(), compareString.end(),
                                                  [](char c) { return !std::isdigit(c); }) == compareString.end();
}

/**
 * This method creates a new directory if it does not exist
 * @param dirName
 */
int Utils::createDirectory(const std::string dirName) {
    if (dirName.empty()) {
        util_logger.error("Cannot mkdir empty dirName");
        return -1;
    }
    string command = "mkdir -p '" + dirName + "'";
    int status = system(command.c_str());
    if (status != 0) {
        util_logger.warn("Command failed: " + command + "      trying again");
        sleep(1);
        status = system(command.c_str());
    }
    return status;
}

/**
 * This method deletes a directory with all its content if the user has permission
 * @param dirName
 */
int Utils::deleteDirectory(const std::string dirName) {
    string command = "rm -rf '" + dirName + "'";
    int status = system(command.c_str());
    if (status == 0)
        util_logger.debug(dirName + " deleted successfully");
    else
        util_logger.warn("Deleting " + dirName + " failed with exit code " + std::to_string(status));
    return status;
}

/**
 * This method extracts the file name from file path
 * @param filePath
 * @return
 */
std::string Utils::getFileName(std::string filePath) {
    while (filePath.length() > 1 && filePath.back() == '/') {
        filePath.pop_back();
    }
    std::string filename = filePath.substr(filePath.find_last_of("/") + 1);
    return filename;
}

// Total size in bytes of all regular files below dirName
long Utils::getFolderSize(const std::string &dirName) {
    long total = 0;
    DIR *d = opendir(dirName.c_str());
    if (!d) {
        return 0;
    }
    const struct dirent *dir;
    while ((dir = readdir(d)) != nullptr) {
        string name = dir->d_name;
        if (name == "." || name == "..") continue;
        string path = dirName + "/" + name;
        struct stat sb;
        if (stat(path.c_str(), &sb) != 0) continue;
        if (S_ISREG(sb.st_mode)) {
            total += sb.st_size;
        } else if (S_ISDIR(sb.st_mode)) {
            total += getFolderSize(path);
        }
    }
    (void)closedir(d);
    return total;
}

std::string Utils::getIceStreamHome() {
    std::string home;
    char const *temp = getenv(Conts::ICESTREAM_HOME.c_str());
    if (temp != nullptr) {
        home = std::string(temp);
    }
    if (home.empty()) {
        util_logger.warn("Returning empty value for " + Conts::ICESTREAM_HOME);
    }
    return home;
}

int Utils::copyToDirectory(std::string currentPath, std::string destinationDir) {
    if (access(destinationDir.c_str(), F_OK)) {
        std::string createDirCommand = "mkdir -p '" + destinationDir + "'";
        if (system(createDirCommand.c_str())) {
            util_logger.error("Creating directory " + destinationDir + " failed");
            return -1;
        }
    }
    std::string copyCommand = "cp -r '" + currentPath + "' '" + destinationDir + "'";
    int status = system(copyCommand.c_str());
    if (status != 0) {
        util_logger.error("Copying " + currentPath + " to directory " + destinationDir + " failed with code " +
                          std::to_string(status));
    }
    return status;
}

std::string Utils::getCurrentTimestamp() {
    auto now = chrono::system_clock::now();
    time_t time = chrono::system_clock::to_time_t(now);
    tm tm_time;
    localtime_r(&time, &tm_time);
    stringstream timestamp;
    timestamp << put_time(&tm_time, "%Y-%m-%d %H:%M:%S");

    return timestamp.str();
}

int Utils::createDatabaseFromDDL(const char *dbLocation, const char *ddlFileLocation) {
    if (!Utils::fileExists(ddlFileLocation)) {
        util_logger.error("DDL file not found: " + string(ddlFileLocation));
        return -1;
    }
    ifstream ddlFile(ddlFileLocation);

    stringstream buffer;
    buffer << ddlFile.rdbuf();
    ddlFile.close();

    sqlite3 *tempDatabase;
    int rc = sqlite3_open(dbLocation, &tempDatabase);
    if (rc) {
        util_logger.error("Cannot create database: " + string(sqlite3_errmsg(tempDatabase)));
        sqlite3_close(tempDatabase);
        return -1;
    }

    rc = sqlite3_exec(tempDatabase, buffer.str().c_str(), 0, 0, 0);
    if (rc) {
        util_logger.error("DDL execution failed: " + string(sqlite3_errmsg(tempDatabase)));
        sqlite3_close(tempDatabase);
        return -1;
    }

    sqlite3_close(tempDatabase);
    util_logger.info("Database created successfully");
    return 0;
}
