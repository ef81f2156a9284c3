#include "ConfigManager.hpp"
#include "Debug.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>
#include <cstdlib>

namespace {

std::vector<std::string> splitPath(const std::string& s, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(s);
    std::string token;

    while (getline(ss, token, delimiter)) {
        tokens.push_back(token);
    }

    return tokens;
}

} // namespace

ConfigManager::ConfigManager(const std::string& configFile)
    : configFilePath(configFile), root(nullptr) {
}

ConfigManager::~ConfigManager() {
    cleanupJSON();
}

void ConfigManager::cleanupJSON() {
    if (root != nullptr) {
        cJSON_Delete(root);
        root = nullptr;
    }
}

bool ConfigManager::loadConfig() {
    std::ifstream configFile(configFilePath);
    if (!configFile.is_open()) {
        std::cerr << "Cannot open configuration file: " << configFilePath << std::endl;
        return false;
    }

    std::stringstream buffer;
    buffer << configFile.rdbuf();
    return loadFromString(buffer.str());
}

bool ConfigManager::loadFromString(const std::string& json) {
    cleanupJSON();

    root = cJSON_Parse(json.c_str());
    if (root == nullptr) {
        const char* errorPtr = cJSON_GetErrorPtr();
        std::string errorMsg = errorPtr != nullptr ? errorPtr : "Unknown error";
        std::cerr << "Error parsing configuration JSON near: " << errorMsg << std::endl;
        return false;
    }
    if (!cJSON_IsObject(root)) {
        std::cerr << "Configuration root must be a JSON object" << std::endl;
        cleanupJSON();
        return false;
    }
    return true;
}

bool ConfigManager::saveConfig() const {
    if (root == nullptr) {
        std::cerr << "No configuration to save" << std::endl;
        return false;
    }

    char* jsonStr = cJSON_Print(root);
    if (jsonStr == nullptr) {
        std::cerr << "Error converting configuration to JSON" << std::endl;
        return false;
    }

    std::ofstream configFile(configFilePath);
    if (!configFile.is_open()) {
        std::cerr << "Cannot open configuration file for writing: " << configFilePath << std::endl;
        free(jsonStr);
        return false;
    }

    configFile << jsonStr;
    free(jsonStr);
    return configFile.good();
}

cJSON* ConfigManager::getItem(const std::string& path) const {
    if (root == nullptr) {
        return nullptr;
    }

    auto parts = splitPath(path, '.');
    if (parts.empty()) {
        return nullptr;
    }

    cJSON* current = root;
    for (const auto& part : parts) {
        if (!cJSON_IsObject(current)) {
            return nullptr;
        }
        current = cJSON_GetObjectItemCaseSensitive(current, part.c_str());
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

std::string ConfigManager::getString(const std::string& path, const std::string& defaultValue) const {
    cJSON* item = getItem(path);
    if (item == nullptr || !cJSON_IsString(item) || item->valuestring == nullptr) {
        return defaultValue;
    }
    return item->valuestring;
}

int ConfigManager::getInt(const std::string& path, int defaultValue) const {
    cJSON* item = getItem(path);
    if (item == nullptr || !cJSON_IsNumber(item)) {
        return defaultValue;
    }
    return item->valueint;
}

bool ConfigManager::getBool(const std::string& path, bool defaultValue) const {
    cJSON* item = getItem(path);
    if (item == nullptr || !cJSON_IsBool(item)) {
        return defaultValue;
    }
    return cJSON_IsTrue(item);
}

bool ConfigManager::has(const std::string& path) const {
    return getItem(path) != nullptr;
}

bool ConfigManager::getHexBytes(const std::string& path, uint8_t* data, size_t len) const {
    cJSON* item = getItem(path);
    if (item == nullptr || !cJSON_IsString(item) || item->valuestring == nullptr) {
        return false;
    }
    return Debug::hexToBytes(item->valuestring, data, len);
}

cJSON* ConfigManager::getParentForWrite(const std::string& path, std::string& leaf) {
    if (root == nullptr) {
        root = cJSON_CreateObject();
    }

    auto parts = splitPath(path, '.');
    if (parts.empty()) {
        return nullptr;
    }
    leaf = parts.back();

    cJSON* current = root;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        cJSON* next = cJSON_GetObjectItemCaseSensitive(current, parts[i].c_str());
        if (next == nullptr || !cJSON_IsObject(next)) {
            cJSON_DeleteItemFromObjectCaseSensitive(current, parts[i].c_str());
            next = cJSON_AddObjectToObject(current, parts[i].c_str());
        }
        current = next;
    }
    return current;
}

void ConfigManager::replaceItem(const std::string& path, cJSON* item) {
    std::string leaf;
    cJSON* parent = getParentForWrite(path, leaf);
    if (parent == nullptr) {
        cJSON_Delete(item);
        return;
    }
    cJSON_DeleteItemFromObjectCaseSensitive(parent, leaf.c_str());
    cJSON_AddItemToObject(parent, leaf.c_str(), item);
}

void ConfigManager::setString(const std::string& path, const std::string& value) {
    replaceItem(path, cJSON_CreateString(value.c_str()));
}

void ConfigManager::setInt(const std::string& path, int value) {
    replaceItem(path, cJSON_CreateNumber(value));
}

void ConfigManager::setBool(const std::string& path, bool value) {
    replaceItem(path, cJSON_CreateBool(value));
}
