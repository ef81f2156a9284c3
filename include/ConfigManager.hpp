/**
 * @file ConfigManager.hpp
 * @brief JSON configuration file access.
 *
 * Keys are dot separated paths into nested objects, e.g. "device.appKey".
 * Getters return the supplied default when the path is missing or holds a
 * value of another type.
 */

#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <cjson/cJSON.h>

/**
 * @class ConfigManager
 * @brief Owns a parsed JSON document and the file it was read from.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager bound to a file; nothing is read yet.
     * @param configFile The path to the configuration file.
     */
    explicit ConfigManager(const std::string& configFile = "config.json");

    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * @brief Loads the configuration from the JSON file.
     * @return True if the file was read and parsed, false otherwise (reason on std::cerr).
     */
    bool loadConfig();

    /**
     * @brief Parses a JSON document held in memory.
     */
    bool loadFromString(const std::string& json);

    /**
     * @brief Writes the document back to the configuration file.
     */
    bool saveConfig() const;

    std::string getString(const std::string& path, const std::string& defaultValue = "") const;
    int getInt(const std::string& path, int defaultValue = 0) const;
    bool getBool(const std::string& path, bool defaultValue = false) const;

    /**
     * @brief Whether the path exists, whatever its type.
     */
    bool has(const std::string& path) const;

    /**
     * @brief Decodes a hex string value into exactly @p len bytes, in string order.
     * @return false if the path is missing, not a string, or not 2*len hex digits
     */
    bool getHexBytes(const std::string& path, uint8_t* data, size_t len) const;

    void setString(const std::string& path, const std::string& value);
    void setInt(const std::string& path, int value);
    void setBool(const std::string& path, bool value);

private:
    std::string configFilePath; ///< The path to the configuration file.
    cJSON* root; ///< The root JSON object, nullptr until loaded or set.

    cJSON* getItem(const std::string& path) const;

    /**
     * @brief Parent object of the last path component, created on demand.
     */
    cJSON* getParentForWrite(const std::string& path, std::string& leaf);

    void replaceItem(const std::string& path, cJSON* item);
    void cleanupJSON();
};
