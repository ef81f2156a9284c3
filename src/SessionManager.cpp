#include "SessionManager.hpp"
#include "Debug.hpp"
#include <cjson/cJSON.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cerrno>
#include <cstdlib>

namespace {

// DevAddr is stored MSB first, as network consoles print it
std::string devAddrToHex(const DevAddr& addr) {
    DevAddr reversed;
    std::reverse_copy(addr.begin(), addr.end(), reversed.begin());
    return Debug::bytesToHex(reversed.data(), reversed.size());
}

bool hexToDevAddr(const std::string& hex, DevAddr& addr) {
    DevAddr reversed;
    if (!Debug::hexToBytes(hex, reversed.data(), reversed.size())) {
        return false;
    }
    std::reverse_copy(reversed.begin(), reversed.end(), addr.begin());
    return true;
}

bool getHex(const cJSON* obj, const char* name, uint8_t* data, size_t len) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, name);
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        DEBUG_PRINTLN("Session file: missing " << name);
        return false;
    }
    return Debug::hexToBytes(item->valuestring, data, len);
}

// cJSON keeps numbers as double; valueint saturates at INT_MAX, so 32-bit
// counters are read from valuedouble
template <typename T>
bool getUnsigned(const cJSON* obj, const char* name, uint32_t max, T& out) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, name);
    if (!cJSON_IsNumber(item)) {
        DEBUG_PRINTLN("Session file: missing " << name);
        return false;
    }
    double value = item->valuedouble;
    if (value < 0 || value > max || std::floor(value) != value) {
        DEBUG_PRINTLN("Session file: " << name << " out of range");
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

bool getBool(const cJSON* obj, const char* name, bool& out) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, name);
    if (!cJSON_IsBool(item)) {
        DEBUG_PRINTLN("Session file: missing " << name);
        return false;
    }
    out = cJSON_IsTrue(item);
    return true;
}

cJSON* channelsToJSON(const ChannelState& state) {
    cJSON* obj = cJSON_CreateObject();

    cJSON* list = cJSON_AddArrayToObject(obj, "channels");
    for (size_t i = 0; i < state.channels.size(); i++) {
        const Channel& c = state.channels[i];
        if (!c.defined()) {
            continue;
        }
        cJSON* entry = cJSON_CreateObject();
        cJSON_AddNumberToObject(entry, "index", static_cast<double>(i));
        cJSON_AddNumberToObject(entry, "frequency", c.uplinkFrequency);
        cJSON_AddNumberToObject(entry, "downlinkFrequency", c.downlinkFrequency);
        cJSON_AddNumberToObject(entry, "minDataRate", c.minDataRate);
        cJSON_AddNumberToObject(entry, "maxDataRate", c.maxDataRate);
        cJSON_AddItemToArray(list, entry);
    }

    const auto& mask = state.channelMask.bytes();
    cJSON_AddStringToObject(obj, "channelMask", Debug::bytesToHex(mask.data(), mask.size()).c_str());
    cJSON_AddNumberToObject(obj, "rx2Frequency", state.rx2Frequency);
    cJSON_AddNumberToObject(obj, "rx2DataRate", state.rx2DataRate);
    cJSON_AddNumberToObject(obj, "rx1DrOffset", state.rx1DrOffset);
    cJSON_AddNumberToObject(obj, "rx1Delay", state.rx1Delay);
    cJSON_AddNumberToObject(obj, "dataRate", state.dataRate);
    cJSON_AddNumberToObject(obj, "txPowerIndex", state.txPowerIndex);
    cJSON_AddNumberToObject(obj, "nbTrans", state.nbTrans);
    cJSON_AddNumberToObject(obj, "maxDutyCycle", state.maxDutyCycle);
    cJSON_AddBoolToObject(obj, "uplinkDwellTime", state.uplinkDwellTime);
    cJSON_AddBoolToObject(obj, "downlinkDwellTime", state.downlinkDwellTime);
    cJSON_AddNumberToObject(obj, "maxEirp", state.maxEirp);
    return obj;
}

bool channelsFromJSON(const cJSON* obj, ChannelState& out) {
    if (!cJSON_IsObject(obj)) {
        DEBUG_PRINTLN("Session file: missing channel plan");
        return false;
    }
    ChannelState state;

    const cJSON* list = cJSON_GetObjectItemCaseSensitive(obj, "channels");
    if (!cJSON_IsArray(list)) {
        DEBUG_PRINTLN("Session file: missing channel list");
        return false;
    }
    const cJSON* entry = nullptr;
    cJSON_ArrayForEach(entry, list) {
        size_t index = 0;
        Channel c;
        if (!getUnsigned(entry, "index", MAX_CHANNELS - 1, index) ||
            !getUnsigned(entry, "frequency", 0xFFFFFFFFu, c.uplinkFrequency) ||
            !getUnsigned(entry, "downlinkFrequency", 0xFFFFFFFFu, c.downlinkFrequency) ||
            !getUnsigned(entry, "minDataRate", 15, c.minDataRate) ||
            !getUnsigned(entry, "maxDataRate", 15, c.maxDataRate)) {
            return false;
        }
        state.channels[index] = c;
    }

    std::array<uint8_t, 2> mask;
    if (!getHex(obj, "channelMask", mask.data(), mask.size())) {
        return false;
    }
    state.channelMask = ChannelMask<2>(mask);

    if (!getUnsigned(obj, "rx2Frequency", 0xFFFFFFFFu, state.rx2Frequency) ||
        !getUnsigned(obj, "rx2DataRate", 15, state.rx2DataRate) ||
        !getUnsigned(obj, "rx1DrOffset", 7, state.rx1DrOffset) ||
        !getUnsigned(obj, "rx1Delay", 15, state.rx1Delay) ||
        !getUnsigned(obj, "dataRate", 15, state.dataRate) ||
        !getUnsigned(obj, "txPowerIndex", 15, state.txPowerIndex) ||
        !getUnsigned(obj, "nbTrans", 15, state.nbTrans) ||
        !getUnsigned(obj, "maxDutyCycle", 15, state.maxDutyCycle) ||
        !getBool(obj, "uplinkDwellTime", state.uplinkDwellTime) ||
        !getBool(obj, "downlinkDwellTime", state.downlinkDwellTime) ||
        !getUnsigned(obj, "maxEirp", 255, state.maxEirp)) {
        return false;
    }

    out = state;
    return true;
}

// Serialize and delete @p root, write it to a sibling ".tmp" file and rename
// that over @p filename
bool writeAtomically(const std::string& filename, cJSON* root) {
    char* jsonStr = cJSON_Print(root);
    cJSON_Delete(root);
    if (jsonStr == nullptr) {
        std::cerr << "Session file: cannot serialize " << filename << std::endl;
        return false;
    }

    std::string tmpName = filename + ".tmp";
    bool written = false;
    {
        std::ofstream file(tmpName, std::ios::trunc);
        if (file) {
            file << jsonStr;
            file.flush();
            written = file.good();
        }
    }
    free(jsonStr);

    if (!written) {
        std::cerr << "Session file: cannot write " << tmpName << std::endl;
        std::remove(tmpName.c_str());
        return false;
    }
    if (std::rename(tmpName.c_str(), filename.c_str()) != 0) {
        std::cerr << "Session file: cannot replace " << filename << std::endl;
        std::remove(tmpName.c_str());
        return false;
    }
    return true;
}

cJSON* parseFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        return nullptr;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    cJSON* root = cJSON_Parse(buffer.str().c_str());
    if (!root) {
        std::cerr << "Session file: " << filename << " is not valid JSON" << std::endl;
    }
    return root;
}

} // namespace

bool SessionManager::saveSession(const std::string& filename, const SessionData& data) {
    cJSON* root = cJSON_CreateObject();

    cJSON_AddStringToObject(root, "region", regionName(data.region));
    cJSON_AddStringToObject(root, "devAddr", devAddrToHex(data.devAddr).c_str());
    cJSON_AddStringToObject(root, "nwkSKey",
        Debug::bytesToHex(data.nwkSKey.data(), data.nwkSKey.size()).c_str());
    cJSON_AddStringToObject(root, "appSKey",
        Debug::bytesToHex(data.appSKey.data(), data.appSKey.size()).c_str());
    cJSON_AddNumberToObject(root, "uplinkCounter", data.uplinkCounter);
    cJSON_AddNumberToObject(root, "downlinkCounter", data.downlinkCounter);
    cJSON_AddBoolToObject(root, "downlinkReceived", data.downlinkReceived);
    cJSON_AddNumberToObject(root, "lastDevNonce", data.lastDevNonce);
    cJSON_AddItemToObject(root, "channelPlan", channelsToJSON(data.channels));

    return writeAtomically(filename, root);
}

bool SessionManager::loadSession(const std::string& filename, SessionData& data) {
    cJSON* root = parseFile(filename);
    if (!root) {
        return false;
    }

    SessionData loaded;
    bool ok = true;

    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, "region");
    if (!cJSON_IsString(item) || item->valuestring == nullptr ||
        !parseRegion(item->valuestring, loaded.region)) {
        ok = false;
    }
    item = cJSON_GetObjectItemCaseSensitive(root, "devAddr");
    if (ok && (!cJSON_IsString(item) || item->valuestring == nullptr ||
               !hexToDevAddr(item->valuestring, loaded.devAddr))) {
        ok = false;
    }
    ok = ok &&
         getHex(root, "nwkSKey", loaded.nwkSKey.data(), loaded.nwkSKey.size()) &&
         getHex(root, "appSKey", loaded.appSKey.data(), loaded.appSKey.size()) &&
         getUnsigned(root, "uplinkCounter", 0xFFFFFFFFu, loaded.uplinkCounter) &&
         getUnsigned(root, "downlinkCounter", 0xFFFFFFFFu, loaded.downlinkCounter) &&
         getBool(root, "downlinkReceived", loaded.downlinkReceived) &&
         getUnsigned(root, "lastDevNonce", 0xFFFFu, loaded.lastDevNonce) &&
         channelsFromJSON(cJSON_GetObjectItemCaseSensitive(root, "channelPlan"), loaded.channels);

    cJSON_Delete(root);

    if (!ok) {
        std::cerr << "Session file: " << filename << " is incomplete, ignored" << std::endl;
        return false;
    }
    data = loaded;
    return true;
}

bool SessionManager::clearSession(const std::string& filename) {
    if (std::remove(filename.c_str()) != 0 && errno != ENOENT) {
        std::cerr << "Session file: cannot remove " << filename << std::endl;
        return false;
    }
    return true;
}

bool SessionManager::saveDevNonce(const std::string& filename, uint16_t lastDevNonce) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddNumberToObject(root, "lastDevNonce", lastDevNonce);
    return writeAtomically(filename, root);
}

bool SessionManager::loadDevNonce(const std::string& filename, uint16_t& lastDevNonce) {
    cJSON* root = parseFile(filename);
    if (!root) {
        return false;
    }
    uint16_t loaded = 0;
    bool ok = getUnsigned(root, "lastDevNonce", 0xFFFFu, loaded);
    cJSON_Delete(root);
    if (ok) {
        lastDevNonce = loaded;
    }
    return ok;
}

std::string SessionManager::devNonceFilename(const std::string& sessionFile) {
    return sessionFile + ".devnonce";
}
