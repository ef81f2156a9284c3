#include "Debug.hpp"
#include <sstream>
#include <iomanip>
#include <cctype>

bool Debug::isVerbose = false;

std::string Debug::hex(const uint8_t* data, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; i++) {
        if (i > 0) {
            ss << " ";
        }
        ss << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string Debug::bytesToHex(const uint8_t* data, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(data[i]);
    }
    return ss.str();
}

bool Debug::hexToBytes(const std::string& hex, uint8_t* data, size_t len) {
    if (hex.size() != len * 2) {
        return false;
    }
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    for (size_t i = 0; i < len; i++) {
        data[i] = static_cast<uint8_t>(std::stoi(hex.substr(i * 2, 2), nullptr, 16));
    }
    return true;
}
