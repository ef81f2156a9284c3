/**
 * @file Debug.hpp
 * @brief Conditional console output shared by every module of the stack.
 *
 * Output is gated by a single process-wide verbose flag. The macros evaluate
 * their argument only when verbose mode is enabled, so hex dumps of keys and
 * frames cost nothing in silent mode.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <iostream>
#include <string>
#include <vector>
#include <array>

class Debug {
public:
    /**
     * @brief Enable or disable verbose output.
     *
     * @param verbose Whether debug messages are printed
     */
    static void setVerbose(bool verbose) { isVerbose = verbose; }

    /**
     * @brief Get verbose mode.
     *
     * @return true if verbose mode is enabled, false otherwise
     */
    static bool getVerbose() { return isVerbose; }

    /**
     * @brief Format bytes as space separated hex pairs ("01 a2 ff").
     */
    static std::string hex(const uint8_t* data, size_t len);

    static std::string hex(const std::vector<uint8_t>& data) {
        return hex(data.data(), data.size());
    }

    template <size_t N>
    static std::string hex(const std::array<uint8_t, N>& data) {
        return hex(data.data(), N);
    }

    /**
     * @brief Format bytes as a compact hex string without separators.
     */
    static std::string bytesToHex(const uint8_t* data, size_t len);

    /**
     * @brief Parse a hex string into exactly @p len bytes.
     *
     * @return false if the string has the wrong length or a non-hex digit
     */
    static bool hexToBytes(const std::string& hex, uint8_t* data, size_t len);

private:
    static bool isVerbose;
};

#define DEBUG_PRINT(x) do { if(Debug::getVerbose()) { std::cout << x; } } while(0)
#define DEBUG_PRINTLN(x) do { if(Debug::getVerbose()) { std::cout << x << std::endl; } } while(0)
#define DEBUG_HEX(label, bytes) do { if(Debug::getVerbose()) { std::cout << label << Debug::hex(bytes) << std::endl; } } while(0)
