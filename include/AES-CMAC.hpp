/**
 * AES-128 block primitive and AES-CMAC (RFC 4493) over OpenSSL EVP.
 * All functions throw std::runtime_error if OpenSSL reports a failure.
 */
#pragma once
#include <vector>
#include <cstddef>
#include <cstdint>
#include <array>

class AESCMAC {
public:
    /**
     * @brief Calculate AES-CMAC for a given message and key
     * @param message Message of any length, including empty
     * @param key 128-bit key
     * @return Full 16-byte tag
     */
    static std::array<uint8_t, 16> calculate(const std::vector<uint8_t>& message,
                                             const std::array<uint8_t, 16>& key);

    /**
     * @brief Encrypt one 16-byte block with AES-128 in ECB mode
     */
    static void aes_encrypt(const uint8_t* input, const uint8_t* key, uint8_t* output);

    /**
     * @brief Decrypt one 16-byte block with AES-128 in ECB mode
     */
    static void aes_decrypt(const uint8_t* input, const uint8_t* key, uint8_t* output);

private:
    static void generate_subkey(const std::array<uint8_t, 16>& key,
                                std::array<uint8_t, 16>& k1,
                                std::array<uint8_t, 16>& k2);
    static void left_shift(const uint8_t* input, uint8_t* output);
    static void aes_block(const uint8_t* input, const uint8_t* key, uint8_t* output, bool encrypt);
};
