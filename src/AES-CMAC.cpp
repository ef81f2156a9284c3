#include "AES-CMAC.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <algorithm>

std::array<uint8_t, 16> AESCMAC::calculate(const std::vector<uint8_t>& message,
                                           const std::array<uint8_t, 16>& key) {
    std::array<uint8_t, 16> k1, k2;
    generate_subkey(key, k1, k2);

    // An empty message is one incomplete block
    size_t n = (message.size() + 15) / 16;
    bool last_block_complete = true;
    if (n == 0) {
        n = 1;
        last_block_complete = false;
    } else {
        last_block_complete = (message.size() % 16) == 0;
    }

    std::array<uint8_t, 16> x = {0};
    std::array<uint8_t, 16> y;

    for (size_t i = 0; i < n - 1; i++) {
        for (size_t j = 0; j < 16; j++) {
            y[j] = message[i * 16 + j] ^ x[j];
        }
        aes_encrypt(y.data(), key.data(), x.data());
    }

    std::array<uint8_t, 16> last_block = {0};
    size_t last_block_size = message.size() - (n - 1) * 16;
    std::copy(message.end() - last_block_size, message.end(), last_block.begin());

    const std::array<uint8_t, 16>& subkey = last_block_complete ? k1 : k2;
    if (!last_block_complete) {
        last_block[last_block_size] = 0x80;
    }
    for (size_t i = 0; i < 16; i++) {
        y[i] = last_block[i] ^ subkey[i] ^ x[i];
    }

    std::array<uint8_t, 16> cmac;
    aes_encrypt(y.data(), key.data(), cmac.data());
    return cmac;
}

void AESCMAC::generate_subkey(const std::array<uint8_t, 16>& key,
                              std::array<uint8_t, 16>& k1,
                              std::array<uint8_t, 16>& k2) {
    static const uint8_t const_rb = 0x87;

    // L = AES-128(key, 0^128)
    std::array<uint8_t, 16> zero = {0};
    std::array<uint8_t, 16> L;
    aes_encrypt(zero.data(), key.data(), L.data());

    bool msb = (L[0] & 0x80) != 0;
    left_shift(L.data(), k1.data());
    if (msb) {
        k1[15] ^= const_rb;
    }

    msb = (k1[0] & 0x80) != 0;
    left_shift(k1.data(), k2.data());
    if (msb) {
        k2[15] ^= const_rb;
    }
}

void AESCMAC::left_shift(const uint8_t* input, uint8_t* output) {
    uint8_t overflow = 0;
    for (int i = 15; i >= 0; i--) {
        output[i] = static_cast<uint8_t>((input[i] << 1) | overflow);
        overflow = (input[i] & 0x80) ? 1 : 0;
    }
}

void AESCMAC::aes_block(const uint8_t* input, const uint8_t* key, uint8_t* output, bool encrypt) {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw std::runtime_error("Error creating EVP context");
    }

    int outlen = 0;
    if (EVP_CipherInit_ex(ctx, EVP_aes_128_ecb(), nullptr, key, nullptr, encrypt ? 1 : 0) != 1 ||
        EVP_CIPHER_CTX_set_padding(ctx, 0) != 1 ||
        EVP_CipherUpdate(ctx, output, &outlen, input, 16) != 1 ||
        outlen != 16) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error(encrypt ? "Error in AES encryption" : "Error in AES decryption");
    }

    EVP_CIPHER_CTX_free(ctx);
}

void AESCMAC::aes_encrypt(const uint8_t* input, const uint8_t* key, uint8_t* output) {
    aes_block(input, key, output, true);
}

void AESCMAC::aes_decrypt(const uint8_t* input, const uint8_t* key, uint8_t* output) {
    aes_block(input, key, output, false);
}
