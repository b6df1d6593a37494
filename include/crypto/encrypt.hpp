#pragma once

#include <vector>
#include <cstdint>
#include <string>

namespace lb::crypto {

constexpr size_t AES_KEY_SIZE  = 32;      // 256-bit
constexpr size_t AES_IV_SIZE   = 12;      // GCM standard nonce
constexpr size_t AES_TAG_SIZE  = 16;      // GCM auth tag
constexpr size_t KDF_SALT_SIZE = 16;      // crypto_pwhash_SALTBYTES

// Calls sodium_init() once per process
void init();

std::vector<uint8_t> encrypt_aes256_gcm(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    std::vector<uint8_t>& out_iv);

std::vector<uint8_t> decrypt_aes256_gcm(
    const std::vector<uint8_t>& ciphertext_with_tag,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv);

// Argon2id, cost taken from config crypto.kdf_strength
std::vector<uint8_t> derive_key(const std::string& password, const std::vector<uint8_t>& salt);

// salt | iv | ciphertext+tag, keyed by a key derived from password with a fresh salt
std::vector<uint8_t> seal(const std::vector<uint8_t>& plaintext, const std::string& password);
std::vector<uint8_t> unseal(const std::vector<uint8_t>& sealed, const std::string& password);

std::string b64_encode(const std::vector<uint8_t>& data);

std::vector<uint8_t> b64_decode(const std::string& b64);

}
