#include "crypto/encrypt.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

#include <sodium.h>
#include <mutex>
#include <stdexcept>
#include <utility>

using namespace lb::config;
using namespace lb::logging;

namespace lb::crypto {

static_assert(KDF_SALT_SIZE == crypto_pwhash_SALTBYTES);
static_assert(AES_IV_SIZE == crypto_aead_aes256gcm_NPUBBYTES);
static_assert(AES_TAG_SIZE == crypto_aead_aes256gcm_ABYTES);

namespace {

std::once_flag sodium_flag;

std::pair<unsigned long long, size_t> kdfLimits() {
    switch (ConfigRegistry::get().crypto.kdf_strength) {
    case KdfStrength::Min:
        return {crypto_pwhash_OPSLIMIT_MIN, crypto_pwhash_MEMLIMIT_MIN};
    case KdfStrength::Moderate:
        return {crypto_pwhash_OPSLIMIT_MODERATE, crypto_pwhash_MEMLIMIT_MODERATE};
    case KdfStrength::Sensitive:
        return {crypto_pwhash_OPSLIMIT_SENSITIVE, crypto_pwhash_MEMLIMIT_SENSITIVE};
    case KdfStrength::Interactive:
    default:
        return {crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE};
    }
}

void requireAesGcm() {
    if (crypto_aead_aes256gcm_is_available() == 0)
        throw std::runtime_error("AES256-GCM not supported on this CPU");
}

}

void init() {
    std::call_once(sodium_flag, [] {
        if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
    });
}

std::vector<uint8_t> encrypt_aes256_gcm(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    std::vector<uint8_t>& out_iv)
{
    init();

    if (key.size() != AES_KEY_SIZE) {
        LogRegistry::crypto()->error("[encrypt_aes256_gcm] Invalid AES-256 key size: {} bytes", key.size());
        throw std::invalid_argument("Invalid AES-256 key size");
    }

    requireAesGcm();

    out_iv.resize(AES_IV_SIZE);
    randombytes_buf(out_iv.data(), AES_IV_SIZE);

    std::vector<uint8_t> ciphertext(plaintext.size() + AES_TAG_SIZE);
    unsigned long long ciphertext_len = 0;

    crypto_aead_aes256gcm_encrypt(
        ciphertext.data(), &ciphertext_len,
        plaintext.data(), plaintext.size(),
        nullptr, 0,  // no AAD
        nullptr, out_iv.data(), key.data());

    ciphertext.resize(ciphertext_len);
    return ciphertext;
}

std::vector<uint8_t> decrypt_aes256_gcm(
    const std::vector<uint8_t>& ciphertext_with_tag,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv)
{
    init();

    if (key.size() != AES_KEY_SIZE || iv.size() != AES_IV_SIZE) {
        LogRegistry::crypto()->error("[decrypt_aes256_gcm] Invalid key or IV size: "
                                     "key size = {}, iv size = {}",
                                     key.size(), iv.size());
        throw std::invalid_argument("Invalid key or IV size");
    }

    if (ciphertext_with_tag.size() < AES_TAG_SIZE)
        throw std::runtime_error("Decryption failed: ciphertext shorter than auth tag");

    requireAesGcm();

    std::vector<uint8_t> decrypted(ciphertext_with_tag.size() - AES_TAG_SIZE);
    unsigned long long decrypted_len = 0;

    if (crypto_aead_aes256gcm_decrypt(
            decrypted.data(), &decrypted_len,
            nullptr,
            ciphertext_with_tag.data(), ciphertext_with_tag.size(),
            nullptr, 0,  // no AAD
            iv.data(), key.data()) != 0)
    {
        throw std::runtime_error("Decryption failed: authentication error");
    }

    decrypted.resize(decrypted_len);
    return decrypted;
}

std::vector<uint8_t> derive_key(const std::string& password, const std::vector<uint8_t>& salt) {
    init();

    if (salt.size() != KDF_SALT_SIZE) {
        LogRegistry::crypto()->error("[derive_key] Invalid salt size: {} bytes", salt.size());
        throw std::invalid_argument("Invalid KDF salt size");
    }

    const auto [opslimit, memlimit] = kdfLimits();

    std::vector<uint8_t> key(AES_KEY_SIZE);
    if (crypto_pwhash(key.data(), key.size(),
                      password.data(), password.size(),
                      salt.data(), opslimit, memlimit,
                      crypto_pwhash_ALG_ARGON2ID13) != 0)
    {
        LogRegistry::crypto()->error("[derive_key] crypto_pwhash failed (opslimit = {}, memlimit = {})",
                                     opslimit, memlimit);
        throw std::runtime_error("Key derivation failed (out of memory?)");
    }

    return key;
}

std::vector<uint8_t> seal(const std::vector<uint8_t>& plaintext, const std::string& password) {
    init();

    std::vector<uint8_t> salt(KDF_SALT_SIZE);
    randombytes_buf(salt.data(), salt.size());

    auto key = derive_key(password, salt);
    std::vector<uint8_t> iv;
    const auto ciphertext = encrypt_aes256_gcm(plaintext, key, iv);
    sodium_memzero(key.data(), key.size());

    std::vector<uint8_t> out;
    out.reserve(salt.size() + iv.size() + ciphertext.size());
    out.insert(out.end(), salt.begin(), salt.end());
    out.insert(out.end(), iv.begin(), iv.end());
    out.insert(out.end(), ciphertext.begin(), ciphertext.end());
    return out;
}

std::vector<uint8_t> unseal(const std::vector<uint8_t>& sealed, const std::string& password) {
    if (sealed.size() < KDF_SALT_SIZE + AES_IV_SIZE + AES_TAG_SIZE) {
        LogRegistry::crypto()->debug("[unseal] Sealed payload too short: {} bytes", sealed.size());
        throw std::runtime_error("Sealed payload is truncated");
    }

    const auto ivBegin = sealed.begin() + KDF_SALT_SIZE;
    const auto ctBegin = ivBegin + AES_IV_SIZE;

    const std::vector<uint8_t> salt(sealed.begin(), ivBegin);
    const std::vector<uint8_t> iv(ivBegin, ctBegin);
    const std::vector<uint8_t> ciphertext(ctBegin, sealed.end());

    auto key = derive_key(password, salt);
    try {
        auto plaintext = decrypt_aes256_gcm(ciphertext, key, iv);
        sodium_memzero(key.data(), key.size());
        return plaintext;
    } catch (...) {
        sodium_memzero(key.data(), key.size());
        throw;
    }
}

std::string b64_encode(const std::vector<uint8_t>& data) {
    init();

    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(encoded_len - 1); // drop the null terminator
    return result;
}

std::vector<uint8_t> b64_decode(const std::string& b64) {
    init();

    std::vector<uint8_t> decoded(b64.size() / 4 * 3 + 3);
    size_t out_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          b64.c_str(), b64.size(),
                          nullptr, &out_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0 || end != b64.c_str() + b64.size())
    {
        throw std::runtime_error("Invalid base64 input");
    }
    decoded.resize(out_len);
    return decoded;
}

}
