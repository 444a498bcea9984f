#include "VaultKey.hpp"
#include <sodium.h>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

// constants for key derivation / pwhash
static constexpr std::size_t ENC_KEY_BYTES = crypto_secretbox_KEYBYTES; // 32
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;      // recommended salt size

VaultKey::~VaultKey() {
    clear();
}

VaultKey::VaultKey(VaultKey&& other) noexcept
    : key(std::move(other.key)), salt_bytes(std::move(other.salt_bytes))
{
    other.key.clear();
    other.salt_bytes.clear();
}

VaultKey& VaultKey::operator=(VaultKey&& other) noexcept {
    if (this != &other) {
        clear();
        key = std::move(other.key);
        salt_bytes = std::move(other.salt_bytes);
        other.key.clear();
        other.salt_bytes.clear();
    }
    return *this;
}

void VaultKey::clear() {
    if (!key.empty()) {
        sodium_memzero(key.data(), key.size());
        key.clear();
    }
    salt_bytes.clear();
}

std::size_t VaultKey::saltSize() {
    return SALT_BYTES;
}

std::vector<unsigned char> VaultKey::randomSalt() {
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
    std::vector<unsigned char> salt(SALT_BYTES);
    randombytes_buf(salt.data(), salt.size());
    return salt;
}

bool VaultKey::derive(const std::string& passphrase, const std::vector<unsigned char>& salt) {
    spdlog::debug("Deriving vault key (not logging passphrase or salt)");
    clear();

    if (sodium_init() < 0) {
        spdlog::error("libsodium initialization failed");
        return false;
    }

    if (salt.size() != SALT_BYTES) {
        spdlog::error("Cannot derive vault key: salt length mismatch");
        return false;
    }

    key.assign(ENC_KEY_BYTES, 0);

    if (crypto_pwhash(key.data(),
        ENC_KEY_BYTES,
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during vault key derivation");
        sodium_memzero(key.data(), key.size());
        key.clear();
        return false;
    }

    salt_bytes = salt;
    spdlog::debug("Vault key derived successfully");
    return true;
}
