#pragma once
#include <string>
#include <vector>

// Symmetric key for the data file, derived from the user's passphrase with
// Argon2id (libsodium crypto_pwhash). Key bytes are wiped on destruction.
class VaultKey {
public:
    VaultKey() = default;
    ~VaultKey();

    VaultKey(const VaultKey&) = delete;
    VaultKey& operator=(const VaultKey&) = delete;
    VaultKey(VaultKey&& other) noexcept;
    VaultKey& operator=(VaultKey&& other) noexcept;

    // Returns false (and stays invalid) if libsodium is unavailable, the salt
    // has the wrong size or key derivation runs out of memory.
    bool derive(const std::string& passphrase, const std::vector<unsigned char>& salt);

    void clear();
    bool valid() const { return !key.empty(); }

    const std::vector<unsigned char>& bytes() const { return key; }
    const std::vector<unsigned char>& saltBytes() const { return salt_bytes; }

    static std::vector<unsigned char> randomSalt();
    static std::size_t saltSize();

private:
    std::vector<unsigned char> key;
    std::vector<unsigned char> salt_bytes;
};
