#include "Storage.hpp"
#include "Codec.hpp"
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "RETAIN1\n";
static constexpr std::size_t MAGIC_LEN = sizeof(MAGIC_HDR) - 1;

static bool readHeader(std::ifstream& in, std::vector<unsigned char>& salt) {
    char hdr[MAGIC_LEN];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(hdr)) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header");
        return false;
    }

    salt.assign(crypto_pwhash_SALTBYTES, 0);
    in.read(reinterpret_cast<char*>(salt.data()), salt.size());
    if (in.gcount() != static_cast<std::streamsize>(salt.size())) {
        spdlog::error("Failed to read salt");
        return false;
    }
    return true;
}

bool Storage::save(const Snapshot& snap, const std::string& filename, const VaultKey& key) {
    spdlog::info("Saving {} sources, {} cards, {} review logs to '{}'",
        snap.sources.size(), snap.cards.size(), snap.logs.size(), filename);
    if (!key.valid() || key.bytes().size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return false;
    }
    if (key.saltBytes().size() != crypto_pwhash_SALTBYTES) {
        spdlog::error("Key carries no salt");
        return false;
    }

    std::string plain = Codec::serialize(snap);
    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    if (crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.bytes().data()) != 0) {
        spdlog::error("Encryption failed");
        return false;
    }
    sodium_memzero(&plain[0], plain.size());

    // Write next to the target and rename, so a crash never leaves half a file
    const std::string tmp = filename + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for encrypted write", tmp);
            return false;
        }

        out.write(MAGIC_HDR, MAGIC_LEN);
        out.write(reinterpret_cast<const char*>(key.saltBytes().data()), key.saltBytes().size());
        out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
        out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
        if (!out) {
            spdlog::error("Short write to '{}'", tmp);
            return false;
        }
    }

    if (std::rename(tmp.c_str(), filename.c_str()) != 0) {
        spdlog::error("Failed to replace '{}'", filename);
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

bool Storage::load(Snapshot& snap, const std::string& filename, const VaultKey& key) {
    spdlog::info("Loading encrypted data from '{}'", filename);
    snap = Snapshot();

    if (!key.valid() || key.bytes().size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Data file '{}' not found; treating as empty", filename);
        return true;
    }

    std::vector<unsigned char> salt;
    if (!readHeader(in, salt)) return false;

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(nonce))) {
        spdlog::error("Failed to read nonce");
        return false;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return false;
    }

    std::vector<unsigned char> plain(ciphertext.size() - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(), nonce, key.bytes().data()) != 0) {
        spdlog::error("Decryption failed (wrong passphrase or corrupted file)");
        return false;
    }

    std::string plain_str(reinterpret_cast<char*>(plain.data()), plain.size());
    sodium_memzero(plain.data(), plain.size());

    bool ok = Codec::deserialize(plain_str, snap);
    sodium_memzero(&plain_str[0], plain_str.size());
    if (!ok) return false;

    spdlog::info("Loaded {} sources, {} cards", snap.sources.size(), snap.cards.size());
    return true;
}

bool Storage::readSalt(const std::string& filename, std::vector<unsigned char>& salt) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) return false;
    return readHeader(in, salt);
}
