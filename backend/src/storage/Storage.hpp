#pragma once
#include <vector>
#include <string>
#include "Snapshot.hpp"
#include "VaultKey.hpp"

// Storage handles the encrypted data file.
//
// Layout:
//   Header: 8 bytes ASCII "RETAIN1\n" (magic + version)
//   Salt:   crypto_pwhash_SALTBYTES (for re-deriving the key from the passphrase)
//   Nonce:  crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes (secretbox of the JSON snapshot)
//
// save/load require a derived key. All functions log and return false on failure.

class Storage {
public:
    static bool save(const Snapshot& snap, const std::string& filename, const VaultKey& key);

    // A missing file loads as an empty snapshot and returns true.
    static bool load(Snapshot& snap, const std::string& filename, const VaultKey& key);

    // Salt stored in an existing file; false if the file is missing or not ours.
    static bool readSalt(const std::string& filename, std::vector<unsigned char>& salt);
};
