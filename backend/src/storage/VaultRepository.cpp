#include "VaultRepository.hpp"
#include "Storage.hpp"
#include "../core/Errors.hpp"
#include <spdlog/spdlog.h>

VaultRepository::VaultRepository(const std::string& file, const std::string& passphrase)
    : filename(file)
{
    std::vector<unsigned char> salt;
    if (!Storage::readSalt(filename, salt)) {
        spdlog::info("No readable data file at '{}'; starting a new one", filename);
        salt = VaultKey::randomSalt();
    }

    if (!key.derive(passphrase, salt)) {
        throw StorageError("could not derive the data file key");
    }

    Snapshot snap;
    if (!Storage::load(snap, filename, key)) {
        throw StorageError("could not open '" + filename + "' (wrong passphrase or corrupted file)");
    }
    memory.restore(snap);
}

void VaultRepository::commit(Changeset& changes) {
    std::lock_guard<std::mutex> lock(write_mtx);

    Snapshot before = memory.snapshot();
    memory.commit(changes);

    if (!Storage::save(memory.snapshot(), filename, key)) {
        memory.restore(before);
        throw StorageError("could not write '" + filename + "'; change rolled back");
    }
}
