#pragma once
#include <mutex>
#include <string>
#include "MemoryRepository.hpp"
#include "VaultKey.hpp"

// MemoryRepository whose every commit is persisted to the encrypted data
// file. A commit that cannot be written is rolled back in memory too.
class VaultRepository : public Repository {
public:
    // Opens filename (creating it on first save). Throws StorageError when
    // the passphrase does not open an existing file.
    VaultRepository(const std::string& filename, const std::string& passphrase);

    std::optional<Source> findSource(std::int64_t id) const override { return memory.findSource(id); }
    std::optional<Source> findSourceByExternalKey(OriginKind origin, const std::string& key) const override {
        return memory.findSourceByExternalKey(origin, key);
    }
    std::vector<Source> sources() const override { return memory.sources(); }

    std::optional<Card> findCard(std::int64_t id) const override { return memory.findCard(id); }
    std::vector<Card> cards() const override { return memory.cards(); }
    std::vector<Card> cardsForSource(std::int64_t source_id) const override { return memory.cardsForSource(source_id); }

    std::vector<ReviewLog> logsForCard(std::int64_t card_id) const override { return memory.logsForCard(card_id); }

    std::vector<Tag> tags() const override { return memory.tags(); }
    std::optional<Tag> findTag(const std::string& name) const override { return memory.findTag(name); }

    void commit(Changeset& changes) override;

    const std::string& path() const { return filename; }

private:
    std::string filename;
    VaultKey key;
    MemoryRepository memory;
    std::mutex write_mtx;
};
