// Encrypted data file: persistence through VaultRepository

#include "core/Errors.hpp"
#include "storage/Storage.hpp"
#include "storage/VaultRepository.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <sodium.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace testing_support;

class VaultStorageTest : public ::testing::Test {
protected:
  void SetUp() override {
    quietLogs();
    ASSERT_GE(sodium_init(), 0);
    path = (std::filesystem::temp_directory_path() / "retain_storage_test.dat").string();
    std::remove(path.c_str());
  }
  void TearDown() override { std::remove(path.c_str()); }

  static Changeset sourceWithCard() {
    Source s("Persist me", OriginKind::MANUAL);
    s.external_key = "key-1";
    s.created_at = kNow;
    s.setTags({"disk"});
    Changeset cs;
    cs.sources.push_back(s);
    Tag t;
    t.name = "disk";
    cs.tags.push_back(t);
    return cs;
  }

  std::string path;
};

TEST_F(VaultStorageTest, CommitsSurviveReopen) {
  std::int64_t sid = 0;
  {
    VaultRepository repo(path, "correct horse");
    Changeset cs = sourceWithCard();
    repo.commit(cs);
    sid = cs.sources[0].id;

    Card c("Q", "A");
    c.source_id = sid;
    c.status = CardStatus::ACTIVE;
    c.sched.next_review = kNow;
    Changeset cards;
    cards.cards.push_back(c);
    repo.commit(cards);
  }

  VaultRepository reopened(path, "correct horse");
  auto s = reopened.findSource(sid);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->text, "Persist me");
  EXPECT_EQ(s->external_key, std::optional<std::string>("key-1"));
  EXPECT_TRUE(s->hasTag("disk"));

  auto cards = reopened.cardsForSource(sid);
  ASSERT_EQ(cards.size(), 1u);
  EXPECT_EQ(cards[0].status, CardStatus::ACTIVE);
  EXPECT_EQ(cards[0].sched.next_review, std::optional<std::time_t>(kNow));
  EXPECT_EQ(reopened.tags().size(), 1u);
}

TEST_F(VaultStorageTest, WrongPassphraseIsRejected) {
  {
    VaultRepository repo(path, "right");
    Changeset cs = sourceWithCard();
    repo.commit(cs);
  }
  EXPECT_THROW((VaultRepository(path, "wrong")), StorageError);
}

TEST_F(VaultStorageTest, FileStartsWithMagicHeader) {
  {
    VaultRepository repo(path, "pw");
    Changeset cs = sourceWithCard();
    repo.commit(cs);
  }
  std::ifstream in(path, std::ios::binary);
  char hdr[8];
  in.read(hdr, sizeof(hdr));
  EXPECT_EQ(std::string(hdr, sizeof(hdr)), "RETAIN1\n");

  std::vector<unsigned char> salt;
  EXPECT_TRUE(Storage::readSalt(path, salt));
  EXPECT_EQ(salt.size(), VaultKey::saltSize());
}

TEST_F(VaultStorageTest, GarbageFileCannotBeOpened) {
  {
    std::ofstream out(path, std::ios::binary);
    out << "definitely not ours";
  }
  EXPECT_THROW((VaultRepository(path, "pw")), StorageError);
}

TEST_F(VaultStorageTest, RejectedCommitIsNotPersisted) {
  {
    VaultRepository repo(path, "pw");
    Changeset cs = sourceWithCard();
    repo.commit(cs);

    Changeset dup = sourceWithCard();
    EXPECT_THROW(repo.commit(dup), DuplicateExternalKey);
  }
  VaultRepository reopened(path, "pw");
  EXPECT_EQ(reopened.sources().size(), 1u);
}
