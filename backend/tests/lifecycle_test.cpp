// Lifecycle planning: every plan is checked against the transition tables
// and never touches its inputs.

#include "core/Errors.hpp"
#include "core/Lifecycle.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace testing_support;

class LifecycleTest : public ::testing::Test {
protected:
  void SetUp() override { quietLogs(); }

  static Source source(std::int64_t id, SourceStatus status) {
    Source s("Ownership moves values", OriginKind::MANUAL);
    s.id = id;
    s.status = status;
    s.setTags({"rust"});
    return s;
  }

  static Card linked(std::int64_t id, std::int64_t source_id, CardStatus status) {
    Card c("Q" + std::to_string(id), "A" + std::to_string(id));
    c.id = id;
    c.source_id = source_id;
    c.status = status;
    return c;
  }

  Scheduler sched;
  LifecycleController lifecycle{sched};
};

TEST_F(LifecycleTest, NewSourceIsPendingWithTrimmedText) {
  SourceInput in;
  in.text = "  Borrowing rules  ";
  in.tags = {"Rust", "rust", " "};
  auto cs = lifecycle.planNewSource(in, kNow);

  ASSERT_EQ(cs.sources.size(), 1u);
  EXPECT_EQ(cs.sources[0].text, "Borrowing rules");
  EXPECT_EQ(cs.sources[0].status, SourceStatus::PENDING_REVIEW);
  EXPECT_EQ(cs.sources[0].tags, std::vector<std::string>{"rust"});
  ASSERT_EQ(cs.tags.size(), 1u);
  EXPECT_EQ(cs.tags[0].name, "rust");
}

TEST_F(LifecycleTest, EmptySourceTextIsRejected) {
  SourceInput in;
  in.text = "   ";
  EXPECT_THROW(lifecycle.planNewSource(in, kNow), ValidationError);
}

TEST_F(LifecycleTest, GenerationSupersedesOldDrafts) {
  Source s = source(1, SourceStatus::CARDS_GENERATED);
  std::vector<Card> cards = {linked(10, 1, CardStatus::DRAFT), linked(11, 1, CardStatus::DRAFT)};

  CardDraft d;
  d.front = "What moves?";
  d.back = "Values";
  d.tags = {"memory"};
  auto cs = lifecycle.planGeneration(s, cards, {d}, kNow);

  EXPECT_EQ(cs.removed_cards, (std::vector<std::int64_t>{10, 11}));
  ASSERT_EQ(cs.cards.size(), 1u);
  const Card &c = cs.cards[0];
  EXPECT_EQ(c.id, 0);
  EXPECT_EQ(c.status, CardStatus::DRAFT);
  EXPECT_EQ(c.source_id, std::optional<std::int64_t>(1));
  EXPECT_TRUE(c.hasTag("memory"));
  EXPECT_TRUE(c.hasTag("rust")); // inherited from the source
  EXPECT_FALSE(c.sched.next_review.has_value());
  ASSERT_EQ(cs.sources.size(), 1u);
  EXPECT_EQ(cs.sources[0].status, SourceStatus::CARDS_GENERATED);
}

TEST_F(LifecycleTest, GenerationWithInvalidDraftPlansNothing) {
  Source s = source(1, SourceStatus::PENDING_REVIEW);
  CardDraft ok{"Q", "A", std::nullopt, {}};
  CardDraft bad{"Q2", "   ", std::nullopt, {}};
  EXPECT_THROW(lifecycle.planGeneration(s, {}, {ok, bad}, kNow), ValidationError);
}

TEST_F(LifecycleTest, ArchivedOrApprovedSourceCannotGenerate) {
  CardDraft d{"Q", "A", std::nullopt, {}};
  EXPECT_THROW(lifecycle.planGeneration(source(1, SourceStatus::ARCHIVED), {}, {d}, kNow),
               InvalidTransition);
  EXPECT_THROW(lifecycle.planGeneration(source(1, SourceStatus::APPROVED), {}, {d}, kNow),
               InvalidTransition);
}

TEST_F(LifecycleTest, ApprovalActivatesDraftsOnly) {
  Source s = source(1, SourceStatus::CARDS_GENERATED);
  Card suspended = linked(12, 1, CardStatus::SUSPENDED);
  auto cs = lifecycle.planApproval(
      s, {linked(10, 1, CardStatus::DRAFT), linked(11, 1, CardStatus::DRAFT), suspended}, kNow);

  ASSERT_EQ(cs.cards.size(), 2u);
  for (const auto &c : cs.cards) {
    EXPECT_EQ(c.status, CardStatus::ACTIVE);
    EXPECT_EQ(c.sched.next_review, std::optional<std::time_t>(kNow));
    EXPECT_EQ(c.sched.repetitions, 0);
    EXPECT_DOUBLE_EQ(c.sched.ease_factor, 2.5);
  }
  EXPECT_EQ(cs.sources[0].status, SourceStatus::APPROVED);
}

TEST_F(LifecycleTest, ApprovingTwiceIsRejected) {
  EXPECT_THROW(lifecycle.planApproval(source(1, SourceStatus::APPROVED), {}, kNow),
               InvalidTransition);
}

TEST_F(LifecycleTest, PendingSourceApprovesOnlyWithoutCards) {
  Source s = source(1, SourceStatus::PENDING_REVIEW);
  auto cs = lifecycle.planApproval(s, {}, kNow);
  EXPECT_TRUE(cs.cards.empty());
  EXPECT_EQ(cs.sources[0].status, SourceStatus::APPROVED);

  EXPECT_THROW(lifecycle.planApproval(s, {linked(3, 1, CardStatus::DRAFT)}, kNow),
               InvalidTransition);
}

TEST_F(LifecycleTest, ArchiveIsTerminal) {
  auto cs = lifecycle.planArchive(source(1, SourceStatus::APPROVED), kNow);
  EXPECT_EQ(cs.sources[0].status, SourceStatus::ARCHIVED);

  Source archived = source(1, SourceStatus::ARCHIVED);
  EXPECT_THROW(lifecycle.planArchive(archived, kNow), InvalidTransition);
  EXPECT_THROW(lifecycle.planApproval(archived, {}, kNow), InvalidTransition);
  EXPECT_THROW(lifecycle.planSourceStatus(archived, {}, SourceStatus::PENDING_REVIEW, kNow),
               InvalidTransition);
}

TEST_F(LifecycleTest, SourceStatusCannotBeSetToCardsGeneratedOrPending) {
  EXPECT_THROW(lifecycle.planSourceStatus(source(1, SourceStatus::PENDING_REVIEW), {},
                                          SourceStatus::CARDS_GENERATED, kNow),
               InvalidTransition);
  EXPECT_THROW(lifecycle.planSourceStatus(source(1, SourceStatus::CARDS_GENERATED), {},
                                          SourceStatus::PENDING_REVIEW, kNow),
               InvalidTransition);
}

TEST_F(LifecycleTest, CardStatusFollowsTable) {
  std::optional<Source> owner = source(1, SourceStatus::APPROVED);
  Card draft = linked(1, 1, CardStatus::DRAFT);
  EXPECT_THROW(lifecycle.planCardStatus(draft, owner, CardStatus::SUSPENDED, kNow),
               InvalidTransition);
  EXPECT_THROW(lifecycle.planCardStatus(draft, owner, CardStatus::MASTERED, kNow),
               InvalidTransition);

  auto activated = lifecycle.planCardStatus(draft, owner, CardStatus::ACTIVE, kNow).cards.at(0);
  EXPECT_EQ(activated.status, CardStatus::ACTIVE);
  EXPECT_EQ(activated.sched.next_review, std::optional<std::time_t>(kNow));

  auto suspended =
      lifecycle.planCardStatus(activated, owner, CardStatus::SUSPENDED, kNow + 5).cards.at(0);
  EXPECT_EQ(suspended.status, CardStatus::SUSPENDED);
  EXPECT_EQ(suspended.sched, activated.sched);

  Card mastered = linked(2, 1, CardStatus::MASTERED);
  EXPECT_THROW(lifecycle.planCardStatus(mastered, owner, CardStatus::ACTIVE, kNow),
               InvalidTransition);
}

TEST_F(LifecycleTest, ArchivedSourceKeepsItsDraftsInactive) {
  std::optional<Source> archived = source(1, SourceStatus::ARCHIVED);
  Card draft = linked(1, 1, CardStatus::DRAFT);
  EXPECT_THROW(lifecycle.planCardStatus(draft, archived, CardStatus::ACTIVE, kNow),
               InvalidTransition);

  CardInput in;
  in.front = "Q";
  in.back = "A";
  in.source_id = 1;
  EXPECT_THROW(lifecycle.planNewCard(in, archived, true, kNow), InvalidTransition);
  EXPECT_THROW(lifecycle.planNewCard(in, archived, false, kNow), InvalidTransition);

  // Cards already activated may still be suspended and resumed
  Card active = linked(2, 1, CardStatus::ACTIVE);
  auto suspended = lifecycle.planCardStatus(active, archived, CardStatus::SUSPENDED, kNow).cards.at(0);
  EXPECT_EQ(lifecycle.planCardStatus(suspended, archived, CardStatus::ACTIVE, kNow).cards.at(0).status,
            CardStatus::ACTIVE);
}

TEST_F(LifecycleTest, SourceEditChangesFieldsButNotStatus) {
  Source s = source(1, SourceStatus::CARDS_GENERATED);
  s.origin_title = "Old title";

  SourceEdit e;
  e.text = "  Borrowing moves nothing  ";
  e.origin_title = "";
  e.origin_url = "https://example.org/borrow";
  e.tags = std::vector<std::string>{"Rust", "Borrowing"};
  auto cs = lifecycle.planSourceEdit(s, e, kNow + 10);

  ASSERT_EQ(cs.sources.size(), 1u);
  const Source &next = cs.sources[0];
  EXPECT_EQ(next.text, "Borrowing moves nothing");
  EXPECT_FALSE(next.origin_title.has_value());
  EXPECT_EQ(next.origin_url, std::optional<std::string>("https://example.org/borrow"));
  EXPECT_EQ(next.tags, (std::vector<std::string>{"rust", "borrowing"}));
  EXPECT_EQ(next.status, SourceStatus::CARDS_GENERATED);
  EXPECT_EQ(next.updated_at, kNow + 10);
  EXPECT_EQ(cs.tags.size(), 2u);
  EXPECT_TRUE(cs.cards.empty());
}

TEST_F(LifecycleTest, SourceEditRejectsEmptyTextAndArchivedSource) {
  SourceEdit blank;
  blank.text = "   ";
  EXPECT_THROW(lifecycle.planSourceEdit(source(1, SourceStatus::APPROVED), blank, kNow),
               ValidationError);

  SourceEdit retitle;
  retitle.origin_title = "New";
  EXPECT_THROW(lifecycle.planSourceEdit(source(1, SourceStatus::ARCHIVED), retitle, kNow),
               InvalidTransition);
}

TEST_F(LifecycleTest, TagDeletionUntagsOnlyCarriers) {
  Tag tag;
  tag.id = 1;
  tag.name = "rust";

  Source tagged = source(1, SourceStatus::APPROVED);
  Card carrier = linked(5, 1, CardStatus::ACTIVE);
  carrier.setTags({"rust", "memory"});
  Card plain = linked(6, 1, CardStatus::ACTIVE);
  plain.setTags({"memory"});

  auto cs = lifecycle.planTagDeletion(tag, {tagged}, {carrier, plain}, kNow);
  ASSERT_EQ(cs.sources.size(), 1u);
  EXPECT_TRUE(cs.sources[0].tags.empty());
  ASSERT_EQ(cs.cards.size(), 1u);
  EXPECT_EQ(cs.cards[0].id, 5);
  EXPECT_EQ(cs.cards[0].tags, std::vector<std::string>{"memory"});
  EXPECT_EQ(cs.removed_tags, std::vector<std::string>{"rust"});
}

TEST_F(LifecycleTest, EditKeepsSchedulingState) {
  Card c = linked(1, 1, CardStatus::ACTIVE);
  c.sched.interval = 15;
  c.sched.repetitions = 3;
  c.sched.next_review = kNow + 15 * kDay;

  CardEdit e;
  e.front = "New question";
  e.tags = std::vector<std::string>{"Edited"};
  auto next = lifecycle.planCardEdit(c, e, kNow).cards.at(0);
  EXPECT_EQ(next.front, "New question");
  EXPECT_EQ(next.back, c.back);
  EXPECT_EQ(next.tags, std::vector<std::string>{"edited"});
  EXPECT_EQ(next.sched, c.sched);
  EXPECT_EQ(next.status, CardStatus::ACTIVE);

  CardEdit empty_back;
  empty_back.back = "";
  EXPECT_THROW(lifecycle.planCardEdit(c, empty_back, kNow), ValidationError);
}

TEST_F(LifecycleTest, OnlyDraftsCanBeDeleted) {
  auto cs = lifecycle.planCardDeletion(linked(4, 1, CardStatus::DRAFT));
  EXPECT_EQ(cs.removed_cards, std::vector<std::int64_t>{4});
  EXPECT_THROW(lifecycle.planCardDeletion(linked(5, 1, CardStatus::ACTIVE)), InvalidTransition);
}

TEST_F(LifecycleTest, ReviewRequiresActiveOrMasteredCard) {
  EXPECT_THROW(lifecycle.planReview(linked(1, 1, CardStatus::DRAFT), ReviewQuality::GOOD, kNow,
                                    std::nullopt),
               InvalidTransition);
  EXPECT_THROW(lifecycle.planReview(linked(1, 1, CardStatus::SUSPENDED), ReviewQuality::GOOD,
                                    kNow, std::nullopt),
               InvalidTransition);

  auto cs = lifecycle.planReview(linked(2, 1, CardStatus::MASTERED), ReviewQuality::GOOD, kNow,
                                 std::nullopt);
  ASSERT_EQ(cs.logs.size(), 1u);
  EXPECT_EQ(cs.cards.at(0).status, CardStatus::MASTERED);
  EXPECT_EQ(cs.cards.at(0).sched.repetitions, 1);
}

TEST_F(LifecycleTest, ManualCardActivatedImmediately) {
  CardInput in;
  in.front = "Q";
  in.back = "A";
  auto c = lifecycle.planNewCard(in, std::nullopt, true, kNow).cards.at(0);
  EXPECT_EQ(c.status, CardStatus::ACTIVE);
  EXPECT_FALSE(c.source_id.has_value());
  EXPECT_EQ(c.sched.next_review, std::optional<std::time_t>(kNow));

  auto d = lifecycle.planNewCard(in, std::nullopt, false, kNow).cards.at(0);
  EXPECT_EQ(d.status, CardStatus::DRAFT);
}
