#include <gtest/gtest.h>

#include "crypto/keypair.h"
#include "crypto/threshold.h"
#include "polls/clock.h"
#include "polls/config.h"
#include "polls/lifecycle.h"
#include "polls/poll.h"
#include "polls/status.h"
#include "polls/tally_store.h"
#include "polls/voter_ledger.h"

#include <set>
#include <string>

using namespace polls;

// ============================================================================
// Phase Tests
// ============================================================================

TEST(PhaseTest, BeforeStartIsPending) {
    EXPECT_EQ(phase_of(99, 100, 200, false), Phase::Pending);
}

TEST(PhaseTest, StartTimeIsInclusive) {
    EXPECT_EQ(phase_of(100, 100, 200, false), Phase::Active);
    EXPECT_EQ(phase_of(199, 100, 200, false), Phase::Active);
}

TEST(PhaseTest, EndTimeIsExclusive) {
    EXPECT_EQ(phase_of(200, 100, 200, false), Phase::Ended);
    EXPECT_EQ(phase_of(5000, 100, 200, false), Phase::Ended);
}

TEST(PhaseTest, FinalizedWinsOverTime) {
    EXPECT_EQ(phase_of(50, 100, 200, true), Phase::Finalized);
    EXPECT_EQ(phase_of(150, 100, 200, true), Phase::Finalized);
    EXPECT_EQ(phase_of(250, 100, 200, true), Phase::Finalized);
}

TEST(PhaseTest, PhaseNames) {
    EXPECT_STREQ(phase_to_string(Phase::Pending), "Pending");
    EXPECT_STREQ(phase_to_string(Phase::Active), "Active");
    EXPECT_STREQ(phase_to_string(Phase::Ended), "Ended");
    EXPECT_STREQ(phase_to_string(Phase::Finalized), "Finalized");
}

// ============================================================================
// Clock Tests
// ============================================================================

TEST(ClockTest, SystemClockNeverRunsBackwards) {
    SystemClock clock;
    Timestamp previous = clock.now();
    EXPECT_GT(previous, 0);

    for (int i = 0; i < 1000; ++i) {
        Timestamp current = clock.now();
        EXPECT_GE(current, previous);
        previous = current;
    }
}

TEST(ClockTest, ManualClockMovesOnlyWhenTold) {
    ManualClock clock(100);
    EXPECT_EQ(clock.now(), 100);
    EXPECT_EQ(clock.now(), 100);

    clock.advance(50);
    EXPECT_EQ(clock.now(), 150);

    clock.set(10);
    EXPECT_EQ(clock.now(), 10);
}

// ============================================================================
// Status Tests
// ============================================================================

TEST(StatusTest, EveryFailureHasItsOwnMessage) {
    std::vector<Status> failures = {
        Status::InvalidTitle, Status::InvalidOptionCount, Status::InvalidOptionLabel,
        Status::InvalidWindow, Status::InvalidOption, Status::InvalidBallot,
        Status::PollNotFound, Status::VotingNotOpen, Status::VotingStillOpen,
        Status::AlreadyFinalized, Status::FinalizationAlreadyPending, Status::AlreadyVoted,
        Status::Unauthorized, Status::UnknownRequest, Status::ResultShapeMismatch,
        Status::OracleUnavailable, Status::ResultsNotAvailable
    };

    std::set<std::string> messages;
    for (auto status : failures) {
        messages.insert(status_to_string(status));
    }
    EXPECT_EQ(messages.size(), failures.size());
    EXPECT_STREQ(status_to_string(Status::PollNotFound), "Poll does not exist");
}

TEST(StatusTest, ResultCarriesValueOrStatus) {
    Result<int> good = 42;
    EXPECT_TRUE(good.ok());
    EXPECT_EQ(*good, 42);

    Result<int> bad = Status::PollNotFound;
    EXPECT_FALSE(bad.ok());
    EXPECT_EQ(bad.status(), Status::PollNotFound);
    EXPECT_THROW((void)bad.value(), std::bad_optional_access);
}

// ============================================================================
// Builder Tests
// ============================================================================

TEST(PollParamsBuilderTest, AssemblesParams) {
    auto params = PollParamsBuilder()
        .set_title("Lunch")
        .add_option("Pizza")
        .add_option("Sushi")
        .set_window(10, 20)
        .build();

    EXPECT_EQ(params.title, "Lunch");
    EXPECT_EQ(params.options, (std::vector<std::string>{"Pizza", "Sushi"}));
    EXPECT_EQ(params.start_time, 10);
    EXPECT_EQ(params.end_time, 20);
}

TEST(PollParamsBuilderTest, DurationStartsNow) {
    auto params = PollParamsBuilder().set_duration(3600, 1000).build();
    EXPECT_EQ(params.start_time, 1000);
    EXPECT_EQ(params.end_time, 4600);
}

TEST(PollParamsBuilderTest, SetOptionsReplaces) {
    auto params = PollParamsBuilder()
        .add_option("Old")
        .set_options({"A", "B", "C"})
        .build();
    EXPECT_EQ(params.options.size(), 3u);
    EXPECT_EQ(params.options[0], "A");
}

// ============================================================================
// Poll Record Tests
// ============================================================================

class PollRecordTest : public ::testing::Test {
protected:
    void SetUp() override {
        crypto::init();
        keys_ = std::make_unique<crypto::ThresholdKeys>(crypto::deal_threshold_keys(1, 1));
        creator_ = crypto::Keypair::generate().public_key();
        poll_ = std::make_unique<Poll>(0, "Favorite Color",
                                       std::vector<std::string>{"Red", "Blue", "Green"},
                                       1000, 2000, creator_, keys_->public_key);
    }

    std::unique_ptr<crypto::ThresholdKeys> keys_;
    Identity creator_{};
    std::unique_ptr<Poll> poll_;
};

TEST_F(PollRecordTest, StartsEmpty) {
    auto info = poll_->info();
    EXPECT_EQ(info.title, "Favorite Color");
    EXPECT_EQ(info.options.size(), 3u);
    EXPECT_EQ(info.creator, creator_);
    EXPECT_FALSE(info.finalized);
    EXPECT_FALSE(info.decryption_pending);
    EXPECT_EQ(info.total_voters, 0u);
    EXPECT_EQ(poll_->tally().size(), 3u);
}

TEST_F(PollRecordTest, StatsWhileActive) {
    auto stats = poll_->stats(1500);
    EXPECT_TRUE(stats.is_active);
    EXPECT_EQ(stats.time_remaining, 500);

    stats = poll_->stats(2000);
    EXPECT_FALSE(stats.is_active);
    EXPECT_EQ(stats.time_remaining, 0);
}

TEST_F(PollRecordTest, DecryptionLifecycle) {
    oracle::RequestId request{};
    request[0] = 1;

    poll_->begin_decryption(request);
    EXPECT_TRUE(poll_->decryption_pending());
    EXPECT_EQ(poll_->phase(2500), Phase::Ended);

    poll_->finalize_with_results({1, 2, 3});
    EXPECT_TRUE(poll_->finalized());
    EXPECT_FALSE(poll_->decryption_pending());
    ASSERT_TRUE(poll_->results().has_value());
    EXPECT_EQ(*poll_->results(), (std::vector<uint64_t>{1, 2, 3}));
    EXPECT_EQ(poll_->phase(2500), Phase::Finalized);
}

TEST_F(PollRecordTest, ForceFinalizeDropsPendingRequest) {
    oracle::RequestId request{};
    poll_->begin_decryption(request);

    poll_->force_finalize();
    EXPECT_TRUE(poll_->finalized());
    EXPECT_FALSE(poll_->decryption_pending());
    EXPECT_FALSE(poll_->results().has_value());
}

TEST_F(PollRecordTest, TallyRejectsOutOfRangeOption) {
    auto ballot = crypto::Ciphertext::encrypt_unit(keys_->public_key);
    EXPECT_FALSE(poll_->tally().add_ballot(3, ballot));

    auto before = poll_->tally().ciphertexts()[1];
    EXPECT_TRUE(poll_->tally().add_ballot(1, ballot));
    EXPECT_NE(poll_->tally().ciphertexts()[1], before);
}

TEST(VoterLedgerTest, RecordsEachIdentityOnce) {
    crypto::init();
    VoterLedger ledger;
    auto alice = crypto::Keypair::generate().public_key();
    auto bob = crypto::Keypair::generate().public_key();

    EXPECT_TRUE(ledger.record(alice));
    EXPECT_FALSE(ledger.record(alice));
    EXPECT_TRUE(ledger.record(bob));

    EXPECT_TRUE(ledger.contains(alice));
    EXPECT_EQ(ledger.size(), 2u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
