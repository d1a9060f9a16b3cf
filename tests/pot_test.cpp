#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "holdem/pot.hpp"
#include "holdem/round.hpp"

using namespace holdem;

// =============================================================================
// Pot Construction Tests
// =============================================================================

class PotTest : public ::testing::Test {
protected:
    static PlayerContribution live(const std::string& id, int64_t amount) {
        return {id, chips(amount), false, false};
    }

    static PlayerContribution all_in(const std::string& id, int64_t amount) {
        return {id, chips(amount), false, true};
    }

    static PlayerContribution folded(const std::string& id, int64_t amount) {
        return {id, chips(amount), true, false};
    }

    static ChipAmount payout_for(const std::vector<Payout>& payouts, const std::string& id) {
        ChipAmount total;
        for (const auto& payout : payouts) {
            if (payout.player_id == id) {
                total += payout.amount;
            }
        }
        return total;
    }
};

TEST_F(PotTest, EqualContributions_ShouldFormSingleMainPot) {
    auto pots = construct_pots({live("alice", 60), live("bob", 60), folded("carol", 10)});

    ASSERT_EQ(pots.size(), 1u);
    EXPECT_EQ(pots[0].amount, chips(130));
    EXPECT_EQ(pots[0].eligible_players, (std::vector<PlayerId>{"alice", "bob"}));
}

TEST_F(PotTest, ShortAllIn_ShouldCutSidePotAtTheAllInLevel) {
    // Given a player all-in for 15 against a bet of 50
    auto pots = construct_pots({live("alice", 50), all_in("bob", 15)});

    // Then the main pot should stop at 15 per player
    ASSERT_EQ(pots.size(), 2u);
    EXPECT_EQ(pots[0].amount, chips(30));
    EXPECT_EQ(pots[0].eligible_players, (std::vector<PlayerId>{"alice", "bob"}));

    // And the rest should sit in a side pot only alice can win
    EXPECT_EQ(pots[1].amount, chips(35));
    EXPECT_EQ(pots[1].eligible_players, (std::vector<PlayerId>{"alice"}));
}

TEST_F(PotTest, SeveralAllIns_ShouldBuildOnePotPerLevel) {
    auto pots = construct_pots({
        all_in("alice", 100),
        all_in("bob", 250),
        live("carol", 400),
        live("dave", 400),
    });

    ASSERT_EQ(pots.size(), 3u);
    EXPECT_EQ(pots[0].amount, chips(400));
    EXPECT_EQ(pots[0].eligible_players.size(), 4u);
    EXPECT_EQ(pots[1].amount, chips(450));
    EXPECT_EQ(pots[1].eligible_players, (std::vector<PlayerId>{"bob", "carol", "dave"}));
    EXPECT_EQ(pots[2].amount, chips(300));
    EXPECT_EQ(pots[2].eligible_players, (std::vector<PlayerId>{"carol", "dave"}));
    EXPECT_EQ(pots_total(pots), chips(1150));
}

TEST_F(PotTest, FoldedChips_ShouldCountButNotBeEligible) {
    // Given a folded player who put in more than the short all-in
    auto pots = construct_pots({all_in("alice", 30), folded("bob", 80), live("carol", 100)});

    // Then bob's chips should be spread over the tiers they reached
    ASSERT_EQ(pots.size(), 2u);
    EXPECT_EQ(pots[0].amount, chips(90));
    EXPECT_EQ(pots[0].eligible_players, (std::vector<PlayerId>{"alice", "carol"}));
    EXPECT_EQ(pots[1].amount, chips(120));
    EXPECT_FALSE(pots[1].is_eligible("bob"));
}

TEST_F(PotTest, DeadChipsAboveLiveContributions_ShouldJoinTheLastPot) {
    auto pots = construct_pots({folded("alice", 200), live("bob", 100), live("carol", 100)});

    ASSERT_EQ(pots.size(), 1u);
    EXPECT_EQ(pots[0].amount, chips(400));
    EXPECT_EQ(pots[0].eligible_players, (std::vector<PlayerId>{"bob", "carol"}));
}

TEST_F(PotTest, MatchedAllIn_ShouldNotSplitThePot) {
    auto pots = construct_pots({all_in("alice", 100), live("bob", 100)});

    ASSERT_EQ(pots.size(), 1u);
    EXPECT_EQ(pots[0].amount, chips(200));
}

TEST_F(PotTest, NoContributions_ShouldProduceNoPots) {
    auto pots = construct_pots({live("alice", 0), live("bob", 0)});

    EXPECT_TRUE(pots.empty());
    EXPECT_EQ(pots_total(pots), chips(0));
}

// =============================================================================
// Pot Distribution Tests
// =============================================================================

TEST_F(PotTest, SingleWinner_ShouldTakeWholePot) {
    Pot pot{chips(300), {"alice", "bob", "carol"}};

    auto payouts = distribute_pot(pot, 0, {{"bob"}, {"alice"}, {"carol"}});

    ASSERT_TRUE(payouts.ok());
    ASSERT_EQ(payouts.value().size(), 1u);
    EXPECT_EQ(payouts.value()[0].player_id, "bob");
    EXPECT_EQ(payouts.value()[0].amount, chips(300));
}

TEST_F(PotTest, Tie_ShouldSplitWithOddChipsToEarliestWinners) {
    // Given three tied players and a pot that does not divide evenly
    Pot pot{chips(101), {"alice", "bob", "carol"}};

    // When the pot is distributed
    auto payouts = distribute_pot(pot, 2, {{"carol", "alice", "bob"}});

    // Then the odd chips should go to the earliest players of the tier
    ASSERT_TRUE(payouts.ok());
    const auto& result = payouts.value();
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0].player_id, "carol");
    EXPECT_EQ(result[0].amount, chips(34));
    EXPECT_EQ(result[1].player_id, "alice");
    EXPECT_EQ(result[1].amount, chips(34));
    EXPECT_EQ(result[2].player_id, "bob");
    EXPECT_EQ(result[2].amount, chips(33));
    EXPECT_EQ(result[2].pot_index, 2u);
}

TEST_F(PotTest, BestHandNotEligible_ShouldFallToNextTier) {
    // Given the best hand belongs to a player who is not in the side pot
    Pot side{chips(200), {"bob", "carol"}};

    auto payouts = distribute_pot(side, 1, {{"alice"}, {"carol"}, {"bob"}});

    ASSERT_TRUE(payouts.ok());
    ASSERT_EQ(payouts.value().size(), 1u);
    EXPECT_EQ(payouts.value()[0].player_id, "carol");
}

TEST_F(PotTest, NoEligibleWinner_ShouldBeInvalidState) {
    Pot pot{chips(50), {"alice"}};

    auto payouts = distribute_pot(pot, 0, {{"bob"}});

    ASSERT_FALSE(payouts.ok());
    EXPECT_EQ(payouts.error().code, ErrorCode::InvalidState);
}

TEST_F(PotTest, DistributeAllPots_ShouldPayEveryPotAndConserveChips) {
    auto pots = construct_pots({all_in("alice", 100), live("bob", 300), live("carol", 300)});

    auto payouts = distribute_all_pots(pots, {{"alice"}, {"bob", "carol"}});

    ASSERT_TRUE(payouts.ok());
    EXPECT_EQ(payout_for(payouts.value(), "alice"), chips(300));
    EXPECT_EQ(payout_for(payouts.value(), "bob"), chips(200));
    EXPECT_EQ(payout_for(payouts.value(), "carol"), chips(200));
}

TEST_F(PotTest, SoleWinner_ShouldCollectEveryPot) {
    std::vector<Pot> pots{{chips(30), {"alice", "bob"}}, {chips(35), {"alice"}}};

    auto payouts = distribute_to_sole_winner(pots, "alice");

    ASSERT_EQ(payouts.size(), 2u);
    EXPECT_EQ(payout_for(payouts, "alice"), chips(65));
    EXPECT_EQ(payouts[1].pot_index, 1u);
}

// =============================================================================
// Applying Payouts
// =============================================================================

TEST_F(PotTest, ApplyPayouts_ShouldCreditStacks) {
    std::vector<PlayerSeat> seats(2);
    seats[0].id = "alice";
    seats[0].stack = chips(940);
    seats[1].id = "bob";
    seats[1].stack = chips(0);

    auto updated = apply_payouts(seats, {{"bob", chips(130), 0}});

    ASSERT_TRUE(updated.ok());
    EXPECT_EQ(updated.value()[0].stack, chips(940));
    EXPECT_EQ(updated.value()[1].stack, chips(130));
}

TEST_F(PotTest, ApplyPayouts_UnknownPlayer_ShouldBePlayerNotFound) {
    std::vector<PlayerSeat> seats(1);
    seats[0].id = "alice";

    auto updated = apply_payouts(seats, {{"mallory", chips(10), 0}});

    ASSERT_FALSE(updated.ok());
    EXPECT_EQ(updated.error().code, ErrorCode::PlayerNotFound);
}

TEST_F(PotTest, ApplyPayouts_NegativeAmount_ShouldBeInvalidState) {
    std::vector<PlayerSeat> seats(1);
    seats[0].id = "alice";

    auto updated = apply_payouts(seats, {{"alice", chips(-10), 0}});

    ASSERT_FALSE(updated.ok());
    EXPECT_EQ(updated.error().code, ErrorCode::InvalidState);
}
