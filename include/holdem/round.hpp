#pragma once

#include <optional>
#include <vector>
#include "actions.hpp"
#include "chips.hpp"
#include "errors.hpp"
#include "pot.hpp"
#include "round_state.hpp"

namespace holdem {

struct TableConfig;

/**
 * Per-street input from the table layer.
 */
struct RoundConfig {
    Street street = Street::Preflop;
    ChipAmount big_blind;
    // Smallest opening bet; the big blind when unset.
    std::optional<ChipAmount> min_bet;
    // Who acts first (left of the big blind preflop, left of the button after).
    PlayerId first_to_act;

    static RoundConfig from_table(const TableConfig& table, Street street, PlayerId first_to_act);
};

/**
 * Start one street of betting from seats in table order. Amounts already
 * posted count as committed; the bet level starts at the highest of them.
 */
Result<BettingRoundState> start_betting_round(const std::vector<PlayerSeat>& seats,
                                              const RoundConfig& config);

/**
 * Apply a validated action and return the next state. The action is checked
 * again against `state`, so a stale ValidatedAction is rejected rather than
 * applied. `state` itself is never modified.
 */
Result<BettingRoundState> apply_action_to_betting_round(const BettingRoundState& state,
                                                        const ValidatedAction& action);

/// validate_action followed by apply_action_to_betting_round.
Result<BettingRoundState> submit_action(const BettingRoundState& state, const PlayerAction& action);

bool is_betting_round_complete(const BettingRoundState& state);

struct PlayerRoundInfo {
    PlayerId id;
    ChipAmount stack;
    ChipAmount committed;
    bool has_folded = false;
    bool is_all_in = false;
    bool needs_to_act = false;
};

/**
 * Read-only projection of a round for display and driving logic.
 */
struct BettingRoundInfo {
    Street street = Street::Preflop;
    RoundStatus status = RoundStatus::AwaitingAction;
    ChipAmount pot_total;
    // Main pot first; empty until the round completes.
    std::vector<Pot> pots;
    ChipAmount current_bet;
    ChipAmount min_raise;
    ChipAmount min_raise_to;
    std::vector<PlayerRoundInfo> players;
    std::optional<PlayerId> to_act;
    std::vector<PlayerId> players_to_act;
    bool is_complete = false;
    bool decided_by_fold = false;
};

BettingRoundInfo get_betting_round_info(const BettingRoundState& state);

/**
 * Seats for the next street of a completed round: stacks kept, nothing
 * posted, this street's commitment moved into prior_contribution.
 */
Result<std::vector<PlayerSeat>> carry_over_seats(const BettingRoundState& state);

/// Credit payouts to seat stacks.
Result<std::vector<PlayerSeat>> apply_payouts(const std::vector<PlayerSeat>& seats,
                                              const std::vector<Payout>& payouts);

} // namespace holdem
