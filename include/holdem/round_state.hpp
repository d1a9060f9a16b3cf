#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "chips.hpp"
#include "pot.hpp"

namespace holdem {

enum class Street {
    Preflop,
    Flop,
    Turn,
    River
};

const char* to_string(Street street);

enum class RoundStatus {
    AwaitingAction,
    Complete
};

/**
 * A player as handed to the betting round by the table layer.
 */
struct PlayerSeat {
    PlayerId id;
    ChipAmount stack;               // chips behind, after anything posted
    ChipAmount posted;              // blinds/antes already committed this street
    ChipAmount prior_contribution;  // chips put in on earlier streets
    bool has_folded = false;
};

struct BettingRoundPlayerState {
    PlayerId id;
    ChipAmount stack;
    ChipAmount committed;
    ChipAmount prior_contribution;
    bool has_folded = false;
    bool is_all_in = false;
    bool has_acted = false;
    bool needs_to_act = false;
    // Cleared once the player acts; set again only by a full bet or raise.
    bool may_raise = true;

    bool can_act() const { return !has_folded && !is_all_in && stack.is_positive(); }
    ChipAmount total_contribution() const { return prior_contribution + committed; }
};

/**
 * One street of betting. Players are kept in action order. Values of this
 * type are never shared between tables and are replaced, not mutated, by
 * the round functions.
 */
struct BettingRoundState {
    Street street = Street::Preflop;
    std::vector<BettingRoundPlayerState> players;
    std::optional<std::size_t> to_act;
    RoundStatus status = RoundStatus::AwaitingAction;

    ChipAmount big_blind;
    ChipAmount min_bet;
    ChipAmount bet_level;
    // Size of the last full bet or raise; the minimum legal raise increment.
    ChipAmount last_raise_size;
    // Bet level set by the last full bet or raise (or by the posted blinds).
    ChipAmount full_raise_level;

    // Finalized when the round completes; empty before.
    std::vector<Pot> pots;
    uint32_t action_count = 0;

    std::optional<std::size_t> find_player(const PlayerId& player_id) const;
    const BettingRoundPlayerState* get_player(const PlayerId& player_id) const;
    const BettingRoundPlayerState* player_to_act() const;

    std::size_t players_in_hand() const;
    std::size_t players_able_to_act() const;
    bool anyone_needs_to_act() const;

    ChipAmount committed_total() const;
    ChipAmount pot_total() const;
    // Stacks plus everything committed this street; constant across a round.
    ChipAmount chip_total() const;
    ChipAmount min_raise_to() const;

    bool is_complete() const;
};

} // namespace holdem
