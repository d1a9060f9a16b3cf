#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "chips.hpp"
#include "errors.hpp"

namespace holdem {

using PlayerId = std::string;

/**
 * A main or side pot and the players who can win it, in table order.
 */
struct Pot {
    ChipAmount amount;
    std::vector<PlayerId> eligible_players;

    bool is_eligible(const PlayerId& player_id) const;
};

/**
 * What one player has put into the hand so far.
 */
struct PlayerContribution {
    PlayerId player_id;
    ChipAmount amount;
    bool has_folded = false;
    bool is_all_in = false;
};

struct Payout {
    PlayerId player_id;
    ChipAmount amount;
    std::size_t pot_index = 0;
};

/// Showdown order: best hand first, tied players grouped in one tier.
/// Within a tier, players are listed in the order odd chips are handed out.
using HandRanking = std::vector<std::vector<PlayerId>>;

/**
 * Partition contributions into a main pot and side pots.
 *
 * A tier is cut at every distinct all-in level of a live player and at the
 * highest live contribution. Folded chips count toward the tiers they reach
 * but folded players are never eligible. Consecutive tiers with the same
 * eligible players are merged.
 */
std::vector<Pot> construct_pots(const std::vector<PlayerContribution>& contributions);

ChipAmount pots_total(const std::vector<Pot>& pots);

/**
 * Split one pot among the best-ranked eligible players. Leftover chips go one
 * at a time to the earliest winners in tier order.
 */
Result<std::vector<Payout>> distribute_pot(const Pot& pot, std::size_t pot_index,
                                           const HandRanking& ranking);

Result<std::vector<Payout>> distribute_all_pots(const std::vector<Pot>& pots,
                                                const HandRanking& ranking);

/// Everyone else folded: the remaining player takes every pot.
std::vector<Payout> distribute_to_sole_winner(const std::vector<Pot>& pots,
                                              const PlayerId& winner);

} // namespace holdem
