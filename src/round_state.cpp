#include "holdem/round_state.hpp"

namespace holdem {

const char* to_string(Street street) {
    switch (street) {
        case Street::Preflop: return "preflop";
        case Street::Flop: return "flop";
        case Street::Turn: return "turn";
        case Street::River: return "river";
    }
    return "preflop";
}

std::optional<std::size_t> BettingRoundState::find_player(const PlayerId& player_id) const {
    for (std::size_t i = 0; i < players.size(); ++i) {
        if (players[i].id == player_id) {
            return i;
        }
    }
    return std::nullopt;
}

const BettingRoundPlayerState* BettingRoundState::get_player(const PlayerId& player_id) const {
    auto index = find_player(player_id);
    return index ? &players[*index] : nullptr;
}

const BettingRoundPlayerState* BettingRoundState::player_to_act() const {
    if (!to_act || *to_act >= players.size()) {
        return nullptr;
    }
    return &players[*to_act];
}

std::size_t BettingRoundState::players_in_hand() const {
    std::size_t count = 0;
    for (const auto& player : players) {
        if (!player.has_folded) {
            ++count;
        }
    }
    return count;
}

std::size_t BettingRoundState::players_able_to_act() const {
    std::size_t count = 0;
    for (const auto& player : players) {
        if (player.can_act()) {
            ++count;
        }
    }
    return count;
}

bool BettingRoundState::anyone_needs_to_act() const {
    for (const auto& player : players) {
        if (player.needs_to_act && player.can_act()) {
            return true;
        }
    }
    return false;
}

ChipAmount BettingRoundState::committed_total() const {
    ChipAmount total;
    for (const auto& player : players) {
        total += player.committed;
    }
    return total;
}

ChipAmount BettingRoundState::pot_total() const {
    ChipAmount total;
    for (const auto& player : players) {
        total += player.total_contribution();
    }
    return total;
}

ChipAmount BettingRoundState::chip_total() const {
    ChipAmount total;
    for (const auto& player : players) {
        total += player.stack + player.committed;
    }
    return total;
}

ChipAmount BettingRoundState::min_raise_to() const {
    if (bet_level.is_zero()) {
        return min_bet;
    }
    return bet_level + last_raise_size;
}

bool BettingRoundState::is_complete() const {
    return players_in_hand() <= 1 || !anyone_needs_to_act();
}

} // namespace holdem
