#include "holdem/round.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include "holdem/config.hpp"
#include "holdem/logging.hpp"

namespace holdem {

namespace {

constexpr const char* LOG_DOMAIN = "betting";

/// Checked chip arithmetic throws; report it as a value at the boundary.
template<typename F>
auto guard_arithmetic(const char* operation, F&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::overflow_error& e) {
        log_error(LOG_DOMAIN, "chip_arithmetic_overflow", {{"operation", operation}, {"what", e.what()}});
        return make_error(ErrorCode::InternalError,
            std::string("Chip arithmetic overflow during ") + operation, {{"what", e.what()}});
    }
}

std::vector<PlayerContribution> collect_contributions(const BettingRoundState& state) {
    std::vector<PlayerContribution> contributions;
    contributions.reserve(state.players.size());
    for (const auto& player : state.players) {
        contributions.push_back({player.id, player.total_contribution(),
                                 player.has_folded, player.is_all_in});
    }
    return contributions;
}

nlohmann::json pots_to_json(const std::vector<Pot>& pots) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& pot : pots) {
        result.push_back({{"amount", pot.amount.value()}, {"eligible_players", pot.eligible_players}});
    }
    return result;
}

// Nobody is left to bet against: clear the action owed by a lone player who
// has already matched, or by everyone once a single player remains.
void settle_uncontested(BettingRoundState& state) {
    if (state.players_in_hand() <= 1) {
        for (auto& player : state.players) {
            player.needs_to_act = false;
        }
        return;
    }
    if (state.players_able_to_act() == 1) {
        for (auto& player : state.players) {
            if (player.can_act() && player.committed >= state.bet_level) {
                player.needs_to_act = false;
            }
        }
    }
}

void finish_round(BettingRoundState& state) {
    state.status = RoundStatus::Complete;
    state.to_act.reset();
    for (auto& player : state.players) {
        player.needs_to_act = false;
    }
    state.pots = construct_pots(collect_contributions(state));

    log_info(LOG_DOMAIN, "betting_round_completed",
        {{"street", to_string(state.street)},
         {"pot_total", state.pot_total().value()},
         {"pots", pots_to_json(state.pots)},
         {"decided_by_fold", state.players_in_hand() <= 1},
         {"actions", state.action_count}});
}

// Hand the turn to the next seat, in table order, that still owes action.
void advance_turn(BettingRoundState& state, std::size_t from, bool include_from) {
    if (state.is_complete()) {
        finish_round(state);
        return;
    }
    const std::size_t count = state.players.size();
    for (std::size_t offset = include_from ? 0 : 1; offset <= count; ++offset) {
        std::size_t candidate = (from + offset) % count;
        const auto& player = state.players[candidate];
        if (player.needs_to_act && player.can_act()) {
            state.to_act = candidate;
            return;
        }
    }
    finish_round(state);
}

} // anonymous namespace

RoundConfig RoundConfig::from_table(const TableConfig& table, Street street, PlayerId first_to_act) {
    RoundConfig config;
    config.street = street;
    config.big_blind = table.big_blind;
    config.min_bet = table.min_bet;
    config.first_to_act = std::move(first_to_act);
    return config;
}

Result<BettingRoundState> start_betting_round(const std::vector<PlayerSeat>& seats,
                                              const RoundConfig& config) {
    if (seats.size() < 2) {
        return make_error(ErrorCode::NotEnoughPlayers, "A betting round needs at least 2 players",
            {{"players", seats.size()}});
    }
    if (!config.big_blind.is_positive()) {
        return make_error(ErrorCode::InvalidState, "Big blind must be positive",
            {{"big_blind", config.big_blind.value()}});
    }
    ChipAmount min_bet = config.min_bet.value_or(config.big_blind);
    if (!min_bet.is_positive()) {
        return make_error(ErrorCode::InvalidState, "Minimum bet must be positive",
            {{"min_bet", min_bet.value()}});
    }

    return guard_arithmetic("start_betting_round", [&]() -> Result<BettingRoundState> {
        BettingRoundState state;
        state.street = config.street;
        state.big_blind = config.big_blind;
        state.min_bet = min_bet;
        state.last_raise_size = config.big_blind;

        std::set<PlayerId> seen;
        for (const auto& seat : seats) {
            if (seat.id.empty()) {
                return make_error(ErrorCode::InvalidState, "Player id must not be empty");
            }
            if (!seen.insert(seat.id).second) {
                return make_error(ErrorCode::InvalidState, "Duplicate player " + seat.id + " in betting round",
                    {{"player_id", seat.id}});
            }
            if (seat.stack.is_negative() || seat.posted.is_negative() || seat.prior_contribution.is_negative()) {
                return make_error(ErrorCode::InvalidState, "Player " + seat.id + " has a negative chip amount",
                    {{"player_id", seat.id},
                     {"stack", seat.stack.value()},
                     {"posted", seat.posted.value()},
                     {"prior_contribution", seat.prior_contribution.value()}});
            }

            BettingRoundPlayerState player;
            player.id = seat.id;
            player.stack = seat.stack;
            player.committed = seat.posted;
            player.prior_contribution = seat.prior_contribution;
            player.has_folded = seat.has_folded;
            player.is_all_in = !seat.has_folded && seat.stack.is_zero();
            player.needs_to_act = player.can_act();
            player.may_raise = true;
            state.bet_level = max_chips(state.bet_level, player.committed);
            state.players.push_back(std::move(player));
        }
        state.full_raise_level = state.bet_level;

        // Every later sum stays within the chips on the table.
        ChipAmount table_chips;
        for (const auto& player : state.players) {
            table_chips += player.stack;
            table_chips += player.total_contribution();
        }

        auto first = state.find_player(config.first_to_act);
        if (!first) {
            return make_error(ErrorCode::PlayerNotFound,
                "First player to act " + config.first_to_act + " not found in betting round",
                {{"player_id", config.first_to_act}});
        }

        log_info(LOG_DOMAIN, "betting_round_started",
            {{"street", to_string(state.street)},
             {"players", state.players.size()},
             {"bet_level", state.bet_level.value()},
             {"pot_total", state.pot_total().value()},
             {"first_to_act", config.first_to_act}});

        settle_uncontested(state);
        advance_turn(state, *first, true);
        return state;
    });
}

Result<BettingRoundState> apply_action_to_betting_round(const BettingRoundState& state,
                                                        const ValidatedAction& validated) {
    if (state.is_complete()) {
        return make_error(ErrorCode::InvalidAction, "Cannot apply an action to a completed betting round",
            {{"player_id", validated.player_id()}});
    }
    auto index = state.find_player(validated.player_id());
    if (!index) {
        return make_error(ErrorCode::PlayerNotFound,
            "Player " + validated.player_id() + " not found in betting round",
            {{"player_id", validated.player_id()}});
    }
    if (state.to_act != index) {
        return make_error(ErrorCode::InvalidAction,
            "Player " + validated.player_id() + " is not the player to act",
            {{"player_id", validated.player_id()}});
    }

    return guard_arithmetic("apply_action", [&]() -> Result<BettingRoundState> {
        // The action may have been validated against another state.
        Result<ValidatedAction> revalidated = validate_action(state, validated.request());
        if (!revalidated) {
            return revalidated.error();
        }
        const ValidatedAction& action = revalidated.value();

        BettingRoundState next = state;
        BettingRoundPlayerState& player = next.players[*index];
        const ChipAmount previous_level = next.bet_level;

        if (action.type() == PlayerActionType::Fold) {
            player.has_folded = true;
        } else if (action.amount().is_positive()) {
            player.stack -= action.amount();
            player.committed += action.amount();
            if (player.stack.is_zero()) {
                player.is_all_in = true;
            }
        }
        player.has_acted = true;
        player.needs_to_act = false;
        player.may_raise = false;

        if (player.committed > previous_level) {
            ChipAmount required = previous_level.is_zero() ? next.min_bet : next.last_raise_size;
            bool full_raise = player.committed - next.full_raise_level >= required;
            if (full_raise) {
                next.last_raise_size = max_chips(next.last_raise_size, player.committed - previous_level);
                next.full_raise_level = player.committed;
            }
            next.bet_level = player.committed;

            for (std::size_t i = 0; i < next.players.size(); ++i) {
                auto& other = next.players[i];
                if (i == *index || !other.can_act()) {
                    continue;
                }
                if (full_raise) {
                    other.needs_to_act = true;
                    other.may_raise = true;
                } else if (other.committed < next.bet_level) {
                    // Short all-in: owed a call, but betting is not reopened.
                    other.needs_to_act = true;
                }
            }
        }
        next.action_count += 1;

        log_debug(LOG_DOMAIN, "action_applied",
            {{"player_id", action.player_id()},
             {"requested", to_string(action.request().type())},
             {"action", to_string(action.type())},
             {"amount", action.amount().value()},
             {"stack", player.stack.value()},
             {"committed", player.committed.value()},
             {"bet_level", next.bet_level.value()}});

        settle_uncontested(next);
        advance_turn(next, *index, false);
        return next;
    });
}

Result<BettingRoundState> submit_action(const BettingRoundState& state, const PlayerAction& action) {
    Result<ValidatedAction> validated = guard_arithmetic("validate_action", [&]() -> Result<ValidatedAction> {
        return validate_action(state, action);
    });
    if (!validated) {
        log_warn(LOG_DOMAIN, "action_rejected",
            {{"player_id", action.player_id},
             {"action", to_string(action.type())},
             {"code", to_string(validated.error().code)},
             {"reason", validated.error().message}});
        return validated.error();
    }
    return apply_action_to_betting_round(state, validated.value());
}

bool is_betting_round_complete(const BettingRoundState& state) {
    return state.is_complete();
}

BettingRoundInfo get_betting_round_info(const BettingRoundState& state) {
    BettingRoundInfo info;
    info.street = state.street;
    info.status = state.status;
    info.pot_total = state.pot_total();
    info.pots = state.pots;
    info.current_bet = state.bet_level;
    info.min_raise = state.bet_level.is_zero() ? state.min_bet : state.last_raise_size;
    info.min_raise_to = state.min_raise_to();
    info.is_complete = state.is_complete();
    info.decided_by_fold = state.players_in_hand() <= 1;

    for (const auto& player : state.players) {
        bool owed = !info.is_complete && player.needs_to_act && player.can_act();
        info.players.push_back({player.id, player.stack, player.committed,
                                player.has_folded, player.is_all_in, owed});
        if (owed) {
            info.players_to_act.push_back(player.id);
        }
    }
    if (!info.is_complete) {
        if (const auto* player = state.player_to_act()) {
            info.to_act = player->id;
        }
    }
    return info;
}

Result<std::vector<PlayerSeat>> carry_over_seats(const BettingRoundState& state) {
    if (!state.is_complete()) {
        return make_error(ErrorCode::InvalidState, "Betting round is still awaiting action",
            {{"street", to_string(state.street)}});
    }
    return guard_arithmetic("carry_over_seats", [&]() -> Result<std::vector<PlayerSeat>> {
        std::vector<PlayerSeat> seats;
        seats.reserve(state.players.size());
        for (const auto& player : state.players) {
            PlayerSeat seat;
            seat.id = player.id;
            seat.stack = player.stack;
            seat.prior_contribution = player.total_contribution();
            seat.has_folded = player.has_folded;
            seats.push_back(std::move(seat));
        }
        return seats;
    });
}

Result<std::vector<PlayerSeat>> apply_payouts(const std::vector<PlayerSeat>& seats,
                                              const std::vector<Payout>& payouts) {
    return guard_arithmetic("apply_payouts", [&]() -> Result<std::vector<PlayerSeat>> {
        std::vector<PlayerSeat> result = seats;
        for (const auto& payout : payouts) {
            if (payout.amount.is_negative()) {
                return make_error(ErrorCode::InvalidState, "Payout amount must not be negative",
                    {{"player_id", payout.player_id}, {"amount", payout.amount.value()}});
            }
            auto it = std::find_if(result.begin(), result.end(),
                [&](const PlayerSeat& seat) { return seat.id == payout.player_id; });
            if (it == result.end()) {
                return make_error(ErrorCode::PlayerNotFound, "Player " + payout.player_id + " not found",
                    {{"player_id", payout.player_id}});
            }
            it->stack += payout.amount;
        }
        return result;
    });
}

} // namespace holdem
