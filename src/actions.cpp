#include "holdem/actions.hpp"

namespace holdem {

namespace {

ChipAmount amount_to_call(const BettingRoundState& state, const BettingRoundPlayerState& player) {
    return max_chips(state.bet_level - player.committed, ChipAmount());
}

std::string rejection_reason(const BettingRoundState& state,
                             const BettingRoundPlayerState& player,
                             PlayerActionType type) {
    ChipAmount to_call = amount_to_call(state, player);
    switch (type) {
        case PlayerActionType::Check:
            return "Cannot CHECK facing " + to_call.to_string() + " to call";
        case PlayerActionType::Call:
            return "Cannot CALL when there is no bet to call";
        case PlayerActionType::Bet:
            return "Cannot BET when the current bet is already " + state.bet_level.to_string();
        case PlayerActionType::Raise:
            if (state.bet_level.is_zero()) {
                return "Cannot RAISE when there is no bet to raise";
            }
            if (player.stack <= to_call) {
                return "Cannot RAISE: stack of " + player.stack.to_string() + " does not cover more than the call";
            }
            return "Cannot RAISE: betting has not been reopened for player " + player.id;
        case PlayerActionType::AllIn:
            return "Cannot go ALL_IN for more than the call: betting has not been reopened for player " + player.id;
        default:
            return std::string("Action ") + to_string(type) + " is not available";
    }
}

nlohmann::json legal_action_names(const AvailableActions& available) {
    nlohmann::json names = nlohmann::json::array();
    for (const auto& option : available.options) {
        names.push_back(to_string(option.type));
    }
    return names;
}

} // anonymous namespace

const char* to_string(PlayerActionType type) {
    switch (type) {
        case PlayerActionType::Fold: return "FOLD";
        case PlayerActionType::Check: return "CHECK";
        case PlayerActionType::Call: return "CALL";
        case PlayerActionType::Bet: return "BET";
        case PlayerActionType::Raise: return "RAISE";
        case PlayerActionType::AllIn: return "ALL_IN";
    }
    return "FOLD";
}

std::optional<ChipAmount> PlayerAction::amount() const {
    if (const auto* bet = std::get_if<action::Bet>(&kind)) {
        return bet->amount;
    }
    if (const auto* raise = std::get_if<action::Raise>(&kind)) {
        return raise->to;
    }
    return std::nullopt;
}

PlayerAction PlayerAction::fold(PlayerId player_id) {
    return PlayerAction{std::move(player_id), action::Fold{}};
}

PlayerAction PlayerAction::check(PlayerId player_id) {
    return PlayerAction{std::move(player_id), action::Check{}};
}

PlayerAction PlayerAction::call(PlayerId player_id) {
    return PlayerAction{std::move(player_id), action::Call{}};
}

PlayerAction PlayerAction::bet(PlayerId player_id, ChipAmount amount) {
    return PlayerAction{std::move(player_id), action::Bet{amount}};
}

PlayerAction PlayerAction::raise_to(PlayerId player_id, ChipAmount to) {
    return PlayerAction{std::move(player_id), action::Raise{to}};
}

PlayerAction PlayerAction::all_in(PlayerId player_id) {
    return PlayerAction{std::move(player_id), action::AllIn{}};
}

const ActionOption* AvailableActions::find(PlayerActionType type) const {
    for (const auto& option : options) {
        if (option.type == type) {
            return &option;
        }
    }
    return nullptr;
}

std::vector<PlayerActionType> AvailableActions::types() const {
    std::vector<PlayerActionType> result;
    result.reserve(options.size());
    for (const auto& option : options) {
        result.push_back(option.type);
    }
    return result;
}

AvailableActions get_available_actions(const BettingRoundState& state, const PlayerId& player_id) {
    AvailableActions available;
    const BettingRoundPlayerState* player = state.get_player(player_id);
    if (!player || !player->can_act() || state.is_complete()) {
        return available;
    }

    ChipAmount to_call = amount_to_call(state, *player);
    ChipAmount all_in_to = player->committed + player->stack;
    // Nobody has bet yet, or a full bet/raise reached this player since they last acted.
    bool betting_open = state.bet_level.is_zero() || player->may_raise;

    available.options.push_back({PlayerActionType::Fold, ChipAmount(), ChipAmount()});

    if (to_call.is_zero()) {
        available.options.push_back({PlayerActionType::Check, ChipAmount(), ChipAmount()});
    } else {
        ChipAmount call = min_chips(to_call, player->stack);
        available.options.push_back({PlayerActionType::Call, call, call});
    }

    if (state.bet_level.is_zero()) {
        available.options.push_back(
            {PlayerActionType::Bet, min_chips(state.min_bet, player->stack), player->stack});
    } else if (betting_open && player->stack > to_call) {
        available.options.push_back(
            {PlayerActionType::Raise, min_chips(state.min_raise_to(), all_in_to), all_in_to});
    }

    if (betting_open || player->stack <= to_call) {
        available.options.push_back({PlayerActionType::AllIn, player->stack, player->stack});
    }

    return available;
}

Result<ValidatedAction> validate_action(const BettingRoundState& state, const PlayerAction& proposed) {
    auto index = state.find_player(proposed.player_id);
    if (!index) {
        return make_error(ErrorCode::PlayerNotFound,
            "Player " + proposed.player_id + " not found in betting round",
            {{"player_id", proposed.player_id}});
    }
    if (state.is_complete()) {
        return make_error(ErrorCode::InvalidAction, "Betting round is already complete",
            {{"player_id", proposed.player_id}});
    }
    if (state.to_act != index) {
        const BettingRoundPlayerState* expected = state.player_to_act();
        return make_error(ErrorCode::NotPlayerTurn,
            "It is not player " + proposed.player_id + "'s turn to act",
            {{"player_id", proposed.player_id},
             {"to_act", expected ? nlohmann::json(expected->id) : nlohmann::json()}});
    }

    const BettingRoundPlayerState& player = state.players[*index];
    AvailableActions available = get_available_actions(state, proposed.player_id);
    const ActionOption* option = available.find(proposed.type());
    if (!option) {
        return make_error(ErrorCode::InvalidAction,
            rejection_reason(state, player, proposed.type()),
            {{"player_id", proposed.player_id},
             {"action", to_string(proposed.type())},
             {"legal_actions", legal_action_names(available)}});
    }

    ChipAmount moved;
    switch (proposed.type()) {
        case PlayerActionType::Fold:
        case PlayerActionType::Check:
            break;

        case PlayerActionType::Call:
            moved = option->min_amount;
            break;

        case PlayerActionType::Bet: {
            ChipAmount amount = std::get<action::Bet>(proposed.kind).amount;
            if (!amount.is_positive()) {
                return make_error(ErrorCode::InvalidBetAmount, "BET amount must be greater than 0",
                    {{"amount", amount.value()}});
            }
            if (amount < state.min_bet && amount != player.stack) {
                return make_error(ErrorCode::InvalidBetAmount,
                    "Bet of " + amount.to_string() + " is below the minimum bet of " + state.min_bet.to_string(),
                    {{"amount", amount.value()}, {"min_amount", state.min_bet.value()}});
            }
            if (amount > player.stack) {
                return make_error(ErrorCode::InsufficientStack,
                    "Cannot bet " + amount.to_string() + " with a stack of " + player.stack.to_string(),
                    {{"amount", amount.value()}, {"stack", player.stack.value()}});
            }
            moved = amount;
            break;
        }

        case PlayerActionType::Raise: {
            ChipAmount to = std::get<action::Raise>(proposed.kind).to;
            ChipAmount all_in_to = player.committed + player.stack;
            if (to <= state.bet_level) {
                return make_error(ErrorCode::InvalidRaiseAmount,
                    "Raise to " + to.to_string() + " does not exceed the current bet of " + state.bet_level.to_string(),
                    {{"to", to.value()}, {"bet_level", state.bet_level.value()}});
            }
            if (to < state.min_raise_to() && to != all_in_to) {
                return make_error(ErrorCode::InvalidRaiseAmount,
                    "Raise to " + to.to_string() + " is below the minimum raise to " + state.min_raise_to().to_string(),
                    {{"to", to.value()}, {"min_amount", state.min_raise_to().value()}});
            }
            if (to > all_in_to) {
                return make_error(ErrorCode::InsufficientStack,
                    "Cannot raise to " + to.to_string() + " with " + all_in_to.to_string() + " available",
                    {{"to", to.value()}, {"stack", player.stack.value()}, {"committed", player.committed.value()}});
            }
            moved = to - player.committed;
            break;
        }

        case PlayerActionType::AllIn:
            moved = player.stack;
            break;
    }

    PlayerActionType normalized = proposed.type();
    if (moved.is_positive() && moved == player.stack) {
        normalized = PlayerActionType::AllIn;
    }

    return ValidatedAction(proposed, normalized, moved, player.committed + moved);
}

} // namespace holdem
