#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "chips.hpp"
#include "errors.hpp"
#include "round_state.hpp"

namespace holdem {

enum class PlayerActionType {
    Fold,
    Check,
    Call,
    Bet,
    Raise,
    AllIn
};

const char* to_string(PlayerActionType type);

namespace action {

struct Fold {};
struct Check {};
struct Call {};

/// Opening bet; the amount is the total the player commits.
struct Bet {
    ChipAmount amount;
};

/// Raise to a new total commitment for the street.
struct Raise {
    ChipAmount to;
};

struct AllIn {};

} // namespace action

// Alternative order matches PlayerActionType.
using ActionKind = std::variant<action::Fold, action::Check, action::Call,
                                action::Bet, action::Raise, action::AllIn>;

struct PlayerAction {
    PlayerId player_id;
    ActionKind kind;

    PlayerActionType type() const { return static_cast<PlayerActionType>(kind.index()); }

    /// Bet size or raise-to total; empty for every other kind.
    std::optional<ChipAmount> amount() const;

    static PlayerAction fold(PlayerId player_id);
    static PlayerAction check(PlayerId player_id);
    static PlayerAction call(PlayerId player_id);
    static PlayerAction bet(PlayerId player_id, ChipAmount amount);
    static PlayerAction raise_to(PlayerId player_id, ChipAmount to);
    static PlayerAction all_in(PlayerId player_id);
};

/**
 * One legal choice with its bounds. BET and RAISE bounds are totals
 * committed for the street; CALL and ALL_IN bounds are the chips that leave
 * the stack; FOLD and CHECK bounds are zero.
 */
struct ActionOption {
    PlayerActionType type = PlayerActionType::Fold;
    ChipAmount min_amount;
    ChipAmount max_amount;
};

struct AvailableActions {
    std::vector<ActionOption> options;

    bool empty() const { return options.empty(); }
    bool can(PlayerActionType type) const { return find(type) != nullptr; }
    const ActionOption* find(PlayerActionType type) const;
    std::vector<PlayerActionType> types() const;
};

class ValidatedAction;

/**
 * Legal actions for a player, computed as if it were their turn. Empty when
 * the player is unknown, folded, all-in, out of chips, or the round is over.
 */
AvailableActions get_available_actions(const BettingRoundState& state, const PlayerId& player_id);

/**
 * Check a proposed action against the round and normalize it: CALL resolved
 * to the exact chips needed (clipped to the stack), and any action that
 * empties the stack reclassified as ALL_IN.
 */
Result<ValidatedAction> validate_action(const BettingRoundState& state, const PlayerAction& action);

/**
 * An action accepted by validate_action. Only validate_action creates these.
 */
class ValidatedAction {
public:
    const PlayerAction& request() const { return request_; }
    const PlayerId& player_id() const { return request_.player_id; }

    /// Normalized type; ALL_IN whenever the stack is emptied.
    PlayerActionType type() const { return type_; }

    /// Chips moved from the stack into the pot.
    ChipAmount amount() const { return amount_; }

    /// Player's street commitment once the action is applied.
    ChipAmount total_committed() const { return total_committed_; }

    bool is_all_in() const { return type_ == PlayerActionType::AllIn; }

private:
    friend Result<ValidatedAction> validate_action(const BettingRoundState&, const PlayerAction&);

    ValidatedAction(PlayerAction request, PlayerActionType type, ChipAmount amount,
                    ChipAmount total_committed)
        : request_(std::move(request)), type_(type), amount_(amount),
          total_committed_(total_committed) {}

    PlayerAction request_;
    PlayerActionType type_;
    ChipAmount amount_;
    ChipAmount total_committed_;
};

} // namespace holdem
