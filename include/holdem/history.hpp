#pragma once

#include <cstddef>
#include <google/protobuf/message.h>
#include "holdem/events.pb.h"
#include "actions.hpp"
#include "errors.hpp"
#include "round.hpp"
#include "round_state.hpp"

namespace holdem {

/**
 * Append-only, in-memory record of one betting round. Each event is packed
 * into an Any on a sequenced page of a RoundEventBook.
 *
 * Usage:
 *   RoundHistory history;
 *   auto state = start_betting_round(seats, config);
 *   history.record_start(state.value(), config);
 *   auto next = history.submit(state.value(), PlayerAction::call("alice"));
 */
class RoundHistory {
public:
    /// Also records the completion when the round starts with nobody owing action.
    Result<void> record_start(const BettingRoundState& state, const RoundConfig& config);
    Result<void> record_action(const ValidatedAction& action, const BettingRoundState& after);
    Result<void> record_completion(const BettingRoundState& state);

    /**
     * Validate and apply an action, recording it (and the completion, if
     * this action ends the round) on success. Nothing is recorded for a
     * rejected action.
     */
    Result<BettingRoundState> submit(const BettingRoundState& state, const PlayerAction& action);

    const events::RoundEventBook& book() const { return book_; }
    std::size_t size() const { return static_cast<std::size_t>(book_.pages_size()); }

private:
    Result<void> append(const google::protobuf::Message& event);

    events::RoundEventBook book_;
};

events::ActionType to_proto(PlayerActionType type);
Result<PlayerActionType> from_proto(events::ActionType type);

events::Street to_proto(Street street);
Result<Street> from_proto(events::Street street);

/**
 * Rebuild the final state of a recorded round by starting it again and
 * re-submitting every recorded request, checking each recorded outcome.
 */
Result<BettingRoundState> replay_round(const events::RoundEventBook& book);

} // namespace holdem
