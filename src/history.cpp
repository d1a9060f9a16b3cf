#include "holdem/history.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "holdem/logging.hpp"

namespace holdem {

namespace {

constexpr const char* LOG_DOMAIN = "history";
constexpr const char* TYPE_URL_PREFIX = "type.googleapis.com/";

google::protobuf::Timestamp now() {
    auto time_point = std::chrono::system_clock::now();
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

void fill_seat(events::SeatSnapshot* snapshot, const BettingRoundPlayerState& player) {
    snapshot->set_player_id(player.id);
    snapshot->set_stack(player.stack.value());
    snapshot->set_committed(player.committed.value());
    snapshot->set_prior_contribution(player.prior_contribution.value());
    snapshot->set_has_folded(player.has_folded);
    snapshot->set_is_all_in(player.is_all_in);
}

PlayerAction rebuild_action(const std::string& player_id, PlayerActionType type, ChipAmount amount) {
    switch (type) {
        case PlayerActionType::Fold: return PlayerAction::fold(player_id);
        case PlayerActionType::Check: return PlayerAction::check(player_id);
        case PlayerActionType::Call: return PlayerAction::call(player_id);
        case PlayerActionType::Bet: return PlayerAction::bet(player_id, amount);
        case PlayerActionType::Raise: return PlayerAction::raise_to(player_id, amount);
        case PlayerActionType::AllIn: return PlayerAction::all_in(player_id);
    }
    return PlayerAction::fold(player_id);
}

PokerError divergence(uint32_t sequence, const std::string& field, int64_t recorded, int64_t replayed) {
    return make_error(ErrorCode::InternalError,
        "History diverged at sequence " + std::to_string(sequence) + ": " + field,
        {{"sequence", sequence}, {"field", field}, {"recorded", recorded}, {"replayed", replayed}});
}

Result<void> verify_action(uint32_t sequence, const events::ActionTaken& taken,
                           const ValidatedAction& action, const BettingRoundState& after) {
    Result<PlayerActionType> recorded_type = from_proto(taken.action());
    if (!recorded_type) {
        return recorded_type.error();
    }
    if (recorded_type.value() != action.type()) {
        return divergence(sequence, "action", static_cast<int64_t>(recorded_type.value()),
                          static_cast<int64_t>(action.type()));
    }
    if (taken.chips_moved() != action.amount().value()) {
        return divergence(sequence, "chips_moved", taken.chips_moved(), action.amount().value());
    }

    const BettingRoundPlayerState* player = after.get_player(action.player_id());
    if (!player) {
        return make_error(ErrorCode::InternalError,
            "Player " + action.player_id() + " missing from replayed round at sequence " + std::to_string(sequence),
            {{"sequence", sequence}, {"player_id", action.player_id()}});
    }
    if (taken.player_stack() != player->stack.value()) {
        return divergence(sequence, "player_stack", taken.player_stack(), player->stack.value());
    }
    if (taken.player_committed() != player->committed.value()) {
        return divergence(sequence, "player_committed", taken.player_committed(), player->committed.value());
    }
    if (taken.bet_level() != after.bet_level.value()) {
        return divergence(sequence, "bet_level", taken.bet_level(), after.bet_level.value());
    }
    if (taken.pot_total() != after.pot_total().value()) {
        return divergence(sequence, "pot_total", taken.pot_total(), after.pot_total().value());
    }
    return {};
}

Result<void> verify_completion(uint32_t sequence, const events::BettingRoundCompleted& completed,
                               const BettingRoundState& state) {
    if (!state.is_complete()) {
        return make_error(ErrorCode::InternalError,
            "History records completion at sequence " + std::to_string(sequence) +
            " but the replayed round still awaits action",
            {{"sequence", sequence}});
    }
    if (completed.pot_total() != state.pot_total().value()) {
        return divergence(sequence, "pot_total", completed.pot_total(), state.pot_total().value());
    }
    if (static_cast<std::size_t>(completed.pots_size()) != state.pots.size()) {
        return divergence(sequence, "pots", completed.pots_size(), static_cast<int64_t>(state.pots.size()));
    }
    for (int i = 0; i < completed.pots_size(); ++i) {
        const auto& replayed = state.pots[static_cast<std::size_t>(i)];
        if (completed.pots(i).amount() != replayed.amount.value()) {
            return divergence(sequence, "pots[" + std::to_string(i) + "].amount",
                              completed.pots(i).amount(), replayed.amount.value());
        }
    }
    return {};
}

} // anonymous namespace

events::ActionType to_proto(PlayerActionType type) {
    switch (type) {
        case PlayerActionType::Fold: return events::FOLD;
        case PlayerActionType::Check: return events::CHECK;
        case PlayerActionType::Call: return events::CALL;
        case PlayerActionType::Bet: return events::BET;
        case PlayerActionType::Raise: return events::RAISE;
        case PlayerActionType::AllIn: return events::ALL_IN;
    }
    return events::ACTION_TYPE_UNSPECIFIED;
}

Result<PlayerActionType> from_proto(events::ActionType type) {
    switch (type) {
        case events::FOLD: return PlayerActionType::Fold;
        case events::CHECK: return PlayerActionType::Check;
        case events::CALL: return PlayerActionType::Call;
        case events::BET: return PlayerActionType::Bet;
        case events::RAISE: return PlayerActionType::Raise;
        case events::ALL_IN: return PlayerActionType::AllIn;
        default:
            return make_error(ErrorCode::InvalidState, "Unknown recorded action type",
                {{"action_type", static_cast<int>(type)}});
    }
}

events::Street to_proto(Street street) {
    switch (street) {
        case Street::Preflop: return events::PREFLOP;
        case Street::Flop: return events::FLOP;
        case Street::Turn: return events::TURN;
        case Street::River: return events::RIVER;
    }
    return events::STREET_UNSPECIFIED;
}

Result<Street> from_proto(events::Street street) {
    switch (street) {
        case events::PREFLOP: return Street::Preflop;
        case events::FLOP: return Street::Flop;
        case events::TURN: return Street::Turn;
        case events::RIVER: return Street::River;
        default:
            return make_error(ErrorCode::InvalidState, "Unknown recorded street",
                {{"street", static_cast<int>(street)}});
    }
}

Result<void> RoundHistory::append(const google::protobuf::Message& event) {
    events::RoundEventPage page;
    page.set_sequence(static_cast<uint32_t>(book_.pages_size()) + 1);
    if (!page.mutable_event()->PackFrom(event, TYPE_URL_PREFIX)) {
        log_error(LOG_DOMAIN, "event_pack_failed", {{"type", event.GetTypeName()}});
        return make_error(ErrorCode::InternalError, "Failed to pack " + event.GetTypeName(),
            {{"type", event.GetTypeName()}});
    }
    *book_.add_pages() = std::move(page);
    return {};
}

Result<void> RoundHistory::record_start(const BettingRoundState& state, const RoundConfig& config) {
    events::BettingRoundStarted event;
    event.set_street(to_proto(state.street));
    for (const auto& player : state.players) {
        fill_seat(event.add_players(), player);
    }
    event.set_big_blind(state.big_blind.value());
    event.set_min_bet(state.min_bet.value());
    event.set_first_to_act(config.first_to_act);
    event.set_bet_level(state.bet_level.value());
    *event.mutable_started_at() = now();

    Result<void> appended = append(event);
    if (!appended || !state.is_complete()) {
        return appended;
    }
    // Nobody owed action: the round is already settled.
    return record_completion(state);
}

Result<void> RoundHistory::record_action(const ValidatedAction& action, const BettingRoundState& after) {
    events::ActionTaken event;
    event.set_player_id(action.player_id());
    event.set_requested(to_proto(action.request().type()));
    event.set_requested_amount(action.request().amount().value_or(ChipAmount()).value());
    event.set_action(to_proto(action.type()));
    event.set_chips_moved(action.amount().value());
    if (const auto* player = after.get_player(action.player_id())) {
        event.set_player_stack(player->stack.value());
        event.set_player_committed(player->committed.value());
    }
    event.set_bet_level(after.bet_level.value());
    event.set_pot_total(after.pot_total().value());
    *event.mutable_action_at() = now();
    return append(event);
}

Result<void> RoundHistory::record_completion(const BettingRoundState& state) {
    events::BettingRoundCompleted event;
    for (const auto& pot : state.pots) {
        auto* summary = event.add_pots();
        summary->set_amount(pot.amount.value());
        for (const auto& player_id : pot.eligible_players) {
            summary->add_eligible_players(player_id);
        }
    }
    event.set_pot_total(state.pot_total().value());
    for (const auto& player : state.players) {
        fill_seat(event.add_players(), player);
    }
    event.set_decided_by_fold(state.players_in_hand() <= 1);
    *event.mutable_completed_at() = now();
    return append(event);
}

Result<BettingRoundState> RoundHistory::submit(const BettingRoundState& state, const PlayerAction& action) {
    Result<ValidatedAction> validated = validate_action(state, action);
    if (!validated) {
        log_warn(LOG_DOMAIN, "action_rejected",
            {{"player_id", action.player_id},
             {"action", to_string(action.type())},
             {"code", to_string(validated.error().code)}});
        return validated.error();
    }

    Result<BettingRoundState> next = apply_action_to_betting_round(state, validated.value());
    if (!next) {
        return next;
    }

    Result<void> recorded = record_action(validated.value(), next.value());
    if (!recorded) {
        return recorded.error();
    }
    if (next.value().is_complete()) {
        recorded = record_completion(next.value());
        if (!recorded) {
            return recorded.error();
        }
    }
    return next;
}

Result<BettingRoundState> replay_round(const events::RoundEventBook& book) {
    if (book.pages_size() == 0) {
        return make_error(ErrorCode::InvalidState, "Cannot replay an empty event book");
    }

    const auto& first = book.pages(0).event();
    events::BettingRoundStarted started;
    if (!first.Is<events::BettingRoundStarted>() || !first.UnpackTo(&started)) {
        return make_error(ErrorCode::InvalidState, "Event book must begin with BettingRoundStarted",
            {{"type_url", first.type_url()}});
    }

    Result<Street> street = from_proto(started.street());
    if (!street) {
        return street.error();
    }

    std::vector<PlayerSeat> seats;
    for (const auto& snapshot : started.players()) {
        PlayerSeat seat;
        seat.id = snapshot.player_id();
        seat.stack = ChipAmount(snapshot.stack());
        seat.posted = ChipAmount(snapshot.committed());
        seat.prior_contribution = ChipAmount(snapshot.prior_contribution());
        seat.has_folded = snapshot.has_folded();
        seats.push_back(std::move(seat));
    }

    RoundConfig config;
    config.street = street.value();
    config.big_blind = ChipAmount(started.big_blind());
    config.min_bet = ChipAmount(started.min_bet());
    config.first_to_act = started.first_to_act();

    Result<BettingRoundState> start = start_betting_round(seats, config);
    if (!start) {
        return start;
    }
    BettingRoundState current = std::move(start).value();

    for (int i = 1; i < book.pages_size(); ++i) {
        const auto& page = book.pages(i);
        const auto& event = page.event();

        if (event.Is<events::ActionTaken>()) {
            events::ActionTaken taken;
            if (!event.UnpackTo(&taken)) {
                return make_error(ErrorCode::InvalidState, "Malformed ActionTaken event",
                    {{"sequence", page.sequence()}});
            }
            Result<PlayerActionType> requested = from_proto(taken.requested());
            if (!requested) {
                return requested.error();
            }
            PlayerAction action = rebuild_action(taken.player_id(), requested.value(),
                                                 ChipAmount(taken.requested_amount()));

            Result<ValidatedAction> validated = validate_action(current, action);
            if (!validated) {
                return make_error(ErrorCode::InternalError,
                    "Recorded action at sequence " + std::to_string(page.sequence()) +
                    " was rejected on replay: " + validated.error().message,
                    {{"sequence", page.sequence()}, {"code", to_string(validated.error().code)}});
            }
            Result<BettingRoundState> next = apply_action_to_betting_round(current, validated.value());
            if (!next) {
                return next;
            }
            Result<void> verified = verify_action(page.sequence(), taken, validated.value(), next.value());
            if (!verified) {
                return verified.error();
            }
            current = std::move(next).value();
        } else if (event.Is<events::BettingRoundCompleted>()) {
            events::BettingRoundCompleted completed;
            if (!event.UnpackTo(&completed)) {
                return make_error(ErrorCode::InvalidState, "Malformed BettingRoundCompleted event",
                    {{"sequence", page.sequence()}});
            }
            Result<void> verified = verify_completion(page.sequence(), completed, current);
            if (!verified) {
                return verified.error();
            }
        } else {
            return make_error(ErrorCode::InvalidState, "Unknown event type in round history",
                {{"sequence", page.sequence()}, {"type_url", event.type_url()}});
        }
    }

    log_debug(LOG_DOMAIN, "round_replayed",
        {{"events", book.pages_size()}, {"complete", current.is_complete()}});
    return current;
}

} // namespace holdem
