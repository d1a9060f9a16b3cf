#include "holdem/errors.hpp"

#include <array>

namespace holdem {

namespace {

constexpr std::array<std::pair<ErrorCode, const char*>, 16> ERROR_NAMES = {{
    {ErrorCode::InvalidAction, "INVALID_ACTION"},
    {ErrorCode::InsufficientStack, "INSUFFICIENT_STACK"},
    {ErrorCode::InvalidState, "INVALID_STATE"},
    {ErrorCode::PlayerNotFound, "PLAYER_NOT_FOUND"},
    {ErrorCode::NotPlayerTurn, "NOT_PLAYER_TURN"},
    {ErrorCode::InvalidBetAmount, "INVALID_BET_AMOUNT"},
    {ErrorCode::InvalidRaiseAmount, "INVALID_RAISE_AMOUNT"},
    {ErrorCode::TableFull, "TABLE_FULL"},
    {ErrorCode::TableEmpty, "TABLE_EMPTY"},
    {ErrorCode::SeatOccupied, "SEAT_OCCUPIED"},
    {ErrorCode::InvalidSeat, "INVALID_SEAT"},
    {ErrorCode::GameAlreadyStarted, "GAME_ALREADY_STARTED"},
    {ErrorCode::GameNotStarted, "GAME_NOT_STARTED"},
    {ErrorCode::InvalidCard, "INVALID_CARD"},
    {ErrorCode::NotEnoughPlayers, "NOT_ENOUGH_PLAYERS"},
    {ErrorCode::InternalError, "INTERNAL_ERROR"},
}};

} // anonymous namespace

const char* to_string(ErrorCode code) {
    for (const auto& [candidate, name] : ERROR_NAMES) {
        if (candidate == code) {
            return name;
        }
    }
    return "INTERNAL_ERROR";
}

std::optional<ErrorCode> parse_error_code(const std::string& name) {
    for (const auto& [code, candidate] : ERROR_NAMES) {
        if (name == candidate) {
            return code;
        }
    }
    return std::nullopt;
}

bool PokerError::is_validation_error() const {
    switch (code) {
        case ErrorCode::NotPlayerTurn:
        case ErrorCode::InvalidAction:
        case ErrorCode::InvalidBetAmount:
        case ErrorCode::InvalidRaiseAmount:
        case ErrorCode::InsufficientStack:
        case ErrorCode::PlayerNotFound:
            return true;
        default:
            return false;
    }
}

bool PokerError::is_caller_defect() const {
    return code == ErrorCode::InvalidState || code == ErrorCode::InternalError;
}

PokerError make_error(ErrorCode code, std::string message, nlohmann::json details) {
    PokerError error;
    error.code = code;
    error.message = std::move(message);
    error.details = std::move(details);
    return error;
}

} // namespace holdem
