#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>

namespace holdem {

/**
 * Closed set of failure kinds. Callers branch on the code, never on the
 * message text.
 */
enum class ErrorCode {
    InvalidAction,
    InsufficientStack,
    InvalidState,
    PlayerNotFound,
    NotPlayerTurn,
    InvalidBetAmount,
    InvalidRaiseAmount,
    TableFull,
    TableEmpty,
    SeatOccupied,
    InvalidSeat,
    GameAlreadyStarted,
    GameNotStarted,
    InvalidCard,
    NotEnoughPlayers,
    InternalError
};

/**
 * Stable upper-snake name of a code, e.g. "NOT_PLAYER_TURN".
 */
const char* to_string(ErrorCode code);

/**
 * Inverse of to_string. Empty for names outside the closed set.
 */
std::optional<ErrorCode> parse_error_code(const std::string& name);

/**
 * Structured failure value: a code, a human readable message and optional
 * JSON details (null when absent).
 */
struct PokerError {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;
    nlohmann::json details;

    bool has_details() const { return !details.is_null(); }

    /**
     * Returns true for rejected player input that the caller should
     * re-prompt for. Round state is never changed by these.
     */
    bool is_validation_error() const;

    /**
     * Returns true when the error indicates misuse of the engine by the
     * caller rather than a player mistake.
     */
    bool is_caller_defect() const;
};

PokerError make_error(ErrorCode code, std::string message, nlohmann::json details = nullptr);

/**
 * Thrown only when a caller unwraps a failed Result with value().
 */
class PokerException : public std::runtime_error {
public:
    explicit PokerException(PokerError error)
        : std::runtime_error(std::string(to_string(error.code)) + ": " + error.message),
          error_(std::move(error)) {}

    const PokerError& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    PokerError error_;
};

/**
 * Either a value or a PokerError.
 *
 * Usage:
 *   Result<BettingRoundState> next = submit_action(state, action);
 *   if (!next) {
 *       reprompt(next.error());
 *   }
 */
template<typename T>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(PokerError error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return data_.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const& {
        if (!ok()) {
            throw PokerException(std::get<1>(data_));
        }
        return std::get<0>(data_);
    }

    T& value() & {
        if (!ok()) {
            throw PokerException(std::get<1>(data_));
        }
        return std::get<0>(data_);
    }

    T&& value() && {
        if (!ok()) {
            throw PokerException(std::get<1>(data_));
        }
        return std::get<0>(std::move(data_));
    }

    const PokerError& error() const {
        if (ok()) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return std::get<1>(data_);
    }

    T value_or(T fallback) const& {
        return ok() ? std::get<0>(data_) : std::move(fallback);
    }

    template<typename F>
    auto map(F&& fn) const& -> Result<std::decay_t<std::invoke_result_t<F, const T&>>> {
        if (!ok()) {
            return std::get<1>(data_);
        }
        return std::forward<F>(fn)(std::get<0>(data_));
    }

    template<typename F>
    auto and_then(F&& fn) const& -> std::invoke_result_t<F, const T&> {
        if (!ok()) {
            return std::get<1>(data_);
        }
        return std::forward<F>(fn)(std::get<0>(data_));
    }

private:
    std::variant<T, PokerError> data_;
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(PokerError error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    void value() const {
        if (error_) {
            throw PokerException(*error_);
        }
    }

    const PokerError& error() const {
        if (!error_) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return *error_;
    }

private:
    std::optional<PokerError> error_;
};

} // namespace holdem
