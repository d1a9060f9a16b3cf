#include "holdem/config.hpp"

#include <cstdlib>
#include <limits>
#include <string>

namespace holdem {

namespace {

Result<int64_t> parse_integer(const char* name, const std::string& text) {
    try {
        std::size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return make_error(ErrorCode::InvalidState,
                std::string(name) + " is not an integer: " + text, {{"variable", name}, {"value", text}});
        }
        return static_cast<int64_t>(value);
    } catch (const std::invalid_argument&) {
        return make_error(ErrorCode::InvalidState,
            std::string(name) + " is not an integer: " + text, {{"variable", name}, {"value", text}});
    } catch (const std::out_of_range&) {
        return make_error(ErrorCode::InvalidState,
            std::string(name) + " is out of range: " + text, {{"variable", name}, {"value", text}});
    }
}

} // anonymous namespace

Result<TableConfig> load_table_config() {
    return load_table_config([](const char* name) { return std::getenv(name); });
}

Result<TableConfig> load_table_config(const ConfigLookup& lookup) {
    TableConfig config;

    if (const char* value = lookup(ENV_SMALL_BLIND)) {
        auto parsed = parse_integer(ENV_SMALL_BLIND, value);
        if (!parsed) {
            return parsed.error();
        }
        config.small_blind = ChipAmount(parsed.value());
    }

    if (const char* value = lookup(ENV_BIG_BLIND)) {
        auto parsed = parse_integer(ENV_BIG_BLIND, value);
        if (!parsed) {
            return parsed.error();
        }
        config.big_blind = ChipAmount(parsed.value());
    }

    config.min_bet = config.big_blind;
    if (const char* value = lookup(ENV_MIN_BET)) {
        auto parsed = parse_integer(ENV_MIN_BET, value);
        if (!parsed) {
            return parsed.error();
        }
        config.min_bet = ChipAmount(parsed.value());
    }

    if (const char* value = lookup(ENV_RNG_SEED)) {
        auto parsed = parse_integer(ENV_RNG_SEED, value);
        if (!parsed) {
            return parsed.error();
        }
        if (parsed.value() < 0 || parsed.value() > std::numeric_limits<uint32_t>::max()) {
            return make_error(ErrorCode::InvalidState,
                std::string(ENV_RNG_SEED) + " must fit in 32 bits: " + value,
                {{"variable", ENV_RNG_SEED}, {"value", value}});
        }
        config.rng_seed = static_cast<uint32_t>(parsed.value());
    }

    if (const char* value = lookup(ENV_LOG_LEVEL)) {
        auto level = parse_log_level(value);
        if (!level) {
            return make_error(ErrorCode::InvalidState,
                std::string(ENV_LOG_LEVEL) + " is not a log level: " + value,
                {{"variable", ENV_LOG_LEVEL}, {"value", value}});
        }
        config.log_level = *level;
    }

    Result<void> valid = validate_table_config(config);
    if (!valid) {
        return valid.error();
    }
    return config;
}

Result<void> validate_table_config(const TableConfig& config) {
    if (!config.big_blind.is_positive()) {
        return make_error(ErrorCode::InvalidState, "Big blind must be positive",
            {{"big_blind", config.big_blind.value()}});
    }
    if (config.small_blind.is_negative()) {
        return make_error(ErrorCode::InvalidState, "Small blind must not be negative",
            {{"small_blind", config.small_blind.value()}});
    }
    if (config.small_blind > config.big_blind) {
        return make_error(ErrorCode::InvalidState, "Small blind must not exceed the big blind",
            {{"small_blind", config.small_blind.value()}, {"big_blind", config.big_blind.value()}});
    }
    if (!config.min_bet.is_positive()) {
        return make_error(ErrorCode::InvalidState, "Minimum bet must be at least one chip",
            {{"min_bet", config.min_bet.value()}});
    }
    return {};
}

} // namespace holdem
