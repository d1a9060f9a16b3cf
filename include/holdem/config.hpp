#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include "chips.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace holdem {

constexpr int64_t DEFAULT_SMALL_BLIND = 10;
constexpr int64_t DEFAULT_BIG_BLIND = 20;

constexpr const char* ENV_SMALL_BLIND = "HOLDEM_SMALL_BLIND";
constexpr const char* ENV_BIG_BLIND = "HOLDEM_BIG_BLIND";
constexpr const char* ENV_MIN_BET = "HOLDEM_MIN_BET";
constexpr const char* ENV_RNG_SEED = "HOLDEM_RNG_SEED";
constexpr const char* ENV_LOG_LEVEL = "HOLDEM_LOG_LEVEL";

struct TableConfig {
    ChipAmount small_blind{DEFAULT_SMALL_BLIND};
    ChipAmount big_blind{DEFAULT_BIG_BLIND};
    ChipAmount min_bet{DEFAULT_BIG_BLIND};
    // Deterministic dealing when set.
    std::optional<uint32_t> rng_seed;
    LogLevel log_level = LogLevel::Info;
};

/// Returns the value for a variable name, or nullptr when unset.
using ConfigLookup = std::function<const char*(const char*)>;

/**
 * Build a TableConfig from HOLDEM_* environment variables, using defaults
 * for anything unset. HOLDEM_MIN_BET defaults to the big blind.
 */
Result<TableConfig> load_table_config();
Result<TableConfig> load_table_config(const ConfigLookup& lookup);

Result<void> validate_table_config(const TableConfig& config);

} // namespace holdem
