#pragma once

/**
 * Holdem betting engine
 *
 * Main include file - includes all public headers.
 */

// Chips and errors
#include "chips.hpp"
#include "errors.hpp"

// Ambient services
#include "logging.hpp"
#include "config.hpp"
#include "rng.hpp"

// Betting round
#include "round_state.hpp"
#include "actions.hpp"
#include "round.hpp"

// Pots and payouts
#include "pot.hpp"

// Event history
#include "history.hpp"
