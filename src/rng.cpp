#include "holdem/rng.hpp"

#include <cmath>
#include <limits>

namespace holdem {

namespace {

PokerError bound_error(int64_t max_exclusive) {
    return make_error(ErrorCode::InvalidState, "max_exclusive must be greater than 0",
        {{"max_exclusive", max_exclusive}});
}

} // anonymous namespace

uint32_t SeededRng::next_u32() {
    state_ += 0x6D2B79F5u;
    uint32_t t = state_;
    t = (t ^ (t >> 15)) * (t | 1u);
    t ^= t + (t ^ (t >> 7)) * (t | 61u);
    t ^= t >> 14;
    return t;
}

Result<int64_t> SeededRng::next_int(int64_t max_exclusive) {
    if (max_exclusive <= 0) {
        return bound_error(max_exclusive);
    }

    const auto bound = static_cast<uint64_t>(max_exclusive);
    if (bound <= (uint64_t{1} << 32)) {
        double unit = static_cast<double>(next_u32()) / 4294967296.0;
        return static_cast<int64_t>(std::floor(unit * static_cast<double>(max_exclusive)));
    }

    const uint64_t max = std::numeric_limits<uint64_t>::max();
    const uint64_t limit = max - max % bound;
    uint64_t draw = 0;
    do {
        uint64_t high = next_u32();
        uint64_t low = next_u32();
        draw = (high << 32) | low;
    } while (draw >= limit);
    return static_cast<int64_t>(draw % bound);
}

SystemRng::SystemRng() {
    std::random_device device;
    std::seed_seq seed{device(), device(), device(), device()};
    engine_.seed(seed);
}

Result<int64_t> SystemRng::next_int(int64_t max_exclusive) {
    if (max_exclusive <= 0) {
        return bound_error(max_exclusive);
    }
    std::uniform_int_distribution<int64_t> distribution(0, max_exclusive - 1);
    return distribution(engine_);
}

std::unique_ptr<Rng> create_rng(const TableConfig& config) {
    if (config.rng_seed) {
        return std::make_unique<SeededRng>(*config.rng_seed);
    }
    return std::make_unique<SystemRng>();
}

} // namespace holdem
