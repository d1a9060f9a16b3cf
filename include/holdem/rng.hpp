#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include "config.hpp"
#include "errors.hpp"

namespace holdem {

/**
 * Source of uniform integers for dealing and shuffling. The betting engine
 * itself never draws from it.
 */
class Rng {
public:
    virtual ~Rng() = default;

    /**
     * Uniform integer in [0, max_exclusive). Fails with INVALID_STATE when
     * max_exclusive <= 0.
     */
    virtual Result<int64_t> next_int(int64_t max_exclusive) = 0;
};

/**
 * Deterministic Mulberry32 generator: the same seed yields the same sequence.
 * Bounds above 2^32 combine two 32-bit draws and reject the biased tail.
 */
class SeededRng : public Rng {
public:
    explicit SeededRng(uint32_t seed) : state_(seed) {}

    Result<int64_t> next_int(int64_t max_exclusive) override;

private:
    uint32_t next_u32();

    uint32_t state_;
};

/**
 * Non-deterministic generator seeded from std::random_device.
 */
class SystemRng : public Rng {
public:
    SystemRng();

    Result<int64_t> next_int(int64_t max_exclusive) override;

private:
    std::mt19937_64 engine_;
};

/// SeededRng when the config carries a seed, SystemRng otherwise.
std::unique_ptr<Rng> create_rng(const TableConfig& config);

} // namespace holdem
