#pragma once

#include <cstdint>

#include "sim/Player.hpp"

struct RunState;

// Bot behavior presets.
enum class BotStyle {
    Cautious,    // jumps early over spikes, always full height
    Aggressive,  // jumps late, hops up onto higher platforms, short-hops often
    Random,      // seeded random presses for stress testing
};

// Deterministic bot that generates input for one sim tick.
// No heap allocations, no raylib dependency.
// Uses its own RNG state so it never touches the run's generator stream.
struct Bot {
    BotStyle style = BotStyle::Cautious;
    uint32_t rng = 1u;
    bool holding = false;   // jump key currently held
    int holdTicks = 0;      // ticks left before releasing
    int ticksSinceJump = 0;
};

void InitBot(Bot& bot, BotStyle style, uint32_t seed);

// Returns the input edges for the current tick of `run`.
TickInput BotInput(Bot& bot, const RunState& run);
