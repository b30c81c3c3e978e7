#pragma once

#include <cstdint>

namespace core {
// Xorshift32 helpers. All state is owned by the caller so independent runs
// never share a stream.
uint32_t NextU32(uint32_t& state);
float NextFloat01(uint32_t& state);
float NextRange(uint32_t& state, float min, float max);
// Inclusive on both ends; collapses to min when max < min.
int NextInt(uint32_t& state, int min, int max);
uint32_t NormalizeSeed(uint32_t seed);
}  // namespace core
