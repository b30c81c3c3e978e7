#include "core/Rng.hpp"

namespace core {
uint32_t NextU32(uint32_t& state) {
    // Xorshift32, deterministic from the explicit caller-provided seed/state.
    if (state == 0u) {
        state = 0xA341316Cu;
    }
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    return state;
}

float NextFloat01(uint32_t& state) {
    // 24 bits keep the result strictly below 1.0f.
    constexpr float inv24 = 1.0f / 16777216.0f;
    return static_cast<float>(NextU32(state) >> 8) * inv24;
}

float NextRange(uint32_t& state, const float min, const float max) {
    return min + (max - min) * NextFloat01(state);
}

int NextInt(uint32_t& state, const int min, const int max) {
    if (max <= min) {
        return min;
    }
    const uint32_t span = static_cast<uint32_t>(max - min) + 1u;
    return min + static_cast<int>(NextU32(state) % span);
}

uint32_t NormalizeSeed(const uint32_t seed) { return (seed == 0u) ? 1u : seed; }
}  // namespace core
