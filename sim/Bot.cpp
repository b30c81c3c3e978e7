#include "sim/Bot.hpp"

#include <cmath>

#include "core/Rng.hpp"
#include "sim/Sim.hpp"

void InitBot(Bot& bot, const BotStyle style, const uint32_t seed) {
    bot.style = style;
    bot.rng = core::NormalizeSeed(seed);
    bot.holding = false;
    bot.holdTicks = 0;
    bot.ticksSinceJump = 0;
}

// Returns true if a spike overlapping the player's vertical band starts
// within `lookAhead` px in front of the player.
static bool HazardAhead(const RunState& run, float lookAhead) {
    const Rect& p = run.player.rect;
    const float front = Right(p);
    for (const auto& h : run.world.hazards) {
        if (Right(h) <= p.x) continue;
        if (h.x > front + lookAhead) continue;
        if (h.y < Bottom(p) + 4.0f && Bottom(h) > p.y) return true;
    }
    return false;
}

// Returns true if the next platform in front is higher than the one the
// player stands on and starts within `lookAhead` px.
static bool StepUpAhead(const RunState& run, float lookAhead) {
    const Rect& p = run.player.rect;
    const float front = Right(p);
    for (const auto& s : run.world.platforms) {
        if (s.x <= front || s.x > front + lookAhead) continue;
        if (s.y < Bottom(p) - 8.0f) return true;
    }
    return false;
}

static TickInput Press(Bot& bot, int holdTicks) {
    TickInput in{};
    in.jumpPressed = true;
    in.jumpHeld = true;
    bot.holding = true;
    bot.holdTicks = holdTicks;
    bot.ticksSinceJump = 0;
    return in;
}

TickInput BotInput(Bot& bot, const RunState& run) {
    ++bot.ticksSinceJump;

    TickInput in{};
    if (!IsRunActive(run) || run.paused) return in;

    // Shared: release a held jump once its hold window runs out.
    if (bot.holding) {
        if (--bot.holdTicks <= 0) {
            bot.holding = false;
            in.jumpReleased = true;
        } else {
            in.jumpHeld = true;
        }
        return in;
    }

    const auto& player = run.player;
    // Look ahead by time, so reaction scales with scroll speed.
    const float lookNear = run.speed * 0.30f;
    const float lookLate = run.speed * 0.18f;

    switch (bot.style) {

    case BotStyle::Cautious: {
        if (player.grounded && HazardAhead(run, lookNear)) {
            return Press(bot, 60);
        }
        break;
    }

    case BotStyle::Aggressive: {
        if (player.grounded && HazardAhead(run, lookLate)) {
            return Press(bot, 48);
        }
        if (player.grounded && StepUpAhead(run, lookNear)) {
            return Press(bot, 40);
        }
        // Short hop now and then.
        if (player.grounded && bot.ticksSinceJump > 150) {
            return Press(bot, 6);
        }
        break;
    }

    case BotStyle::Random: {
        const float r1 = core::NextFloat01(bot.rng);
        const float r2 = core::NextFloat01(bot.rng);

        if (player.grounded && HazardAhead(run, lookNear)) {
            return Press(bot, 20 + static_cast<int>(r2 * 40.0f));
        }
        // Random press ~2%, including mid-air presses to exercise the buffer.
        if (r1 < 0.02f) {
            return Press(bot, 1 + static_cast<int>(r2 * 60.0f));
        }
        break;
    }

    }  // switch
    return in;
}
