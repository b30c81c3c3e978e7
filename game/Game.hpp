#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "core/Config.hpp"
#include "game/Progress.hpp"
#include "sim/Sim.hpp"

enum class GameScreen {
    Playing,
    Paused,
    GameOver,
};

// Keyboard state latched between frames. Press/release edges stay queued
// until a sim tick consumes them, so a frame that runs zero ticks does not
// drop them and a frame that runs several ticks delivers them once.
struct InputState {
    bool jumpPressedQueued = false;
    bool jumpReleasedQueued = false;
    bool jumpHeld = false;
    bool restartSameQueued = false;
    bool restartNewQueued = false;
    bool cyclePaletteQueued = false;
};

// Floating "+1" text spawned at collected coins.
struct CoinPopup {
    bool active = false;
    float x = 0.0f;
    float y = 0.0f;
    float life = 0.0f;
};

constexpr int kCoinPopupPoolSize = 24;

struct Game {
    GameScreen screen = GameScreen::Playing;
    bool wantsExit = false;

    SimTuning tuning{};
    RunState run{};
    Progress progress{};
    InputState input{};

    // Previous-tick values for render interpolation.
    float previousCamX = 0.0f;
    float previousPlayerY = 0.0f;

    std::array<CoinPopup, kCoinPopupPoolSize> popups{};
    float deathFlashTimer = 0.0f;
    float landSquashTimer = 0.0f;
    bool newBest = false;

    int paletteIndex = 0;
    uint32_t runSeed = 1u;

    float accumulator = 0.0f;
    uint64_t simTicks = 0;

    // Screenshot notification
    float screenshotNotificationTimer = 0.0f;
    char screenshotPath[256] = {};
    bool screenshotRequested = false;
};

// Loads progress from `progressPath` and starts the first run. Returns false
// if the run could not be started.
bool InitGame(Game& game, const SimTuning& tuning, const char* progressPath,
              uint32_t seed);
bool ResetRun(Game& game, uint32_t seed);
void ReadInput(Game& game);
void ApplyMetaActions(Game& game);

// Runs one fixed sim tick with the queued input and reacts to its events.
void TickGame(Game& game, float dt);

// Cosmetic timers that run on frame time (popups, flashes, notifications).
void UpdatePresentation(Game& game, float frameTime);
