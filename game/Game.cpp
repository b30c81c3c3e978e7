#include "game/Game.hpp"

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "core/Rng.hpp"

#include <ctime>
#include <raylib.h>

namespace cfg {
KeyConfig keys{};
} // namespace cfg

namespace {

constexpr float kCoinPopupLife = 0.6f;
constexpr float kDeathFlashTime = 0.35f;
constexpr float kLandSquashTime = 0.12f;

void SpawnCoinPopup(Game &game, const Rect &coin) {
  for (auto &p : game.popups) {
    if (p.active)
      continue;
    p.active = true;
    p.x = CenterX(coin);
    p.y = coin.y;
    p.life = kCoinPopupLife;
    return;
  }
}

void HandleSimEvents(Game &game, const std::vector<SimEvent> &events) {
  for (const auto &ev : events) {
    switch (ev.type) {
    case SimEventType::Jumped:
      break;
    case SimEventType::Landed:
      game.landSquashTimer = kLandSquashTime;
      break;
    case SimEventType::CoinCollected:
      SpawnCoinPopup(game, ev.rect);
      break;
    case SimEventType::Died:
      game.deathFlashTimer = kDeathFlashTime;
      game.newBest = ev.finalScore > game.progress.bestScore;
      if (!RecordRunResult(game.progress, ev.payout, ev.finalScore)) {
        LOG_WARN("Run result kept in memory only (save failed)");
      }
      game.screen = GameScreen::GameOver;
      break;
    }
  }
}

} // namespace

bool InitGame(Game &game, const SimTuning &tuning, const char *progressPath,
              const uint32_t seed) {
  game.tuning = tuning;
  game.progress = LoadProgress(progressPath);
  game.paletteIndex = 0;
  return ResetRun(game, seed);
}

bool ResetRun(Game &game, const uint32_t seed) {
  game.runSeed = core::NormalizeSeed(seed);
  if (!StartRunWithUpgrades(game.run, game.tuning, game.progress.upgrades,
                            game.runSeed)) {
    return false;
  }

  game.previousCamX = game.run.camX;
  game.previousPlayerY = game.run.player.rect.y;
  game.input = {}; // Clear any buffered inputs
  game.accumulator = 0.0f;
  game.deathFlashTimer = 0.0f;
  game.landSquashTimer = 0.0f;
  game.newBest = false;
  for (auto &p : game.popups)
    p.active = false;

  game.screen = GameScreen::Playing;
  return true;
}

void ReadInput(Game &game) {
  const auto &k = cfg::keys;

  if (game.screen == GameScreen::Playing) {
    if (IsKeyPressed(k.jump) || IsKeyPressed(k.jumpAlt) ||
        IsKeyPressed(k.jumpAlt2))
      game.input.jumpPressedQueued = true;
    if (IsKeyReleased(k.jump) || IsKeyReleased(k.jumpAlt) ||
        IsKeyReleased(k.jumpAlt2))
      game.input.jumpReleasedQueued = true;
    game.input.jumpHeld =
        IsKeyDown(k.jump) || IsKeyDown(k.jumpAlt) || IsKeyDown(k.jumpAlt2);

    if (IsKeyPressed(k.pause) || IsKeyPressed(k.back)) {
      game.screen = GameScreen::Paused;
      game.run.paused = true;
    }
    if (IsKeyPressed(k.restart))
      game.input.restartSameQueued = true;
  } else if (game.screen == GameScreen::Paused) {
    if (IsKeyPressed(k.pause) || IsKeyPressed(k.back)) {
      game.screen = GameScreen::Playing;
      game.run.paused = false;
      // A key released while paused must not cut the next jump.
      game.input.jumpPressedQueued = false;
      game.input.jumpReleasedQueued = false;
    }
    if (IsKeyPressed(k.restart))
      game.input.restartSameQueued = true;
  } else if (game.screen == GameScreen::GameOver) {
    if (IsKeyPressed(k.restart) || IsKeyPressed(k.jump))
      game.input.restartNewQueued = true;
    if (IsKeyPressed(k.back))
      game.wantsExit = true;
  }

  // Global keys
  if (IsKeyPressed(k.screenshot))
    game.screenshotRequested = true;
  if (IsKeyPressed(k.cyclePalette))
    game.input.cyclePaletteQueued = true;
}

void ApplyMetaActions(Game &game) {
  if (game.input.restartSameQueued) {
    game.input.restartSameQueued = false;
    if (!ResetRun(game, game.runSeed))
      LOG_ERROR("Restart with seed 0x{:08X} failed", game.runSeed);
  } else if (game.input.restartNewQueued) {
    game.input.restartNewQueued = false;
    const uint32_t seed = static_cast<uint32_t>(std::time(nullptr));
    if (!ResetRun(game, seed))
      LOG_ERROR("Restart with seed 0x{:08X} failed", seed);
  }

  if (game.input.cyclePaletteQueued) {
    game.paletteIndex = (game.paletteIndex + 1) % cfg::kPaletteCount;
    game.input.cyclePaletteQueued = false;
  }
}

void TickGame(Game &game, const float dt) {
  game.previousCamX = game.run.camX;
  game.previousPlayerY = game.run.player.rect.y;

  TickInput in{};
  in.jumpPressed = game.input.jumpPressedQueued;
  in.jumpReleased = game.input.jumpReleasedQueued;
  in.jumpHeld = game.input.jumpHeld;
  game.input.jumpPressedQueued = false;
  game.input.jumpReleasedQueued = false;

  HandleSimEvents(game, StepRun(game.run, in, dt));
  ++game.simTicks;
}

void UpdatePresentation(Game &game, const float frameTime) {
  for (auto &p : game.popups) {
    if (!p.active)
      continue;
    p.life -= frameTime;
    p.y -= 40.0f * frameTime;
    if (p.life <= 0.0f)
      p.active = false;
  }
  if (game.deathFlashTimer > 0.0f)
    game.deathFlashTimer -= frameTime;
  if (game.landSquashTimer > 0.0f)
    game.landSquashTimer -= frameTime;
  if (game.screenshotNotificationTimer > 0.0f)
    game.screenshotNotificationTimer -= frameTime;
}
