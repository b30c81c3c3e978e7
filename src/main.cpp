#include <cstdio>
#include <ctime>

#include <raylib.h>

#include "core/Assets.hpp"
#include "core/Config.hpp"
#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "game/Game.hpp"
#include "render/Render.hpp"
#include "sim/Sim.hpp"

namespace {
constexpr const char *kProgressFile = "progress.json";
constexpr const char *kTuningFile = "tuning.json";
} // namespace

int main() {
  Log::Init();
  CrashHandler::Init();
  LOG_INFO("Endless Runner starting...");

  SimTuning tuning{};
  if (assets::Exists(kTuningFile) &&
      !LoadTuningFromFile(tuning, assets::Path(kTuningFile))) {
    LOG_WARN("Using built-in tuning defaults");
    tuning = SimTuning{};
  }

  SetConfigFlags(FLAG_MSAA_4X_HINT | FLAG_VSYNC_HINT);
  InitWindow(cfg::kScreenWidth, cfg::kScreenHeight, "Endless Runner");
  SetExitKey(
      0); // Disable raylib's default ESC=quit so we handle ESC ourselves.
  SetTargetFPS(0);

  Game game{};
  if (!InitGame(game, tuning, kProgressFile,
                static_cast<uint32_t>(std::time(nullptr)))) {
    LOG_CRITICAL("Could not start a run, exiting");
    CloseWindow();
    Log::Shutdown();
    return 1;
  }
  InitRenderer();

  while (!WindowShouldClose() && !game.wantsExit) {
    ReadInput(game);
    ApplyMetaActions(game);

    float frameTime = GetFrameTime();
    if (frameTime > cfg::kMaxFrameTime) {
      frameTime = cfg::kMaxFrameTime;
    }

    if (game.screen == GameScreen::Playing) {
      game.accumulator += frameTime;
      int simSteps = 0;
      constexpr int kMaxSimStepsPerFrame = 8;

      while (game.accumulator >= cfg::kFixedDt &&
             simSteps < kMaxSimStepsPerFrame &&
             game.screen == GameScreen::Playing) {
        TickGame(game, cfg::kFixedDt);
        game.accumulator -= cfg::kFixedDt;
        ++simSteps;
      }

      if (simSteps == kMaxSimStepsPerFrame) {
        game.accumulator = 0.0f;
      }
    }
    UpdatePresentation(game, frameTime);

    const float alpha = (game.screen == GameScreen::Playing)
                            ? game.accumulator / cfg::kFixedDt
                            : 1.0f;
    RenderFrame(game, alpha, static_cast<float>(GetTime()));

    // --- Take screenshot if requested (after rendering) ---
    if (game.screenshotRequested) {
      std::time_t now = std::time(nullptr);
      std::tm *tm = std::localtime(&now);
      char filename[256];
      std::snprintf(filename, sizeof(filename),
                    "screenshot_%04d%02d%02d_%02d%02d%02d.png",
                    tm->tm_year + 1900, tm->tm_mon + 1, tm->tm_mday,
                    tm->tm_hour, tm->tm_min, tm->tm_sec);
      TakeScreenshot(filename);
      std::snprintf(game.screenshotPath, sizeof(game.screenshotPath), "%s",
                    filename);
      game.screenshotNotificationTimer =
          3.0f; // Show notification for 3 seconds
      game.screenshotRequested = false;
    }
  }

  // A run still in progress keeps its score as a best-score candidate.
  if (game.run.status == RunStatus::Active &&
      !RecordAbandonedRun(game.progress, game.run.score)) {
    LOG_WARN("Best score of the abandoned run was not saved");
  }

  LOG_INFO("Endless Runner shutting down...");
  CleanupRenderer();
  CloseWindow();
  Log::Shutdown();
  return 0;
}
