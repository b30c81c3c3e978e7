#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "core/Rng.hpp"
#include "game/Progress.hpp"
#include "sim/Bot.hpp"
#include "sim/Sim.hpp"

namespace {
constexpr float kTestDt = 1.0f / 60.0f;

bool NearlyEqual(const float a, const float b, const float eps = 1e-4f) {
  return std::fabs(a - b) <= eps;
}

std::string TempPath(const char *name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

void WriteFile(const std::string &path, const char *contents) {
  std::ofstream f(path, std::ios::trunc);
  f << contents;
}

RunParams BaseParams() { return RunParamsFromUpgrades(UpgradeLevels{}); }

// A started run with nothing but the starter strip under the player and a
// frontier pushed far away, so tests control every entity.
RunState MakeQuietRun(const SimTuning &tuning = SimTuning{},
                      const RunParams &params = BaseParams()) {
  RunState run{};
  StartRun(run, tuning, params, 0xC0FFEEu);
  run.world.hazards.clear();
  run.world.coins.clear();
  run.world.platforms.resize(1); // starter strip
  run.generator.nextSpawnX = 1.0e9f;
  return run;
}

// An airborne player far above the ground with no platforms around.
PlayerSim MakeAirbornePlayer() {
  PlayerSim p{};
  p.rect = Rect{160.0f, 100.0f, cfg::kPlayerWidth, cfg::kPlayerHeight};
  p.floatY = p.rect.y;
  p.grounded = false;
  return p;
}

int CountEvents(const std::vector<SimEvent> &events, const SimEventType type) {
  return static_cast<int>(std::count_if(
      events.begin(), events.end(),
      [type](const SimEvent &e) { return e.type == type; }));
}

// --- Geometry/Collision Kernel ---

bool TestIntersectsHalfOpen() {
  const Rect a{0.0f, 0.0f, 10.0f, 10.0f};
  const Rect touchingRight{10.0f, 0.0f, 10.0f, 10.0f};
  const Rect touchingBelow{0.0f, 10.0f, 10.0f, 10.0f};
  const Rect overlapping{9.0f, 9.0f, 10.0f, 10.0f};
  return !Intersects(a, touchingRight) && !Intersects(a, touchingBelow) &&
         Intersects(a, overlapping) && Intersects(overlapping, a);
}

bool TestSweepLandsExactlyOnTop() {
  const std::vector<Rect> platforms = {Rect{0.0f, 100.0f, 200.0f, 20.0f}};
  const float starts[] = {0.0f, 0.3f, 0.7f};
  const float deltas[] = {43.0f, 50.0f, 61.5f, 97.0f, 150.0f, 299.0f};
  for (const float start : starts) {
    for (const float delta : deltas) {
      Rect player{20.0f, 0.0f, cfg::kPlayerWidth, cfg::kPlayerHeight};
      const SweepResult r = SweepVertical(player, start, delta, platforms);
      if (!r.landed || Bottom(player) != 100.0f || r.floatY != player.y) {
        return false;
      }
    }
  }
  return true;
}

bool TestSweepZeroDeltaNoop() {
  const std::vector<Rect> platforms = {Rect{0.0f, 100.0f, 200.0f, 20.0f}};
  Rect player{20.0f, 10.0f, cfg::kPlayerWidth, cfg::kPlayerHeight};
  const SweepResult r = SweepVertical(player, 10.4f, 0.0f, platforms);
  return !r.landed && !r.bumped && r.floatY == 10.4f && player.y == 10.0f;
}

bool TestSweepOneWayFallThroughFromInside() {
  // Bottom already below the platform top: no snap while moving down.
  const std::vector<Rect> platforms = {Rect{0.0f, 100.0f, 200.0f, 20.0f}};
  Rect player{20.0f, 52.0f, cfg::kPlayerWidth, cfg::kPlayerHeight};
  const SweepResult r = SweepVertical(player, 52.0f, 30.0f, platforms);
  return !r.landed && !r.bumped && player.y == 82.0f &&
         NearlyEqual(r.floatY, 82.0f);
}

bool TestSweepSideOverlapDoesNotBlock() {
  // Horizontally disjoint platform at the same height is ignored.
  const std::vector<Rect> platforms = {Rect{300.0f, 100.0f, 200.0f, 20.0f}};
  Rect player{20.0f, 0.0f, cfg::kPlayerWidth, cfg::kPlayerHeight};
  // 42 px splits into eight exact 5.25 px steps.
  const SweepResult r = SweepVertical(player, 0.0f, 42.0f, platforms);
  return !r.landed && player.y == 42.0f;
}

bool TestSweepBumpFromBelow() {
  const std::vector<Rect> platforms = {Rect{0.0f, 100.0f, 200.0f, 20.0f}};
  Rect player{20.0f, 124.0f, cfg::kPlayerWidth, cfg::kPlayerHeight};
  const SweepResult r = SweepVertical(player, 124.0f, -20.0f, platforms);
  return r.bumped && !r.landed && player.y == 120.0f;
}

bool TestSweepHighSpeedNoTunneling() {
  // One tick at max fall speed with a thin platform in the way.
  const std::vector<Rect> platforms = {Rect{0.0f, 100.0f, 200.0f, 4.0f}};
  Rect player{20.0f, 0.0f, cfg::kPlayerWidth, cfg::kPlayerHeight};
  const SweepResult r = SweepVertical(player, 0.0f, 1500.0f * 0.05f, platforms);
  return r.landed && Bottom(player) == 100.0f;
}

// --- Player kinematics ---

bool TestCoyoteBufferAndGate() {
  const SimTuning tuning{};
  const RunParams params = BaseParams();
  const std::vector<Rect> none;
  const float dt = cfg::kFixedDt;

  struct Case {
    float coyote;
    float buffer;
    bool expectJump;
  };
  const Case cases[] = {
      {0.08f, 0.0f, false},
      {0.0f, 0.10f, false},
      {0.08f, 0.10f, true},
  };
  for (const auto &c : cases) {
    PlayerSim p = MakeAirbornePlayer();
    p.coyoteTimer = c.coyote;
    p.jumpBufferTimer = c.buffer;
    const PlayerStepResult r =
        StepPlayer(p, TickInput{}, params, tuning, 0.0f, none, dt);
    if (r.jumped != c.expectJump) {
      return false;
    }
    if (c.expectJump &&
        (p.coyoteTimer != 0.0f || p.jumpBufferTimer != 0.0f || p.grounded)) {
      return false;
    }
  }
  return true;
}

bool TestJumpBufferedBeforeLanding() {
  // Press while airborne just above the ground; the jump fires on landing.
  const SimTuning tuning{};
  const RunParams params = BaseParams();
  const std::vector<Rect> none;
  PlayerSim p = MakeAirbornePlayer();
  p.rect.y = tuning.groundY - p.rect.h - 3.0f;
  p.floatY = p.rect.y;
  p.vy = 400.0f;

  TickInput press{};
  press.jumpPressed = true;
  press.jumpHeld = true;
  StepPlayer(p, press, params, tuning, 0.0f, none, cfg::kFixedDt);
  if (!p.grounded) {
    return false;
  }
  TickInput held{};
  held.jumpHeld = true;
  const PlayerStepResult r =
      StepPlayer(p, held, params, tuning, 0.0f, none, cfg::kFixedDt);
  return r.jumped && p.vy < 0.0f;
}

bool TestJumpCutIdempotent() {
  RunState run = MakeQuietRun();
  TickInput press{};
  press.jumpPressed = true;
  press.jumpHeld = true;
  StepRun(run, press, kTestDt);
  if (run.player.grounded || run.player.vy >= 0.0f) {
    return false;
  }

  TickInput release{};
  release.jumpReleased = true;
  const float before = run.player.vy;
  StepRun(run, release, kTestDt);
  const float expectedCut = (before + run.tuning.gravity * kTestDt) *
                            run.tuning.jumpCutMultiplier;
  if (!NearlyEqual(run.player.vy, expectedCut, 1e-2f) || !run.player.jumpCut) {
    return false;
  }

  const float afterCut = run.player.vy;
  StepRun(run, release, kTestDt);
  return NearlyEqual(run.player.vy, afterCut + run.tuning.gravity * kTestDt,
                     1e-2f);
}

bool TestRestingContactStaysGrounded() {
  RunState run = MakeQuietRun();
  const float top = run.world.platforms.front().y;
  for (int i = 0; i < 240; ++i) {
    const auto &events = StepRun(run, TickInput{}, cfg::kFixedDt);
    if (!events.empty() || !run.player.grounded || run.player.vy != 0.0f ||
        Bottom(run.player.rect) != top) {
      return false;
    }
  }
  return true;
}

bool TestPlayerPinnedToCamera() {
  RunState run = MakeQuietRun();
  for (int i = 0; i < 100; ++i) {
    const float camBefore = run.camX;
    StepRun(run, TickInput{}, cfg::kFixedDt);
    if (run.player.rect.x != std::floor(camBefore + run.tuning.playerOffsetX)) {
      return false;
    }
  }
  return true;
}

bool TestJumpLandsWithSingleLandedEvent() {
  RunState run = MakeQuietRun();
  TickInput press{};
  press.jumpPressed = true;
  press.jumpHeld = true;
  const auto &first = StepRun(run, press, kTestDt);
  if (CountEvents(first, SimEventType::Jumped) != 1) {
    return false;
  }

  int landed = 0;
  for (int i = 0; i < 120; ++i) {
    const auto &events = StepRun(run, TickInput{}, kTestDt);
    landed += CountEvents(events, SimEventType::Landed);
  }
  return landed == 1 && run.player.grounded &&
         Bottom(run.player.rect) == run.world.platforms.front().y;
}

// --- End-to-end scenarios ---

bool TestFallCaughtByGroundClamp() {
  RunState run = MakeQuietRun();
  run.world.platforms.clear();
  const float groundY = run.tuning.groundY;

  for (int i = 0; i < 300; ++i) {
    StepRun(run, TickInput{}, kTestDt);
    if (Bottom(run.player.rect) > groundY) {
      return false;
    }
  }
  return IsRunActive(run) && run.player.grounded &&
         Bottom(run.player.rect) == groundY && run.player.vy == 0.0f;
}

bool TestJumpFromGroundAppliesGravityOnce() {
  RunState run = MakeQuietRun();
  if (!run.player.grounded) {
    return false;
  }
  TickInput press{};
  press.jumpPressed = true;
  press.jumpHeld = true;
  StepRun(run, press, kTestDt);
  const float expected =
      -run.params.jumpVelocity + run.tuning.gravity * kTestDt;
  return !run.player.grounded && NearlyEqual(run.player.vy, expected, 1e-3f);
}

bool TestCoinPickupOncePerCoin() {
  RunState run = MakeQuietRun();
  const Rect &p = run.player.rect;
  const Rect coin{p.x + 10.0f, p.y + 10.0f, cfg::kCoinSize, cfg::kCoinSize};
  run.world.coins.push_back(coin);

  const auto &first = StepRun(run, TickInput{}, cfg::kFixedDt);
  if (CountEvents(first, SimEventType::CoinCollected) != 1 ||
      run.coinsRun != 1 || !run.world.coins.empty()) {
    return false;
  }
  if (first.front().rect.x != coin.x || first.front().rect.y != coin.y) {
    return false;
  }
  if (CountActiveParticles(run) != cfg::kCoinBurstCount) {
    return false;
  }

  const auto &second = StepRun(run, TickInput{}, cfg::kFixedDt);
  return CountEvents(second, SimEventType::CoinCollected) == 0 &&
         run.coinsRun == 1;
}

bool TestHazardDeathIsTerminal() {
  RunParams params = BaseParams();
  params.coinMultiplier = 1.5f;
  RunState run = MakeQuietRun(SimTuning{}, params);
  run.coinsRun = 3;
  const Rect &p = run.player.rect;
  run.world.hazards.push_back(Rect{p.x + 5.0f, p.y + 5.0f, 20.0f, 20.0f});

  const auto &events = StepRun(run, TickInput{}, cfg::kFixedDt);
  if (run.status != RunStatus::Dead || run.payout != 4 ||
      CountEvents(events, SimEventType::Died) != 1) {
    return false;
  }
  const SimEvent &died = events.back();
  if (died.type != SimEventType::Died || died.coins != 3 || died.payout != 4 ||
      died.finalScore != run.score) {
    return false;
  }

  const float camX = run.camX;
  const uint64_t ticks = run.ticks;
  const int score = run.score;
  for (int i = 0; i < 30; ++i) {
    TickInput press{};
    press.jumpPressed = true;
    if (!StepRun(run, press, kTestDt).empty()) {
      return false;
    }
  }
  if (run.camX != camX || run.ticks != ticks || run.score != score) {
    return false;
  }

  return ResetRun(run, 7u) && IsRunActive(run) && run.coinsRun == 0 &&
         run.score == 0 && run.payout == 0 && run.camX == 0.0f;
}

// --- Run loop ---

bool TestSpeedRampAndClamp() {
  SimTuning tuning{};
  tuning.hazardChance = 0.0f;
  RunState run{};
  if (!StartRun(run, tuning, BaseParams(), 42u)) {
    return false;
  }

  const float dts[] = {1.0f / 120.0f, 1.0f / 60.0f, 0.03f, 0.05f};
  double total = 0.0;
  for (int i = 0; i < 4000; ++i) {
    const float dt = dts[i % 4];
    StepRun(run, TickInput{}, dt);
    total += dt;
    const float expected = std::min(
        tuning.maxSpeed,
        tuning.baseSpeed + tuning.speedRamp * static_cast<float>(total));
    if (run.speed > tuning.maxSpeed || run.speed < tuning.baseSpeed ||
        !NearlyEqual(run.speed, expected, 0.25f)) {
      return false;
    }
  }
  // 4000 ticks cover more than the 71 s ramp.
  return IsRunActive(run) && run.speed == tuning.maxSpeed;
}

bool TestScoreAccruesWithDistance() {
  RunState run = MakeQuietRun();
  for (int i = 0; i < 600; ++i) {
    StepRun(run, TickInput{}, kTestDt);
  }
  return run.score == static_cast<int>(std::floor(run.scoreF)) &&
         NearlyEqual(run.scoreF, run.camX * run.tuning.scorePerPixel, 0.05f);
}

bool TestPauseSkipsTick() {
  RunState run = MakeQuietRun();
  StepRun(run, TickInput{}, kTestDt);
  run.paused = true;
  const float camX = run.camX;
  const float speed = run.speed;
  const uint64_t ticks = run.ticks;
  TickInput press{};
  press.jumpPressed = true;
  const auto &events = StepRun(run, press, kTestDt);
  return events.empty() && run.camX == camX && run.speed == speed &&
         run.ticks == ticks && run.player.grounded;
}

bool TestTickDtClamped() {
  RunState run = MakeQuietRun();
  StepRun(run, TickInput{}, 1.0f);
  return NearlyEqual(run.runTime, cfg::kMaxTickDt, 1e-6f) &&
         NearlyEqual(run.camX, run.speed * cfg::kMaxTickDt, 1e-2f);
}

bool TestMagnetPullsCoinsInRadius() {
  RunParams params = BaseParams();
  params.magnetRadius = 100.0f;
  RunState run = MakeQuietRun(SimTuning{}, params);

  const Rect &p = run.player.rect;
  const float half = cfg::kCoinSize * 0.5f;
  const Rect nearCoin{CenterX(p) + 60.0f - half, CenterY(p) - half,
                      cfg::kCoinSize, cfg::kCoinSize};
  const Rect farCoin{CenterX(p) + 150.0f - half, CenterY(p) - half,
                     cfg::kCoinSize, cfg::kCoinSize};
  run.world.coins = {nearCoin, farCoin};

  StepRun(run, TickInput{}, cfg::kFixedDt);
  if (run.world.coins.size() != 2) {
    return false;
  }
  const Rect &movedNear = run.world.coins[0];
  const Rect &movedFar = run.world.coins[1];
  const float newDist = std::fabs(CenterX(movedNear) - CenterX(run.player.rect));
  return newDist < 60.0f && movedFar.x == farCoin.x && movedFar.y == farCoin.y;
}

bool TestDeterministicRuns() {
  RunState a{};
  RunState b{};
  StartRun(a, SimTuning{}, BaseParams(), 0xBEEFu);
  StartRun(b, SimTuning{}, BaseParams(), 0xBEEFu);
  Bot botA{};
  Bot botB{};
  InitBot(botA, BotStyle::Random, 99u);
  InitBot(botB, BotStyle::Random, 99u);

  for (int i = 0; i < 3000; ++i) {
    StepRun(a, BotInput(botA, a), cfg::kFixedDt);
    StepRun(b, BotInput(botB, b), cfg::kFixedDt);
  }
  if (a.status != b.status || a.camX != b.camX || a.score != b.score ||
      a.coinsRun != b.coinsRun || a.player.rect.y != b.player.rect.y ||
      a.generator.chunksSpawned != b.generator.chunksSpawned ||
      a.world.platforms.size() != b.world.platforms.size() ||
      a.world.hazards.size() != b.world.hazards.size()) {
    return false;
  }
  for (size_t i = 0; i < a.world.platforms.size(); ++i) {
    if (a.world.platforms[i].x != b.world.platforms[i].x ||
        a.world.platforms[i].y != b.world.platforms[i].y) {
      return false;
    }
  }
  return true;
}

bool TestDifferentSeedsDiffer() {
  LevelGenerator ga{};
  LevelGenerator gb{};
  World wa{};
  World wb{};
  const SimTuning tuning{};
  ga.Initialize(1u, tuning, wa);
  gb.Initialize(2u, tuning, wb);
  // At camX 0 the horizon still lies inside the starter gap, so look from a
  // camera position that needs generated chunks.
  ga.EnsureAhead(wa, tuning, 2000.0f, tuning.baseSpeed);
  gb.EnsureAhead(wb, tuning, 2000.0f, tuning.baseSpeed);
  // Compare the first generated platform after the starter strip.
  return wa.platforms.size() > 1 && wb.platforms.size() > 1 &&
         (wa.platforms[1].w != wb.platforms[1].w ||
          wa.platforms[1].y != wb.platforms[1].y ||
          ga.nextSpawnX != gb.nextSpawnX);
}

// --- Level generator ---

bool TestStarterStripLayout() {
  RunState run{};
  if (!StartRun(run, SimTuning{}, BaseParams(), 5u)) {
    return false;
  }
  const Rect &strip = run.world.platforms.front();
  const SimTuning &t = run.tuning;
  return strip.x == 0.0f && strip.y == t.groundY - t.starterHeight &&
         strip.w == t.viewportWidth + t.starterExtraWidth &&
         strip.h == t.starterHeight && run.player.grounded &&
         Bottom(run.player.rect) == strip.y &&
         run.generator.nextSpawnX >= LevelGenerator::HorizonX(t, 0.0f);
}

bool TestHorizonInvariant() {
  RunState run{};
  StartRun(run, SimTuning{}, BaseParams(), 0x1234u);
  Bot bot{};
  InitBot(bot, BotStyle::Cautious, 7u);
  float lastFrontier = run.generator.nextSpawnX;
  for (int i = 0; i < 6000 && IsRunActive(run); ++i) {
    StepRun(run, BotInput(bot, run), cfg::kFixedDt);
    if (run.generator.nextSpawnX <
        LevelGenerator::HorizonX(run.tuning, run.camX)) {
      return false;
    }
    if (run.generator.nextSpawnX < lastFrontier) {
      return false;
    }
    lastFrontier = run.generator.nextSpawnX;
  }
  return true;
}

bool TestEnsureAheadAdvancesFrontier() {
  const SimTuning tuning{};
  LevelGenerator gen{};
  World world{};
  gen.Initialize(9u, tuning, world);
  float camX = 0.0f;
  for (int i = 0; i < 50; ++i) {
    const float before = gen.nextSpawnX;
    const int chunksBefore = gen.chunksSpawned;
    camX = before; // horizon is now well past the frontier
    gen.EnsureAhead(world, tuning, camX, tuning.baseSpeed);
    if (gen.nextSpawnX <= before || gen.chunksSpawned <= chunksBefore ||
        gen.nextSpawnX < LevelGenerator::HorizonX(tuning, camX)) {
      return false;
    }
  }
  return true;
}

bool TestStarterGapNeedsNoChunks() {
  const SimTuning tuning{};
  LevelGenerator gen{};
  World world{};
  gen.Initialize(1u, tuning, world);
  gen.EnsureAhead(world, tuning, 0.0f, tuning.baseSpeed);
  return world.platforms.size() == 1 && gen.chunksSpawned == 0 &&
         gen.nextSpawnX == 2300.0f;
}

bool TestHazardsGuardLeadingEdge() {
  // At base speed the reaction window always lies before the platform and
  // the separation push never reaches past its leading edge, so every spike
  // is clamped onto the platform's first pixels.
  const SimTuning tuning{};
  LevelGenerator gen{};
  World world{};
  gen.Initialize(77u, tuning, world);
  for (float camX = 0.0f; camX < 60000.0f; camX += 500.0f) {
    gen.EnsureAhead(world, tuning, camX, tuning.baseSpeed);
  }
  for (const auto &h : world.hazards) {
    bool atLeadingEdge = false;
    for (const auto &p : world.platforms) {
      if (Bottom(h) == p.y + cfg::kHazardSink && h.x == p.x) {
        atLeadingEdge = true;
        break;
      }
    }
    if (!atLeadingEdge) {
      return false;
    }
  }
  return world.hazards.size() >= 10;
}

bool TestHazardMinimumSeparation() {
  const SimTuning tuning{};
  const float speeds[] = {320.0f, 600.0f, 820.0f};
  for (const float speed : speeds) {
    LevelGenerator gen{};
    World world{};
    gen.Initialize(0xABCDu, tuning, world);
    for (float camX = 0.0f; camX < 60000.0f; camX += 500.0f) {
      gen.EnsureAhead(world, tuning, camX, speed);
    }
    if (world.hazards.size() < 10) {
      return false;
    }
    // Hazards are only ever appended, so vector order is generation order.
    const float minSep = speed * tuning.minHazardSepTime;
    for (size_t i = 1; i < world.hazards.size(); ++i) {
      if (world.hazards[i].x - world.hazards[i - 1].x < minSep - 1e-3f) {
        return false;
      }
    }
  }
  return true;
}

bool TestHazardsSitOnPlatforms() {
  const SimTuning tuning{};
  LevelGenerator gen{};
  World world{};
  gen.Initialize(77u, tuning, world);
  gen.EnsureAhead(world, tuning, 20000.0f, 500.0f);
  for (const auto &h : world.hazards) {
    bool onPlatform = false;
    for (const auto &p : world.platforms) {
      if (h.x >= p.x && Right(h) <= Right(p) &&
          Bottom(h) == p.y + cfg::kHazardSink) {
        onPlatform = true;
        break;
      }
    }
    if (!onPlatform || h.w < tuning.hazardMinW || h.w > tuning.hazardMaxW ||
        h.h < tuning.hazardMinH || h.h > tuning.hazardMaxH) {
      return false;
    }
  }
  return !world.hazards.empty();
}

bool TestPlatformBoundsAndHeightSteps() {
  const SimTuning tuning{};
  LevelGenerator gen{};
  World world{};
  gen.Initialize(31337u, tuning, world);
  gen.EnsureAhead(world, tuning, 40000.0f, tuning.baseSpeed);

  const float nominalTop = tuning.groundY - tuning.starterHeight;
  for (size_t i = 1; i < world.platforms.size(); ++i) {
    const Rect &p = world.platforms[i];
    const Rect &prev = world.platforms[i - 1];
    if (p.w < tuning.platformMinW || p.w > tuning.platformMaxW ||
        p.h < tuning.platformMinH || p.h > tuning.platformMaxH) {
      return false;
    }
    if (std::fabs(p.y - prev.y) > tuning.maxStepSlow) {
      return false;
    }
    if (p.y > nominalTop || p.y < nominalTop - cfg::kHeightLevels[3]) {
      return false;
    }
    // The first gap after the starter strip is fixed.
    const float gap = p.x - Right(prev);
    if (i > 1 && (gap < static_cast<float>(tuning.minGap) ||
                  gap > static_cast<float>(tuning.maxGap))) {
      return false;
    }
  }
  return world.platforms.size() > 20;
}

bool TestCoinClustersAbovePlatforms() {
  const SimTuning tuning{};
  LevelGenerator gen{};
  World world{};
  gen.Initialize(4242u, tuning, world);
  gen.EnsureAhead(world, tuning, 20000.0f, tuning.baseSpeed);
  for (const auto &c : world.coins) {
    if (c.w != cfg::kCoinSize || c.h != cfg::kCoinSize) {
      return false;
    }
    bool above = false;
    for (const auto &p : world.platforms) {
      const float lift = p.y - c.y;
      if (c.x >= p.x && lift >= cfg::kCoinLift &&
          lift <= cfg::kCoinLift + cfg::kCoinArcHeight) {
        above = true;
        break;
      }
    }
    if (!above) {
      return false;
    }
  }
  return !world.coins.empty();
}

bool TestCleanupRemovesBehindMargin() {
  World world{};
  // limit = 1000 - 280 = 720
  world.platforms = {Rect{600.0f, 0.0f, 119.0f, 10.0f},
                     Rect{600.0f, 0.0f, 120.0f, 10.0f},
                     Rect{900.0f, 0.0f, 50.0f, 10.0f}};
  world.hazards = {Rect{0.0f, 0.0f, 30.0f, 30.0f},
                   Rect{700.0f, 0.0f, 30.0f, 30.0f}};
  world.coins = {Rect{100.0f, 0.0f, 18.0f, 18.0f},
                 Rect{200.0f, 0.0f, 18.0f, 18.0f}};
  CleanupWorld(world, 1000.0f, 280.0f);
  if (world.platforms.size() != 2 || world.hazards.size() != 1 ||
      !world.coins.empty()) {
    return false;
  }
  for (const auto &p : world.platforms) {
    if (Right(p) < 720.0f) {
      return false;
    }
  }
  return world.hazards.front().x == 700.0f;
}

// --- Configuration ---

bool TestInvalidTuningRefusesRun() {
  SimTuning bad{};
  bad.platformMinW = 0;
  RunState run{};
  if (StartRun(run, bad, BaseParams(), 1u) || IsRunActive(run)) {
    return false;
  }

  SimTuning unordered{};
  unordered.minGap = 400;
  if (StartRun(run, unordered, BaseParams(), 1u)) {
    return false;
  }

  SimTuning badChance{};
  badChance.coinChance = 1.5f;
  if (StartRun(run, badChance, BaseParams(), 1u)) {
    return false;
  }

  // A refused run never ticks.
  StepRun(run, TickInput{}, kTestDt);
  return run.status == RunStatus::Inactive && run.ticks == 0;
}

bool TestInvalidUpgradeLevelsRefuseRun() {
  RunState run{};
  UpgradeLevels tooHigh{};
  tooHigh.magnet = cfg::kUpgradeMaxLevel + 1;
  UpgradeLevels negative{};
  negative.jump = -1;
  UpgradeLevels maxed{cfg::kUpgradeMaxLevel, cfg::kUpgradeMaxLevel,
                      cfg::kUpgradeMaxLevel, cfg::kUpgradeMaxLevel};
  return !StartRunWithUpgrades(run, SimTuning{}, tooHigh, 1u) &&
         !StartRunWithUpgrades(run, SimTuning{}, negative, 1u) &&
         StartRunWithUpgrades(run, SimTuning{}, maxed, 1u) && IsRunActive(run);
}

bool TestUpgradeFormulas() {
  const UpgradeLevels levels{2, 3, 1, 4};
  const RunParams p = RunParamsFromUpgrades(levels);
  const RunParams base = RunParamsFromUpgrades(UpgradeLevels{});
  return NearlyEqual(p.jumpVelocity, 980.0f) &&
         NearlyEqual(p.coyoteTime, 0.16f) &&
         NearlyEqual(p.coinMultiplier, 1.2f) &&
         NearlyEqual(p.magnetRadius, 104.0f) &&
         NearlyEqual(base.coinMultiplier, 1.0f) && base.magnetRadius == 0.0f;
}

bool TestTuningFileOverrides() {
  const std::string path = TempPath("runner_tuning_ok.json");
  WriteFile(path, R"({"gravity": 1800.0, "minGap": 200, "futureKnob": 3})");
  SimTuning tuning{};
  const bool ok = LoadTuningFromFile(tuning, path.c_str());
  std::filesystem::remove(path);
  return ok && tuning.gravity == 1800.0f && tuning.minGap == 200 &&
         tuning.maxGap == cfg::kMaxGap;
}

bool TestTuningFileRejectsBadInput() {
  const std::string path = TempPath("runner_tuning_bad.json");
  SimTuning tuning{};

  WriteFile(path, "{\"gravity\": ");
  const bool malformed = LoadTuningFromFile(tuning, path.c_str());

  WriteFile(path, R"({"minGap": 1.5})");
  const bool wrongType = LoadTuningFromFile(tuning, path.c_str());

  WriteFile(path, R"({"baseSpeed": 900.0})");
  const bool invalid = LoadTuningFromFile(tuning, path.c_str());

  WriteFile(path, R"([1, 2, 3])");
  const bool notObject = LoadTuningFromFile(tuning, path.c_str());

  std::filesystem::remove(path);
  const bool missing =
      LoadTuningFromFile(tuning, TempPath("runner_tuning_missing.json").c_str());

  return !malformed && !wrongType && !invalid && !notObject && !missing &&
         tuning.gravity == cfg::kGravity && tuning.minGap == cfg::kMinGap &&
         tuning.baseSpeed == cfg::kBaseSpeed;
}

// --- Persistence ---

bool TestProgressRoundTrip() {
  const std::string path = TempPath("runner_progress_rt.json");
  std::filesystem::remove(path);

  Progress fresh = LoadProgress(path.c_str());
  if (fresh.money != 0 || fresh.bestScore != 0 || fresh.path != path) {
    return false;
  }
  fresh.upgrades = UpgradeLevels{1, 2, 3, 4};
  if (!RecordRunResult(fresh, 12, 340)) {
    return false;
  }
  // Lower score keeps the best; money still accumulates.
  if (!RecordRunResult(fresh, 5, 100)) {
    return false;
  }

  const Progress loaded = LoadProgress(path.c_str());
  std::filesystem::remove(path);
  return loaded.money == 17 && loaded.bestScore == 340 &&
         loaded.upgrades.jump == 1 && loaded.upgrades.coyote == 2 &&
         loaded.upgrades.coinMult == 3 && loaded.upgrades.magnet == 4;
}

bool TestAbandonedRunKeepsBestScore() {
  const std::string path = TempPath("runner_progress_quit.json");
  std::filesystem::remove(path);

  Progress progress = LoadProgress(path.c_str());
  if (!RecordRunResult(progress, 9, 200)) {
    return false;
  }
  // A lower abandoned score changes nothing; a higher one becomes the best.
  if (!RecordAbandonedRun(progress, 150) || progress.bestScore != 200) {
    return false;
  }
  if (!RecordAbandonedRun(progress, 420)) {
    return false;
  }

  const Progress loaded = LoadProgress(path.c_str());
  std::filesystem::remove(path);
  return loaded.bestScore == 420 && loaded.money == 9;
}

bool TestCorruptProgressFallsBack() {
  const std::string path = TempPath("runner_progress_bad.json");
  WriteFile(path, "{ not json");
  const Progress a = LoadProgress(path.c_str());

  WriteFile(path, R"({"money": 10, "upgrades": {"jump": 99}})");
  const Progress b = LoadProgress(path.c_str());

  WriteFile(path, R"({"money": "lots"})");
  const Progress c = LoadProgress(path.c_str());
  std::filesystem::remove(path);

  return a.money == 0 && b.money == 0 && b.upgrades.jump == 0 &&
         c.money == 0 && a.path == path;
}

// --- Bot / RNG ---

bool TestRngRanges() {
  uint32_t state = core::NormalizeSeed(0u);
  if (state == 0u) {
    return false;
  }
  for (int i = 0; i < 10000; ++i) {
    const float f = core::NextFloat01(state);
    const int n = core::NextInt(state, 3, 7);
    if (f < 0.0f || f >= 1.0f || n < 3 || n > 7) {
      return false;
    }
  }
  return core::NextInt(state, 5, 2) == 5;
}

bool TestBotJumpsOnSafeStrip() {
  // The starter strip is hazard-free, so the first seconds are safe for any
  // bot; the random bot must have jumped by then.
  RunState run{};
  StartRun(run, SimTuning{}, BaseParams(), 0x5EEDu);
  Bot bot{};
  InitBot(bot, BotStyle::Random, 0x5EEDu);
  int jumps = 0;
  for (int i = 0; i < 600 && IsRunActive(run); ++i) {
    jumps += CountEvents(StepRun(run, BotInput(bot, run), cfg::kFixedDt),
                         SimEventType::Jumped);
  }
  return IsRunActive(run) && jumps > 0;
}

} // namespace

int main() {
  Log::Init();
  Log::SetLevel(spdlog::level::warn);
  int failed = 0;

  auto run = [&](const char *name, const bool ok) {
    if (!ok) {
      std::cerr << "[FAIL] " << name << '\n';
      ++failed;
    } else {
      std::cout << "[PASS] " << name << '\n';
    }
  };

  run("intersects_half_open", TestIntersectsHalfOpen());
  run("sweep_lands_exactly_on_top", TestSweepLandsExactlyOnTop());
  run("sweep_zero_delta_noop", TestSweepZeroDeltaNoop());
  run("sweep_one_way_fall_through", TestSweepOneWayFallThroughFromInside());
  run("sweep_side_overlap_does_not_block", TestSweepSideOverlapDoesNotBlock());
  run("sweep_bump_from_below", TestSweepBumpFromBelow());
  run("sweep_high_speed_no_tunneling", TestSweepHighSpeedNoTunneling());
  run("coyote_buffer_and_gate", TestCoyoteBufferAndGate());
  run("jump_buffered_before_landing", TestJumpBufferedBeforeLanding());
  run("jump_cut_idempotent", TestJumpCutIdempotent());
  run("resting_contact_stays_grounded", TestRestingContactStaysGrounded());
  run("player_pinned_to_camera", TestPlayerPinnedToCamera());
  run("jump_lands_with_single_event", TestJumpLandsWithSingleLandedEvent());
  run("fall_caught_by_ground_clamp", TestFallCaughtByGroundClamp());
  run("jump_from_ground_gravity_once", TestJumpFromGroundAppliesGravityOnce());
  run("coin_pickup_once_per_coin", TestCoinPickupOncePerCoin());
  run("hazard_death_is_terminal", TestHazardDeathIsTerminal());
  run("speed_ramp_and_clamp", TestSpeedRampAndClamp());
  run("score_accrues_with_distance", TestScoreAccruesWithDistance());
  run("pause_skips_tick", TestPauseSkipsTick());
  run("tick_dt_clamped", TestTickDtClamped());
  run("magnet_pulls_coins_in_radius", TestMagnetPullsCoinsInRadius());
  run("deterministic_runs", TestDeterministicRuns());
  run("different_seeds_differ", TestDifferentSeedsDiffer());
  run("starter_strip_layout", TestStarterStripLayout());
  run("horizon_invariant", TestHorizonInvariant());
  run("ensure_ahead_advances_frontier", TestEnsureAheadAdvancesFrontier());
  run("starter_gap_needs_no_chunks", TestStarterGapNeedsNoChunks());
  run("hazards_guard_leading_edge", TestHazardsGuardLeadingEdge());
  run("hazard_minimum_separation", TestHazardMinimumSeparation());
  run("hazards_sit_on_platforms", TestHazardsSitOnPlatforms());
  run("platform_bounds_and_height_steps", TestPlatformBoundsAndHeightSteps());
  run("coin_clusters_above_platforms", TestCoinClustersAbovePlatforms());
  run("cleanup_removes_behind_margin", TestCleanupRemovesBehindMargin());
  run("invalid_tuning_refuses_run", TestInvalidTuningRefusesRun());
  run("invalid_upgrade_levels_refuse_run", TestInvalidUpgradeLevelsRefuseRun());
  run("upgrade_formulas", TestUpgradeFormulas());
  run("tuning_file_overrides", TestTuningFileOverrides());
  run("tuning_file_rejects_bad_input", TestTuningFileRejectsBadInput());
  run("progress_round_trip", TestProgressRoundTrip());
  run("abandoned_run_keeps_best_score", TestAbandonedRunKeepsBestScore());
  run("corrupt_progress_falls_back", TestCorruptProgressFallsBack());
  run("rng_ranges", TestRngRanges());
  run("bot_jumps_on_safe_strip", TestBotJumpsOnSafeStrip());

  Log::Shutdown();
  return failed == 0 ? 0 : 1;
}
