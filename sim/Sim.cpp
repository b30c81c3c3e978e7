#include "sim/Sim.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "core/Log.hpp"
#include "core/Rng.hpp"

namespace {
constexpr float kTau = 6.28318530717959f;
constexpr float kPi = 3.14159265358979f;

struct BurstSpec {
  ParticleKind kind;
  int count;
  float speedMin;
  float speedMax;
  float lifeMin;
  float lifeMax;
  float radiusMin;
  float radiusMax;
  bool upward; // restrict directions to the upper half-plane
};

constexpr BurstSpec kDustBurst{ParticleKind::Dust, 0, 90.0f, 240.0f, 0.25f,
                               0.55f, 2.0f, 4.5f, true};
constexpr BurstSpec kSparkleBurst{ParticleKind::Sparkle, cfg::kCoinBurstCount,
                                  90.0f, 280.0f, 0.25f, 0.65f, 2.0f, 4.2f,
                                  false};
constexpr BurstSpec kDeathBurst{ParticleKind::Burst, cfg::kDeathBurstCount,
                                180.0f, 520.0f, 0.35f, 0.95f, 2.0f, 5.0f, false};

void SpawnBurst(RunState &run, const BurstSpec &spec, const int count,
                const float x, const float y) {
  int spawned = 0;
  for (auto &p : run.particles) {
    if (spawned >= count) {
      break;
    }
    if (p.active) {
      continue;
    }
    const float angle = spec.upward
                            ? core::NextRange(run.fxRngState, -kPi, 0.0f)
                            : core::NextRange(run.fxRngState, 0.0f, kTau);
    const float speed =
        core::NextRange(run.fxRngState, spec.speedMin, spec.speedMax);
    p.active = true;
    p.kind = spec.kind;
    p.x = x;
    p.y = y;
    p.vx = std::cos(angle) * speed;
    p.vy = std::sin(angle) * speed;
    p.life = core::NextRange(run.fxRngState, spec.lifeMin, spec.lifeMax);
    p.maxLife = p.life;
    p.radius = core::NextRange(run.fxRngState, spec.radiusMin, spec.radiusMax);
    ++spawned;
  }
}

void UpdateParticles(RunState &run, const float dt) {
  const float drag = std::pow(cfg::kParticleDrag, dt * 60.0f);
  for (auto &p : run.particles) {
    if (!p.active) {
      continue;
    }
    p.life -= dt;
    if (p.life <= 0.0f) {
      p.active = false;
      continue;
    }
    p.vy += cfg::kParticleGravity * dt;
    p.vx *= drag;
    p.vy *= drag;
    p.x += p.vx * dt;
    p.y += p.vy * dt;
  }
}

void ApplyMagnet(RunState &run, const float dt) {
  const float radius = run.params.magnetRadius;
  if (radius <= 0.0f) {
    return;
  }
  const float px = CenterX(run.player.rect);
  const float py = CenterY(run.player.rect);
  const float scale = dt * run.tuning.magnetStrength;
  for (auto &c : run.world.coins) {
    const float dx = px - CenterX(c);
    const float dy = py - CenterY(c);
    const float dist = std::hypot(dx, dy);
    if (dist > cfg::kMagnetDeadZone && dist < radius) {
      const float pull = (radius - dist) / radius;
      c.x += dx * pull * scale;
      c.y += dy * pull * scale;
    }
  }
}

void CollectCoins(RunState &run) {
  auto &coins = run.world.coins;
  size_t i = 0;
  while (i < coins.size()) {
    if (!Intersects(run.player.rect, coins[i])) {
      ++i;
      continue;
    }
    const Rect coin = coins[i];
    ++run.coinsRun;

    SimEvent ev{};
    ev.type = SimEventType::CoinCollected;
    ev.rect = coin;
    run.events.push_back(ev);
    SpawnBurst(run, kSparkleBurst, kSparkleBurst.count, CenterX(coin),
               CenterY(coin));

    coins[i] = coins.back();
    coins.pop_back();
  }
}

// Returns true when the run ended this tick.
bool CheckHazards(RunState &run) {
  for (const auto &h : run.world.hazards) {
    if (!Intersects(run.player.rect, h)) {
      continue;
    }
    run.status = RunStatus::Dead;
    run.payout = static_cast<int>(
        std::floor(static_cast<float>(run.coinsRun) * run.params.coinMultiplier));

    SimEvent ev{};
    ev.type = SimEventType::Died;
    ev.rect = run.player.rect;
    ev.finalScore = run.score;
    ev.coins = run.coinsRun;
    ev.payout = run.payout;
    run.events.push_back(ev);

    SpawnBurst(run, kDeathBurst, kDeathBurst.count, CenterX(run.player.rect),
               CenterY(run.player.rect));
    LOG_INFO("Run over: score={} coins={} payout={} time={:.2f}s", run.score,
             run.coinsRun, run.payout, run.runTime);
    return true;
  }
  return false;
}
} // namespace

bool StartRun(RunState &run, const SimTuning &tuning, const RunParams &params,
              const uint32_t seed) {
  std::string error;
  if (!ValidateTuning(tuning, error) || !ValidateRunParams(params, error)) {
    LOG_ERROR("Refusing to start run: {}", error);
    run.status = RunStatus::Inactive;
    return false;
  }

  // Copies first: tuning/params may alias run's own fields (ResetRun).
  const SimTuning tuningCopy = tuning;
  const RunParams paramsCopy = params;
  run.tuning = tuningCopy;
  run.params = paramsCopy;
  run.seed = core::NormalizeSeed(seed);
  run.paused = false;
  run.camX = 0.0f;
  run.speed = tuningCopy.baseSpeed;
  run.scoreF = 0.0f;
  run.score = 0;
  run.coinsRun = 0;
  run.payout = 0;
  run.runTime = 0.0f;
  run.ticks = 0;
  run.events.clear();
  for (auto &p : run.particles) {
    p.active = false;
  }
  run.fxRngState = core::NormalizeSeed(run.seed ^ 0x9E3779B9u);

  run.generator.Initialize(run.seed, run.tuning, run.world);
  SpawnPlayer(run.player, run.tuning, run.camX, run.world.platforms.front());
  run.generator.EnsureAhead(run.world, run.tuning, run.camX, run.speed);

  run.status = RunStatus::Active;
  LOG_INFO("Run started: seed=0x{:08X} jumpV={:.0f} coyote={:.2f}s "
           "coinMul={:.2f} magnet={:.0f}px",
           run.seed, run.params.jumpVelocity, run.params.coyoteTime,
           run.params.coinMultiplier, run.params.magnetRadius);
  return true;
}

bool StartRunWithUpgrades(RunState &run, const SimTuning &tuning,
                          const UpgradeLevels &levels, const uint32_t seed) {
  std::string error;
  if (!ValidateUpgradeLevels(levels, error)) {
    LOG_ERROR("Refusing to start run: {}", error);
    run.status = RunStatus::Inactive;
    return false;
  }
  return StartRun(run, tuning, RunParamsFromUpgrades(levels), seed);
}

bool ResetRun(RunState &run, const uint32_t seed) {
  return StartRun(run, run.tuning, run.params, seed);
}

const std::vector<SimEvent> &StepRun(RunState &run, const TickInput &input,
                                     float dt) {
  run.events.clear();
  if (run.paused || run.status != RunStatus::Active) {
    return run.events;
  }
  dt = std::clamp(dt, 0.0f, cfg::kMaxTickDt);
  const SimTuning &t = run.tuning;

  run.speed = std::clamp(run.speed + t.speedRamp * dt, t.baseSpeed, t.maxSpeed);
  run.scoreF += run.speed * dt * t.scorePerPixel;
  run.score = static_cast<int>(std::floor(run.scoreF));
  run.runTime += dt;
  ++run.ticks;

  const PlayerStepResult step = StepPlayer(run.player, input, run.params, t,
                                           run.camX, run.world.platforms, dt);
  if (step.jumped) {
    SimEvent ev{};
    ev.type = SimEventType::Jumped;
    ev.rect = run.player.rect;
    run.events.push_back(ev);
  }
  if (step.landed) {
    SimEvent ev{};
    ev.type = SimEventType::Landed;
    ev.rect = run.player.rect;
    run.events.push_back(ev);
    SpawnBurst(run, kDustBurst,
               step.landedOnGround ? cfg::kLandingBurstGround
                                   : cfg::kLandingBurstPlatform,
               CenterX(run.player.rect), Bottom(run.player.rect));
  }

  run.camX += run.speed * dt;
  run.generator.EnsureAhead(run.world, t, run.camX, run.speed);
  CleanupWorld(run.world, run.camX, t.pruneMargin);

  ApplyMagnet(run, dt);
  CollectCoins(run);
  if (CheckHazards(run)) {
    return run.events;
  }

  UpdateParticles(run, dt);
  return run.events;
}

int CountActiveParticles(const RunState &run) {
  int count = 0;
  for (const auto &p : run.particles) {
    if (p.active) {
      ++count;
    }
  }
  return count;
}
