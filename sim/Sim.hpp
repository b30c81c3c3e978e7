#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "core/Config.hpp"
#include "sim/Geometry.hpp"
#include "sim/LevelGenerator.hpp"
#include "sim/Player.hpp"
#include "sim/Tuning.hpp"
#include "sim/Upgrades.hpp"

enum class RunStatus {
  Inactive, // never started, or StartRun rejected the configuration
  Active,
  Dead,     // terminal until ResetRun/StartRun
};

enum class SimEventType {
  Jumped,
  Landed,
  CoinCollected,
  Died,
};

// Outcome of one tick, in the order it happened. Consumed by the
// presentation layer for audio, particles and score popups.
struct SimEvent {
  SimEventType type = SimEventType::Landed;
  Rect rect{};        // player rect (Jumped/Landed/Died) or coin rect
  int finalScore = 0; // Died only
  int coins = 0;      // Died only
  int payout = 0;     // Died only
};

enum class ParticleKind : uint8_t {
  Dust,
  Sparkle,
  Burst,
};

struct Particle {
  bool active = false;
  ParticleKind kind = ParticleKind::Dust;
  float x = 0.0f;
  float y = 0.0f;
  float vx = 0.0f;
  float vy = 0.0f;
  float life = 0.0f;
  float maxLife = 0.0f;
  float radius = 0.0f;
};

// Everything one run attempt owns. Collaborators read it; they change it
// only through StartRun/ResetRun/StepRun and the paused flag.
struct RunState {
  SimTuning tuning{};
  RunParams params{};
  RunStatus status = RunStatus::Inactive;
  bool paused = false;
  uint32_t seed = 1u;

  float camX = 0.0f;
  float speed = 0.0f;
  float scoreF = 0.0f;
  int score = 0;
  int coinsRun = 0;
  int payout = 0;
  float runTime = 0.0f;
  uint64_t ticks = 0;

  PlayerSim player{};
  World world{};
  LevelGenerator generator{};

  std::array<Particle, cfg::kParticlePoolSize> particles{};
  uint32_t fxRngState = 1u;

  std::vector<SimEvent> events; // events of the most recent tick
};

// Validates tuning and params, then builds a fresh run: starter strip,
// player at rest on it, horizon filled. Returns false (run left Inactive)
// when the configuration is invalid.
bool StartRun(RunState &run, const SimTuning &tuning, const RunParams &params,
              uint32_t seed);

// Same as StartRun, deriving params from upgrade levels. Rejects levels
// outside [0, cfg::kUpgradeMaxLevel].
bool StartRunWithUpgrades(RunState &run, const SimTuning &tuning,
                          const UpgradeLevels &levels, uint32_t seed);

// Abandons the current run and starts a new one with the same tuning and
// params.
bool ResetRun(RunState &run, uint32_t seed);

// Advances an active, unpaused run by dt (clamped to [0, cfg::kMaxTickDt])
// and returns the events it produced. Paused, dead and inactive runs are left
// untouched and produce no events.
const std::vector<SimEvent> &StepRun(RunState &run, const TickInput &input,
                                     float dt);

inline bool IsRunActive(const RunState &run) {
  return run.status == RunStatus::Active;
}

int CountActiveParticles(const RunState &run);
