#pragma once

#include <cstdint>
#include <vector>

#include "sim/Geometry.hpp"

struct SimTuning;

// Live world content. Platforms are one-way, hazards kill on contact, coins
// are collected on contact. Order carries no meaning: cleanup swap-removes.
struct World {
  std::vector<Rect> platforms;
  std::vector<Rect> hazards;
  std::vector<Rect> coins;
};

// Procedural, speed-aware chunk generator. Each chunk appends one platform,
// maybe one spike hazard on it and maybe one coin cluster above it, then
// advances the frontier. All randomness comes from rngState, so a seed fully
// determines the chunk sequence for a given (camX, speed) history.
struct LevelGenerator {
  uint32_t rngState = 1u;
  float nextSpawnX = 0.0f;      // generation frontier
  float lastPlatformTop = 0.0f; // for height continuity
  float lastHazardX = -1.0e7f;  // for minimum hazard separation
  int chunksSpawned = 0;

  // Clears `world`, lays the starter strip and seeds the RNG.
  void Initialize(uint32_t seed, const SimTuning &tuning, World &world);

  // Spawns chunks until the frontier reaches the horizon.
  void EnsureAhead(World &world, const SimTuning &tuning, float camX,
                   float speed);

  void SpawnChunk(World &world, const SimTuning &tuning, float camX,
                  float speed);

  // Furthest x that must be generated for a camera at camX.
  static float HorizonX(const SimTuning &tuning, float camX);

private:
  float PickPlatformTop(const SimTuning &tuning, float speed);
  void PlaceHazard(World &world, const SimTuning &tuning, const Rect &platform,
                   float camX, float speed);
  void PlaceCoins(World &world, const SimTuning &tuning, const Rect &platform);
};

// Removes every platform, hazard and coin whose right edge is more than
// pruneMargin behind camX.
void CleanupWorld(World &world, float camX, float pruneMargin);
