#include "sim/LevelGenerator.hpp"

#include <algorithm>
#include <cmath>

#include "core/Config.hpp"
#include "core/Rng.hpp"
#include "sim/Tuning.hpp"

namespace {
constexpr float kPi = 3.14159265358979f;

void PruneBehind(std::vector<Rect> &items, const float limitX) {
  size_t i = 0;
  while (i < items.size()) {
    if (Right(items[i]) < limitX) {
      items[i] = items.back();
      items.pop_back();
    } else {
      ++i;
    }
  }
}
} // namespace

void LevelGenerator::Initialize(const uint32_t seed, const SimTuning &tuning,
                                World &world) {
  rngState = core::NormalizeSeed(seed);
  lastHazardX = -1.0e7f;
  chunksSpawned = 0;

  world.platforms.clear();
  world.hazards.clear();
  world.coins.clear();

  const Rect starter{0.0f, tuning.groundY - tuning.starterHeight,
                     tuning.viewportWidth + tuning.starterExtraWidth,
                     tuning.starterHeight};
  world.platforms.push_back(starter);
  nextSpawnX = Right(starter) + tuning.starterGap;
  lastPlatformTop = starter.y;
}

float LevelGenerator::HorizonX(const SimTuning &tuning, const float camX) {
  return camX + tuning.viewportWidth * tuning.horizonViewports;
}

void LevelGenerator::EnsureAhead(World &world, const SimTuning &tuning,
                                 const float camX, const float speed) {
  // Every chunk advances the frontier by at least platformMinW + minGap,
  // which ValidateTuning keeps positive.
  const float horizon = HorizonX(tuning, camX);
  while (nextSpawnX < horizon) {
    SpawnChunk(world, tuning, camX, speed);
  }
}

float LevelGenerator::PickPlatformTop(const SimTuning &tuning,
                                      const float speed) {
  const float nominalTop = tuning.groundY - tuning.starterHeight;
  const float prevTop = lastPlatformTop;

  // The level closest to the previous platform gets extra weight so
  // consecutive platforms stay near the same height.
  float prevLevel = cfg::kHeightLevels[0];
  for (const float lvl : cfg::kHeightLevels) {
    const float candTop = nominalTop - lvl;
    const float bestTop = nominalTop - prevLevel;
    if (std::fabs(candTop - prevTop) < std::fabs(bestTop - prevTop)) {
      prevLevel = lvl;
    }
  }

  const int extra = (speed > tuning.continuitySpeed)
                        ? cfg::kContinuityExtraFast
                        : cfg::kContinuityExtraSlow;
  const int poolSize = cfg::kHeightLevelCount + extra;
  const int pick = core::NextInt(rngState, 0, poolSize - 1);
  const float lvl =
      (pick < cfg::kHeightLevelCount) ? cfg::kHeightLevels[pick] : prevLevel;

  float topY = nominalTop - lvl;
  const float maxStep = (speed < tuning.continuitySpeed) ? tuning.maxStepSlow
                                                         : tuning.maxStepFast;
  if (std::fabs(topY - prevTop) > maxStep) {
    topY = (topY > prevTop) ? prevTop + maxStep : prevTop - maxStep;
  }
  return std::floor(topY);
}

void LevelGenerator::SpawnChunk(World &world, const SimTuning &tuning,
                                const float camX, const float speed) {
  const float x = nextSpawnX;
  const int w = core::NextInt(rngState, tuning.platformMinW, tuning.platformMaxW);
  const int h = core::NextInt(rngState, tuning.platformMinH, tuning.platformMaxH);
  const float topY = PickPlatformTop(tuning, speed);

  const Rect platform{std::floor(x), topY, static_cast<float>(w),
                      static_cast<float>(h)};
  world.platforms.push_back(platform);

  float hazardChance = tuning.hazardChance;
  if (speed > tuning.hazardFastSpeed) {
    hazardChance *= tuning.hazardFastFactor;
  }
  if (core::NextFloat01(rngState) < hazardChance) {
    PlaceHazard(world, tuning, platform, camX, speed);
  }

  if (core::NextFloat01(rngState) < tuning.coinChance) {
    PlaceCoins(world, tuning, platform);
  }

  nextSpawnX = Right(platform) +
               static_cast<float>(core::NextInt(rngState, tuning.minGap, tuning.maxGap));
  lastPlatformTop = platform.y;
  ++chunksSpawned;
}

void LevelGenerator::PlaceHazard(World &world, const SimTuning &tuning,
                                 const Rect &platform, const float camX,
                                 const float speed) {
  const int hzW = core::NextInt(rngState, tuning.hazardMinW, tuning.hazardMaxW);
  const int hzH = core::NextInt(rngState, tuning.hazardMinH, tuning.hazardMaxH);

  // The candidate sits one reaction window (in ground covered at the current
  // speed) before the platform's leading edge; the clamp below then pulls it
  // onto the platform, so spikes mostly guard the landing spot.
  const int reactionMin = static_cast<int>(std::floor(speed * tuning.minReactionTime));
  const int reactionMax = static_cast<int>(std::floor(speed * tuning.maxReactionTime));
  const int leadX = static_cast<int>(std::floor(platform.x));
  float hx = static_cast<float>(
      core::NextInt(rngState, leadX - reactionMax, leadX - reactionMin));
  hx = std::max(hx, std::floor(camX + tuning.viewportWidth + cfg::kHazardSpawnMargin));

  const float minSep = speed * tuning.minHazardSepTime;
  if (hx - lastHazardX < minSep) {
    hx = std::ceil(lastHazardX + minSep);
  }

  const float maxX = Right(platform) - static_cast<float>(hzW);
  hx = std::clamp(hx, platform.x, std::max(platform.x, maxX));
  if (hx - lastHazardX < minSep) {
    // Clamping pulled it back too close to the previous spike.
    return;
  }

  const float spikeBottom = platform.y + cfg::kHazardSink;
  world.hazards.push_back(Rect{hx, spikeBottom - static_cast<float>(hzH),
                               static_cast<float>(hzW), static_cast<float>(hzH)});
  lastHazardX = hx;
}

void LevelGenerator::PlaceCoins(World &world, const SimTuning &tuning,
                                const Rect &platform) {
  const int n = core::NextInt(rngState, tuning.coinClusterMin, tuning.coinClusterMax);
  const int inset = cfg::kCoinEdgeInset;
  const int widthPx = static_cast<int>(platform.w);
  const float baseX = platform.x + static_cast<float>(core::NextInt(
                                       rngState, inset, std::max(inset, widthPx - inset)));
  const float baseY = platform.y - cfg::kCoinLift;
  const bool arc = core::NextFloat01(rngState) < tuning.coinArcChance;
  const float arcSpan = static_cast<float>(std::max(1, n - 1));

  for (int i = 0; i < n; ++i) {
    const float cx = baseX + static_cast<float>(i) * tuning.coinSpacing;
    float cy = baseY;
    if (arc) {
      // sin(pi) is slightly negative in float; the arc never dips below
      // the base line.
      cy -= std::floor(std::max(
          0.0f, cfg::kCoinArcHeight *
                    std::sin(static_cast<float>(i) / arcSpan * kPi)));
    }
    world.coins.push_back(Rect{std::floor(cx), cy, cfg::kCoinSize, cfg::kCoinSize});
  }
}

void CleanupWorld(World &world, const float camX, const float pruneMargin) {
  const float limitX = camX - pruneMargin;
  PruneBehind(world.platforms, limitX);
  PruneBehind(world.hazards, limitX);
  PruneBehind(world.coins, limitX);
}
