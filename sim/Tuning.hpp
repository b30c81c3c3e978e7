#pragma once

#include <string>

#include "core/Config.hpp"

// Runtime copy of every simulation tunable. Defaults come from cfg:: so a
// default-constructed SimTuning reproduces the shipped game; a JSON file can
// override individual fields (see LoadTuningFromFile).
struct SimTuning {
  // World layout
  float viewportWidth = cfg::kViewportWidth;
  float groundY = cfg::kGroundY;
  float starterHeight = cfg::kStarterHeight;
  float starterExtraWidth = cfg::kStarterExtraWidth;
  float starterGap = cfg::kStarterGap;

  // Player
  float playerWidth = cfg::kPlayerWidth;
  float playerHeight = cfg::kPlayerHeight;
  float playerOffsetX = cfg::kPlayerScreenOffsetX;

  // Kinematics
  float gravity = cfg::kGravity;
  float maxFallSpeed = cfg::kMaxFallSpeed;
  float jumpBufferTime = cfg::kJumpBufferTime;
  float jumpCutMultiplier = cfg::kJumpCutMultiplier;

  // Speed / score
  float baseSpeed = cfg::kBaseSpeed;
  float maxSpeed = cfg::kMaxSpeed;
  float speedRamp = cfg::kSpeedRamp;
  float scorePerPixel = cfg::kScorePerPixel;

  // Generation
  float horizonViewports = cfg::kHorizonViewports;
  float pruneMargin = cfg::kPruneMargin;
  int platformMinW = cfg::kPlatformMinW;
  int platformMaxW = cfg::kPlatformMaxW;
  int platformMinH = cfg::kPlatformMinH;
  int platformMaxH = cfg::kPlatformMaxH;
  int minGap = cfg::kMinGap;
  int maxGap = cfg::kMaxGap;
  float continuitySpeed = cfg::kContinuitySpeed;
  float maxStepSlow = cfg::kMaxStepSlow;
  float maxStepFast = cfg::kMaxStepFast;

  float hazardChance = cfg::kHazardChance;
  float hazardFastSpeed = cfg::kHazardFastSpeed;
  float hazardFastFactor = cfg::kHazardFastFactor;
  float minReactionTime = cfg::kMinReactionTime;
  float maxReactionTime = cfg::kMaxReactionTime;
  float minHazardSepTime = cfg::kMinHazardSepTime;
  int hazardMinW = cfg::kHazardMinW;
  int hazardMaxW = cfg::kHazardMaxW;
  int hazardMinH = cfg::kHazardMinH;
  int hazardMaxH = cfg::kHazardMaxH;

  float coinChance = cfg::kCoinChance;
  int coinClusterMin = cfg::kCoinClusterMin;
  int coinClusterMax = cfg::kCoinClusterMax;
  float coinSpacing = cfg::kCoinSpacing;
  float coinArcChance = cfg::kCoinArcChance;

  float magnetStrength = cfg::kMagnetStrength;
};

// Returns false and fills `error` when a field would produce degenerate
// geometry or an unbounded generator loop.
bool ValidateTuning(const SimTuning &tuning, std::string &error);

// Overrides fields of `tuning` from a flat JSON object keyed by field name.
// Unknown keys are ignored with a warning. On any error (missing file, parse
// failure, wrong type, validation failure) `tuning` is left untouched and
// false is returned.
bool LoadTuningFromFile(SimTuning &tuning, const char *path);
