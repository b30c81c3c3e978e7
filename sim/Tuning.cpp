#include "sim/Tuning.hpp"

namespace {

bool Fail(std::string &error, const char *message) {
  error = message;
  return false;
}

bool IsProbability(const float p) { return p >= 0.0f && p <= 1.0f; }

} // namespace

bool ValidateTuning(const SimTuning &t, std::string &error) {
  if (t.viewportWidth <= 0.0f)
    return Fail(error, "viewportWidth must be positive");
  if (t.groundY <= 0.0f)
    return Fail(error, "groundY must be positive");
  if (t.starterHeight <= 0.0f || t.starterExtraWidth < 0.0f ||
      t.starterGap < 0.0f)
    return Fail(error, "starter strip dimensions must be positive");
  if (t.playerWidth <= 0.0f || t.playerHeight <= 0.0f)
    return Fail(error, "player dimensions must be positive");
  if (t.gravity <= 0.0f || t.maxFallSpeed <= 0.0f)
    return Fail(error, "gravity and maxFallSpeed must be positive");
  if (t.jumpBufferTime < 0.0f)
    return Fail(error, "jumpBufferTime must not be negative");
  if (t.jumpCutMultiplier <= 0.0f || t.jumpCutMultiplier > 1.0f)
    return Fail(error, "jumpCutMultiplier must be in (0, 1]");
  if (t.baseSpeed <= 0.0f || t.maxSpeed < t.baseSpeed)
    return Fail(error, "speeds must satisfy 0 < baseSpeed <= maxSpeed");
  if (t.speedRamp < 0.0f || t.scorePerPixel < 0.0f)
    return Fail(error, "speedRamp and scorePerPixel must not be negative");
  if (t.horizonViewports <= 0.0f || t.pruneMargin < 0.0f)
    return Fail(error, "horizonViewports must be positive, pruneMargin >= 0");
  if (t.platformMinW <= 0 || t.platformMaxW < t.platformMinW)
    return Fail(error, "platform width range is invalid");
  if (t.platformMinH <= 0 || t.platformMaxH < t.platformMinH)
    return Fail(error, "platform height range is invalid");
  if (t.minGap < 0 || t.maxGap < t.minGap)
    return Fail(error, "gap range is invalid");
  if (t.maxStepSlow <= 0.0f || t.maxStepFast <= 0.0f)
    return Fail(error, "maximum height steps must be positive");
  if (!IsProbability(t.hazardChance) || !IsProbability(t.hazardFastFactor) ||
      !IsProbability(t.coinChance) || !IsProbability(t.coinArcChance))
    return Fail(error, "chances must be within [0, 1]");
  if (t.minReactionTime < 0.0f || t.maxReactionTime < t.minReactionTime)
    return Fail(error, "reaction window is invalid");
  if (t.minHazardSepTime < 0.0f)
    return Fail(error, "minHazardSepTime must not be negative");
  if (t.hazardMinW <= 0 || t.hazardMaxW < t.hazardMinW ||
      t.hazardMinH <= 0 || t.hazardMaxH < t.hazardMinH)
    return Fail(error, "hazard size range is invalid");
  if (t.hazardMaxW > t.platformMinW)
    return Fail(error, "hazards must fit on the narrowest platform");
  if (t.coinClusterMin < 1 || t.coinClusterMax < t.coinClusterMin)
    return Fail(error, "coin cluster range is invalid");
  if (t.coinSpacing <= 0.0f)
    return Fail(error, "coinSpacing must be positive");
  if (t.magnetStrength < 0.0f)
    return Fail(error, "magnetStrength must not be negative");
  return true;
}
