#include "sim/Upgrades.hpp"

#include "core/Config.hpp"

namespace {

bool LevelInRange(const int level) {
  return level >= 0 && level <= cfg::kUpgradeMaxLevel;
}

} // namespace

bool ValidateUpgradeLevels(const UpgradeLevels &levels, std::string &error) {
  if (!LevelInRange(levels.jump) || !LevelInRange(levels.coyote) ||
      !LevelInRange(levels.coinMult) || !LevelInRange(levels.magnet)) {
    error = "upgrade levels must be within [0, " +
            std::to_string(cfg::kUpgradeMaxLevel) + "]";
    return false;
  }
  return true;
}

RunParams RunParamsFromUpgrades(const UpgradeLevels &levels) {
  RunParams params{};
  params.jumpVelocity = cfg::kBaseJumpVelocity +
                        cfg::kJumpVelocityPerLevel * static_cast<float>(levels.jump);
  params.coyoteTime = cfg::kBaseCoyoteTime +
                      cfg::kCoyoteTimePerLevel * static_cast<float>(levels.coyote);
  params.coinMultiplier =
      1.0f + cfg::kCoinMultiplierPerLevel * static_cast<float>(levels.coinMult);
  params.magnetRadius =
      cfg::kMagnetRadiusPerLevel * static_cast<float>(levels.magnet);
  return params;
}

bool ValidateRunParams(const RunParams &params, std::string &error) {
  if (params.jumpVelocity <= 0.0f) {
    error = "jumpVelocity must be positive";
    return false;
  }
  if (params.coyoteTime < 0.0f) {
    error = "coyoteTime must not be negative";
    return false;
  }
  if (params.coinMultiplier < 0.0f) {
    error = "coinMultiplier must not be negative";
    return false;
  }
  if (params.magnetRadius < 0.0f) {
    error = "magnetRadius must not be negative";
    return false;
  }
  return true;
}
