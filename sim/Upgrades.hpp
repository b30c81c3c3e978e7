#pragma once

#include <string>

// Upgrade levels owned by the economy/save collaborator (0..kUpgradeMaxLevel).
struct UpgradeLevels {
  int jump = 0;
  int coyote = 0;
  int coinMult = 0;
  int magnet = 0;
};

// Per-run parameters derived once from UpgradeLevels and held immutable for
// the whole run.
struct RunParams {
  float jumpVelocity = 0.0f;   // px/s, applied upward
  float coyoteTime = 0.0f;     // seconds
  float coinMultiplier = 1.0f; // payout = floor(coins * multiplier)
  float magnetRadius = 0.0f;   // px, 0 disables the magnet
};

bool ValidateUpgradeLevels(const UpgradeLevels &levels, std::string &error);

RunParams RunParamsFromUpgrades(const UpgradeLevels &levels);

// Range check for params supplied directly (tests, tools) instead of through
// RunParamsFromUpgrades.
bool ValidateRunParams(const RunParams &params, std::string &error);
