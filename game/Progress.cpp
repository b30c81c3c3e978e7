#include "game/Progress.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

#include "core/Log.hpp"

using json = nlohmann::json;

namespace {

constexpr int kSaveVersion = 1;

struct UpgradeField {
  const char *key;
  int UpgradeLevels::*member;
};

const UpgradeField kUpgradeFields[] = {
    {"jump", &UpgradeLevels::jump},
    {"coyote", &UpgradeLevels::coyote},
    {"coinMult", &UpgradeLevels::coinMult},
    {"magnet", &UpgradeLevels::magnet},
};

// Reads a non-negative integer field if present. Returns false on a wrong
// type or negative value.
bool ReadCount(const json &data, const char *key, int &out) {
  if (!data.contains(key))
    return true;
  const auto &val = data[key];
  if (!val.is_number_integer() || val.get<int>() < 0)
    return false;
  out = val.get<int>();
  return true;
}

} // namespace

Progress LoadProgress(const char *path) {
  Progress defaults{};
  defaults.path = path;

  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_WARN("No progress file at {}, starting fresh", path);
    return defaults;
  }

  Progress loaded = defaults;
  try {
    const json data = json::parse(f);
    if (!data.is_object()) {
      LOG_WARN("Progress file {} is not a JSON object, starting fresh", path);
      return defaults;
    }
    if (!ReadCount(data, "money", loaded.money) ||
        !ReadCount(data, "bestScore", loaded.bestScore)) {
      LOG_WARN("Progress file {} has invalid counters, starting fresh", path);
      return defaults;
    }
    if (data.contains("upgrades")) {
      const auto &ups = data["upgrades"];
      if (!ups.is_object()) {
        LOG_WARN("Progress file {} has invalid upgrades, starting fresh", path);
        return defaults;
      }
      for (const auto &field : kUpgradeFields) {
        if (!ReadCount(ups, field.key, loaded.upgrades.*field.member)) {
          LOG_WARN("Progress file {} has invalid upgrade '{}', starting fresh",
                   path, field.key);
          return defaults;
        }
      }
    }
  } catch (const json::exception &e) {
    LOG_WARN("Failed to parse progress file {}: {}", path, e.what());
    return defaults;
  }

  std::string error;
  if (!ValidateUpgradeLevels(loaded.upgrades, error)) {
    LOG_WARN("Progress file {} rejected: {}", path, error);
    return defaults;
  }

  LOG_INFO("Loaded progress from {}: money={} best={}", path, loaded.money,
           loaded.bestScore);
  return loaded;
}

bool SaveProgress(const Progress &progress) {
  if (progress.path.empty()) {
    LOG_ERROR("Cannot save progress: no file path");
    return false;
  }

  json data;
  data["version"] = kSaveVersion;
  data["money"] = progress.money;
  data["bestScore"] = progress.bestScore;
  json ups = json::object();
  for (const auto &field : kUpgradeFields) {
    ups[field.key] = progress.upgrades.*field.member;
  }
  data["upgrades"] = ups;

  std::ofstream f(progress.path, std::ios::trunc);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open progress file for writing: {}", progress.path);
    return false;
  }
  f << data.dump(2) << '\n';
  f.flush();
  if (!f) {
    LOG_ERROR("Failed to write progress file: {}", progress.path);
    return false;
  }
  return true;
}

bool RecordRunResult(Progress &progress, const int payout,
                     const int finalScore) {
  progress.money += std::max(0, payout);
  progress.bestScore = std::max(progress.bestScore, finalScore);
  return SaveProgress(progress);
}

bool RecordAbandonedRun(Progress &progress, const int score) {
  progress.bestScore = std::max(progress.bestScore, score);
  return SaveProgress(progress);
}
