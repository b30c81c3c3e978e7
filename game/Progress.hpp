#pragma once

#include <string>

#include "sim/Upgrades.hpp"

// Persistent player progress: the economy side of a run.
struct Progress {
  int money = 0;
  int bestScore = 0;
  UpgradeLevels upgrades{};
  std::string path; // file the progress was loaded from and is saved to
};

// Reads `path`. Missing or corrupt files (bad JSON, wrong types, levels out
// of range) yield default progress and a warning; this never fails.
Progress LoadProgress(const char *path);

// Writes `progress` to progress.path. Returns false on I/O failure.
bool SaveProgress(const Progress &progress);

// Adds the payout, keeps the best score and saves. Returns the save result;
// the in-memory progress is updated either way.
bool RecordRunResult(Progress &progress, int payout, int finalScore);

// Keeps the best score of a run abandoned before it ended (no payout) and
// saves. Returns the save result.
bool RecordAbandonedRun(Progress &progress, int score);
