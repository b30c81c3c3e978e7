#pragma once

// Asset path helpers.
// Resolves paths against the nearest `assets/` directory found by walking up
// from the working directory, so the game, the headless runner and the tests
// all find the same tuning files whether started from the repo root or from
// a build directory.
//
// Usage:
//   SimTuning tuning{};
//   LoadTuningFromFile(tuning, assets::Path("tuning.json"));

namespace assets {

// Returns "<assets dir>/<relative>". The pointer stays valid until the next
// call on the same thread.
const char* Path(const char* relative);

// Convenience: check if an asset file exists before loading.
bool Exists(const char* relative);

}  // namespace assets
