#pragma once

#include <vector>

// Axis-aligned rectangle in world pixels. x grows along the scroll axis,
// y grows downward.
struct Rect {
  float x = 0.0f;
  float y = 0.0f;
  float w = 0.0f;
  float h = 0.0f;
};

inline float Right(const Rect &r) { return r.x + r.w; }
inline float Bottom(const Rect &r) { return r.y + r.h; }
inline float CenterX(const Rect &r) { return r.x + r.w * 0.5f; }
inline float CenterY(const Rect &r) { return r.y + r.h * 0.5f; }

// Half-open overlap test: rectangles that only share an edge do not
// intersect.
bool Intersects(const Rect &a, const Rect &b);

struct SweepResult {
  float floatY = 0.0f; // sub-pixel y after the sweep
  bool landed = false;
  bool bumped = false;
};

// Moves `player` vertically by `deltaY` against one-way platforms.
// The motion is split into steps of at most kSweepStepPx; after each step
// player.y is snapped to floor(floatY). A platform stops a falling player
// only if the player's bottom was at or above its top before the step, and
// stops a rising player only if the player's top was at or below its bottom.
// The first blocking platform ends the sweep.
SweepResult SweepVertical(Rect &player, float floatY, float deltaY,
                          const std::vector<Rect> &platforms);
