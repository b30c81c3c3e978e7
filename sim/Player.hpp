#pragma once

#include <vector>

#include "sim/Geometry.hpp"

struct SimTuning;
struct RunParams;

// Input edges for one tick. Press/release are edges and must be delivered at
// most once per tick; held is a level.
struct TickInput {
  bool jumpPressed = false;
  bool jumpHeld = false;
  bool jumpReleased = false;
};

struct PlayerSim {
  Rect rect{};            // rect.y is floor(floatY)
  float floatY = 0.0f;
  float vy = 0.0f;        // px/s, negative is up
  bool grounded = false;
  float coyoteTimer = 0.0f;
  float jumpBufferTimer = 0.0f;
  bool jumpCut = false;   // current jump already shortened
  float airTime = 0.0f;
};

struct PlayerStepResult {
  bool jumped = false;
  bool landed = false;         // airborne -> grounded this tick
  bool landedOnGround = false; // the landing was on the hard ground line
  bool bumped = false;
};

// Places the player at rest on top of `support` at the camera offset.
void SpawnPlayer(PlayerSim &player, const SimTuning &tuning, float camX,
                 const Rect &support);

// Advances the player by one tick: jump buffer, coyote time, jump, gravity,
// jump cut, horizontal pinning and the vertical sweep against `platforms`
// plus the hard ground line. Order matters; each rule sees the state left by
// the previous one.
PlayerStepResult StepPlayer(PlayerSim &player, const TickInput &input,
                            const RunParams &params, const SimTuning &tuning,
                            float camX, const std::vector<Rect> &platforms,
                            float dt);
