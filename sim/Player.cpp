#include "sim/Player.hpp"

#include <algorithm>
#include <cmath>

#include "core/Config.hpp"
#include "sim/Tuning.hpp"
#include "sim/Upgrades.hpp"

namespace {
constexpr float kContactEpsilon = 0.001f;

float ClampMinZero(const float value) {
  if (value < 0.0f) {
    return 0.0f;
  }
  return value;
}

// True if the player's bottom sits exactly on the ground line or on the top
// of a platform it horizontally overlaps.
bool IsSupported(const Rect &player, const SimTuning &tuning,
                 const std::vector<Rect> &platforms) {
  const float bottom = Bottom(player);
  if (std::fabs(bottom - tuning.groundY) < kContactEpsilon) {
    return true;
  }
  for (const auto &p : platforms) {
    if (std::fabs(bottom - p.y) < kContactEpsilon && player.x < Right(p) &&
        Right(player) > p.x) {
      return true;
    }
  }
  return false;
}
} // namespace

void SpawnPlayer(PlayerSim &player, const SimTuning &tuning, const float camX,
                 const Rect &support) {
  player = PlayerSim{};
  player.rect.w = tuning.playerWidth;
  player.rect.h = tuning.playerHeight;
  player.rect.x = std::floor(camX + tuning.playerOffsetX);
  player.rect.y = support.y - player.rect.h;
  player.floatY = player.rect.y;
  player.grounded = true;
}

PlayerStepResult StepPlayer(PlayerSim &player, const TickInput &input,
                            const RunParams &params, const SimTuning &tuning,
                            const float camX, const std::vector<Rect> &platforms,
                            const float dt) {
  PlayerStepResult result{};

  if (input.jumpPressed) {
    player.jumpBufferTimer = tuning.jumpBufferTime;
  } else {
    player.jumpBufferTimer = ClampMinZero(player.jumpBufferTimer - dt);
  }

  if (player.grounded) {
    player.coyoteTimer = params.coyoteTime;
    player.jumpCut = false;
    player.airTime = 0.0f;
  } else {
    player.coyoteTimer = ClampMinZero(player.coyoteTimer - dt);
    player.airTime += dt;
  }

  // Single trigger: a remembered press and remaining coyote time.
  if (player.jumpBufferTimer > 0.0f && player.coyoteTimer > 0.0f) {
    player.vy = -params.jumpVelocity;
    player.grounded = false;
    player.coyoteTimer = 0.0f;
    player.jumpBufferTimer = 0.0f;
    player.jumpCut = false;
    player.airTime = 0.0f;
    result.jumped = true;
  }

  // Applied on the jump tick too, so the launch loses one tick of gravity.
  player.vy = std::clamp(player.vy + tuning.gravity * dt, -cfg::kMaxRiseSpeed,
                         tuning.maxFallSpeed);

  if (input.jumpReleased && !player.grounded && !player.jumpCut &&
      player.vy < 0.0f) {
    player.vy *= tuning.jumpCutMultiplier;
    player.jumpCut = true;
  }

  player.rect.x = std::floor(camX + tuning.playerOffsetX);

  const bool wasGrounded = player.grounded;
  // Resting contact skips the sweep so grounded never flickers off for a tick.
  if (wasGrounded && !result.jumped &&
      IsSupported(player.rect, tuning, platforms)) {
    player.vy = 0.0f;
    player.floatY = player.rect.y;
    return result;
  }

  player.grounded = false;
  const float dy = player.vy * dt;
  const SweepResult sweep = SweepVertical(player.rect, player.floatY, dy, platforms);
  player.floatY = sweep.floatY;
  result.bumped = sweep.bumped;

  if (Bottom(player.rect) >= tuning.groundY) {
    // The ground line is the floor of the world.
    if (player.vy > 0.0f || Bottom(player.rect) > tuning.groundY) {
      player.rect.y = tuning.groundY - player.rect.h;
      player.floatY = player.rect.y;
    }
    if (player.vy > 0.0f) {
      player.vy = 0.0f;
      player.grounded = true;
      if (!wasGrounded) {
        result.landed = true;
        result.landedOnGround = true;
      }
    }
  } else if (sweep.landed) {
    player.vy = 0.0f;
    player.grounded = true;
    if (!wasGrounded) {
      result.landed = true;
    }
  }

  return result;
}
