#include "sim/Geometry.hpp"

#include <cmath>

#include "core/Config.hpp"

bool Intersects(const Rect &a, const Rect &b) {
  return a.x < b.x + b.w && a.x + a.w > b.x && a.y < b.y + b.h &&
         a.y + a.h > b.y;
}

SweepResult SweepVertical(Rect &player, float floatY, const float deltaY,
                          const std::vector<Rect> &platforms) {
  SweepResult result{};
  result.floatY = floatY;
  if (deltaY == 0.0f) {
    return result;
  }

  const int steps =
      static_cast<int>(std::floor(std::fabs(deltaY) / cfg::kSweepStepPx)) + 1;
  const float step = deltaY / static_cast<float>(steps);

  for (int s = 0; s < steps; ++s) {
    const float prevTop = player.y;
    const float prevBottom = player.y + player.h;

    floatY += step;
    player.y = std::floor(floatY);

    if (step > 0.0f) {
      for (const auto &p : platforms) {
        if (Intersects(player, p) && prevBottom <= p.y) {
          player.y = p.y - player.h;
          result.floatY = player.y;
          result.landed = true;
          return result;
        }
      }
    } else {
      for (const auto &p : platforms) {
        if (Intersects(player, p) && prevTop >= p.y + p.h) {
          player.y = p.y + p.h;
          result.floatY = player.y;
          result.bumped = true;
          return result;
        }
      }
    }
  }

  result.floatY = floatY;
  return result;
}
