#include "render/HudWidgets.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>

#include "core/Config.hpp"
#include "game/Game.hpp"
#include "render/Palette.hpp"

namespace render {

// ─── Internal helpers
// ─────────────────────────────────────────────────────────

static void DrawBeveledRectangle(int x, int y, int width, int height,
                                 Color base, int bevel = 2) {
  DrawRectangle(x, y, width, height, base);

  const Color hi =
      Color{static_cast<unsigned char>(std::min(255, base.r + 40)),
            static_cast<unsigned char>(std::min(255, base.g + 40)),
            static_cast<unsigned char>(std::min(255, base.b + 40)), base.a};
  const Color sh =
      Color{static_cast<unsigned char>(std::max(0, base.r - 40)),
            static_cast<unsigned char>(std::max(0, base.g - 40)),
            static_cast<unsigned char>(std::max(0, base.b - 40)), base.a};

  DrawRectangle(x, y, width, bevel, hi);
  DrawRectangle(x, y, bevel, height, hi);
  DrawRectangle(x, y + height - bevel, width, bevel, sh);
  DrawRectangle(x + width - bevel, y, bevel, height, sh);
}

// 7-segment patterns: top, upper-right, lower-right, bottom, lower-left,
// upper-left, middle
static constexpr uint8_t k7Seg[10] = {
    0b1111110, // 0
    0b0110000, // 1
    0b1101101, // 2
    0b1111001, // 3
    0b0110011, // 4
    0b1011011, // 5
    0b1011111, // 6
    0b1110000, // 7
    0b1111111, // 8
    0b1111011  // 9
};

static void DrawSegments(uint8_t pattern, int x, int y, int digitSize,
                         int thickness, Color color) {
  const int half = digitSize / 2;
  const int cx = x + half;
  const int cy = y + half;
  const int len = half;

  if (pattern & 0b1000000)
    DrawRectangle(cx - len / 2, y, len, thickness, color); // top
  if (pattern & 0b0100000)
    DrawRectangle(cx + len / 2, y + thickness, thickness, len,
                  color); // upper-right
  if (pattern & 0b0010000)
    DrawRectangle(cx + len / 2, cy, thickness, len, color); // lower-right
  if (pattern & 0b0001000)
    DrawRectangle(cx - len / 2, y + digitSize - thickness, len, thickness,
                  color); // bottom
  if (pattern & 0b0000100)
    DrawRectangle(cx - len / 2 - thickness, cy, thickness, len,
                  color); // lower-left
  if (pattern & 0b0000010)
    DrawRectangle(cx - len / 2 - thickness, y + thickness, thickness, len,
                  color); // upper-left
  if (pattern & 0b0000001)
    DrawRectangle(cx - len / 2, cy - thickness / 2, len, thickness,
                  color); // middle
}

static void Draw7SegmentNumber(int x, int y, const char *number, int digitSize,
                               int spacing, Color color, Color glowColor) {
  const int thickness = std::max(2, digitSize / 8);
  int curX = x;
  for (int i = 0; number[i] != '\0'; ++i) {
    if (number[i] < '0' || number[i] > '9') {
      curX += digitSize / 2;
      continue;
    }
    const uint8_t pattern = k7Seg[number[i] - '0'];
    for (int glow = 0; glow < 3; ++glow) {
      const Color gc = Color{glowColor.r, glowColor.g, glowColor.b,
                             static_cast<unsigned char>(80 / (glow + 1))};
      DrawSegments(pattern, curX + glow, y + glow, digitSize, thickness, gc);
    }
    DrawSegments(pattern, curX, y, digitSize, thickness, color);
    curX += digitSize + spacing;
  }
}

// Horizontal segmented bar, `fill` in [0, 1].
static void DrawSegmentedBar(int x, int y, int width, int height, int segCount,
                             float fill, Color fillColor, Color emptyColor) {
  const int gap = 2;
  const int segW = (width - gap * (segCount - 1)) / segCount;
  const int lit = static_cast<int>(std::round(fill * segCount));
  for (int i = 0; i < segCount; ++i) {
    DrawRectangle(x + i * (segW + gap), y, segW, height,
                  i < lit ? fillColor : emptyColor);
  }
}

static void DrawCenteredText(const char *text, int cy, int size, Color color) {
  const int w = MeasureText(text, size);
  DrawText(text, (cfg::kScreenWidth - w) / 2, cy, size, color);
}

// ─── Public widgets
// ─────────────────────────────────────────────────────────

void RenderRunHUD(const Game &game, const RunnerPalette &pal) {
  const RunState &run = game.run;
  char buf[64];

  // Score panel, top-left.
  DrawBeveledRectangle(12, 12, 220, 64, pal.uiPanel);
  DrawText("SCORE", 22, 18, 12, pal.uiText);
  std::snprintf(buf, sizeof(buf), "%06d", std::min(run.score, 999999));
  Draw7SegmentNumber(22, 34, buf, 28, 6, pal.uiAccent, pal.uiAccent);

  // Coins and speed, top-right.
  const int panelX = cfg::kScreenWidth - 232;
  DrawBeveledRectangle(panelX, 12, 220, 64, pal.uiPanel);
  DrawCircle(panelX + 22, 30, 8.0f, pal.coin);
  std::snprintf(buf, sizeof(buf), "x %d", run.coinsRun);
  DrawText(buf, panelX + 36, 22, 18, pal.uiText);
  if (run.params.coinMultiplier > 1.0f) {
    std::snprintf(buf, sizeof(buf), "(%.1fx)", run.params.coinMultiplier);
    DrawText(buf, panelX + 120, 24, 14, pal.coin);
  }

  const float speedRange = run.tuning.maxSpeed - run.tuning.baseSpeed;
  const float speedFill =
      speedRange > 0.0f ? (run.speed - run.tuning.baseSpeed) / speedRange : 1.0f;
  DrawText("SPEED", panelX + 10, 52, 12, pal.uiText);
  DrawSegmentedBar(panelX + 56, 52, 150, 12, 12,
                   std::clamp(speedFill, 0.0f, 1.0f), pal.uiAccent,
                   Color{40, 40, 60, 200});

  // Bank and best, below the score.
  std::snprintf(buf, sizeof(buf), "BANK %d   BEST %d", game.progress.money,
                game.progress.bestScore);
  DrawText(buf, 16, 84, 14, pal.uiText);

  if (game.screenshotNotificationTimer > 0.0f) {
    std::snprintf(buf, sizeof(buf), "Saved %s", game.screenshotPath);
    DrawText(buf, 16, cfg::kScreenHeight - 26, 14, pal.uiText);
  }
}

void RenderScreenOverlay(const Game &game, const RunnerPalette &pal) {
  if (game.screen == GameScreen::Playing)
    return;

  DrawRectangle(0, 0, cfg::kScreenWidth, cfg::kScreenHeight,
                Color{0, 0, 0, 120});
  const int panelW = 420;
  const int panelH = game.screen == GameScreen::Paused ? 130 : 210;
  const int panelX = (cfg::kScreenWidth - panelW) / 2;
  const int panelY = (cfg::kScreenHeight - panelH) / 2;
  DrawBeveledRectangle(panelX, panelY, panelW, panelH, pal.uiPanel, 3);

  char buf[96];
  if (game.screen == GameScreen::Paused) {
    DrawCenteredText("PAUSED", panelY + 24, 36, pal.uiAccent);
    DrawCenteredText("P / ESC resume    R restart", panelY + 84, 16,
                     pal.uiText);
    return;
  }

  const RunState &run = game.run;
  DrawCenteredText("GAME OVER", panelY + 20, 36, pal.uiAccent);
  std::snprintf(buf, sizeof(buf), "Score %d%s", run.score,
                game.newBest ? "  NEW BEST!" : "");
  DrawCenteredText(buf, panelY + 72, 20, pal.uiText);
  std::snprintf(buf, sizeof(buf), "Coins %d  ->  +%d", run.coinsRun,
                run.payout);
  DrawCenteredText(buf, panelY + 100, 20, pal.coin);
  std::snprintf(buf, sizeof(buf), "Bank %d", game.progress.money);
  DrawCenteredText(buf, panelY + 128, 18, pal.uiText);
  DrawCenteredText("SPACE / R new run    ESC quit", panelY + 170, 16,
                   pal.uiText);
}

} // namespace render
