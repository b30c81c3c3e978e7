#pragma once

#include <raylib.h>

struct Game;
struct RunnerPalette;

namespace render {

// Score (7-segment), coin counter, speed gauge and money/best readout.
void RenderRunHUD(const Game &game, const RunnerPalette &pal);

// Centered overlay for the pause and game-over screens.
void RenderScreenOverlay(const Game &game, const RunnerPalette &pal);

} // namespace render
