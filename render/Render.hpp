#pragma once

struct Game;

void InitRenderer();
void CleanupRenderer();
void RenderFrame(const Game& game, float alpha, float renderTime);

// Number of triangles drawn for a spike of the given width.
int SpikeToothCount(float width);
