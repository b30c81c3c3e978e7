#pragma once

#include <raylib.h>

struct RunnerPalette {
    Color skyTop{};
    Color skyBottom{};
    Color ground{};
    Color groundEdge{};
    Color platformBody{};
    Color platformTop{};
    Color spike{};
    Color spikeEdge{};
    Color coin{};
    Color coinShine{};
    Color playerBody{};
    Color playerEye{};
    // Particle tints by kind.
    Color dust{};
    Color sparkle{};
    Color burst{};
    Color uiPanel{};
    Color uiText{};
    Color uiAccent{};
};

const RunnerPalette& GetPalette(int index);
