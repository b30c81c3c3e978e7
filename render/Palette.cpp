#include "render/Palette.hpp"

#include "core/Config.hpp"

namespace {
constexpr RunnerPalette kPalettes[cfg::kPaletteCount] = {
    // Neon dusk: deep purple sky, cyan/magenta accents.
    RunnerPalette{
        /* skyTop       */ Color{18, 10, 42, 255},
        /* skyBottom    */ Color{52, 24, 86, 255},
        /* ground       */ Color{22, 32, 72, 255},
        /* groundEdge   */ Color{60, 160, 255, 255},
        /* platformBody */ Color{30, 42, 100, 255},
        /* platformTop  */ Color{80, 200, 255, 255},
        /* spike        */ Color{255, 56, 96, 255},
        /* spikeEdge    */ Color{255, 180, 200, 255},
        /* coin         */ Color{255, 200, 50, 255},
        /* coinShine    */ Color{255, 245, 190, 255},
        /* playerBody   */ Color{80, 255, 160, 255},
        /* playerEye    */ Color{10, 12, 24, 255},
        /* dust         */ Color{146, 234, 255, 255},
        /* sparkle      */ Color{255, 230, 120, 255},
        /* burst        */ Color{252, 96, 255, 255},
        /* uiPanel      */ Color{10, 12, 24, 170},
        /* uiText       */ Color{240, 248, 255, 255},
        /* uiAccent     */ Color{252, 96, 255, 255},
    },
    // Cyan sunrise: navy/teal sky, warm accents.
    RunnerPalette{
        /* skyTop       */ Color{16, 40, 82, 255},
        /* skyBottom    */ Color{255, 150, 90, 255},
        /* ground       */ Color{20, 42, 80, 255},
        /* groundEdge   */ Color{50, 180, 255, 255},
        /* platformBody */ Color{28, 56, 110, 255},
        /* platformTop  */ Color{86, 230, 255, 255},
        /* spike        */ Color{255, 100, 100, 255},
        /* spikeEdge    */ Color{255, 220, 140, 255},
        /* coin         */ Color{255, 210, 60, 255},
        /* coinShine    */ Color{255, 250, 210, 255},
        /* playerBody   */ Color{255, 160, 40, 255},
        /* playerEye    */ Color{8, 16, 30, 255},
        /* dust         */ Color{150, 246, 255, 255},
        /* sparkle      */ Color{255, 240, 150, 255},
        /* burst        */ Color{255, 118, 205, 255},
        /* uiPanel      */ Color{8, 16, 30, 168},
        /* uiText       */ Color{235, 245, 255, 255},
        /* uiAccent     */ Color{255, 118, 205, 255},
    },
    // Magenta storm: purple/violet sky, pink/green accents.
    RunnerPalette{
        /* skyTop       */ Color{42, 12, 66, 255},
        /* skyBottom    */ Color{8, 6, 18, 255},
        /* ground       */ Color{32, 18, 62, 255},
        /* groundEdge   */ Color{200, 80, 255, 255},
        /* platformBody */ Color{44, 28, 88, 255},
        /* platformTop  */ Color{255, 120, 240, 255},
        /* spike        */ Color{255, 60, 120, 255},
        /* spikeEdge    */ Color{255, 176, 72, 255},
        /* coin         */ Color{255, 200, 50, 255},
        /* coinShine    */ Color{255, 240, 200, 255},
        /* playerBody   */ Color{112, 230, 255, 255},
        /* playerEye    */ Color{16, 9, 28, 255},
        /* dust         */ Color{248, 166, 255, 255},
        /* sparkle      */ Color{255, 220, 110, 255},
        /* burst        */ Color{50, 255, 200, 255},
        /* uiPanel      */ Color{16, 9, 28, 174},
        /* uiText       */ Color{247, 238, 255, 255},
        /* uiAccent     */ Color{112, 230, 255, 255},
    },
};
}  // namespace

const RunnerPalette& GetPalette(int index) {
    int clamped = index;
    if (clamped < 0) {
        clamped = 0;
    } else if (clamped >= cfg::kPaletteCount) {
        clamped = cfg::kPaletteCount - 1;
    }
    return kPalettes[clamped];
}
