#include "render/Render.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

#include <raylib.h>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "game/Game.hpp"
#include "render/HudWidgets.hpp"
#include "render/Palette.hpp"

namespace {

// --- Utility ---

float Clamp01(const float value) {
    if (value < 0.0f) return 0.0f;
    if (value > 1.0f) return 1.0f;
    return value;
}

float Lerp(const float a, const float b, const float t) {
    return a + (b - a) * Clamp01(t);
}

Color WithAlpha(const Color c, const float a) {
    return Color{c.r, c.g, c.b, static_cast<unsigned char>(255.0f * Clamp01(a))};
}

// --- Simple deterministic hash for seeded positions ---

uint32_t Hash(uint32_t x) {
    x ^= x >> 16;
    x *= 0x45d9f3bu;
    x ^= x >> 16;
    x *= 0x45d9f3bu;
    x ^= x >> 16;
    return x;
}

float HashFloat01(uint32_t seed) {
    return static_cast<float>(Hash(seed) & 0xFFFFu) / 65535.0f;
}

// Two parallax layers of hills, tiled every `period` px of world scroll.
void DrawParallax(const RunnerPalette& pal, const float camX) {
    DrawRectangleGradientV(0, 0, cfg::kScreenWidth, cfg::kScreenHeight,
                           pal.skyTop, pal.skyBottom);

    struct Layer { float factor; float period; float height; unsigned char alpha; };
    constexpr Layer kLayers[] = {
        {0.15f, 220.0f, 120.0f, 60},
        {0.35f, 160.0f, 80.0f, 100},
    };
    for (int li = 0; li < 2; ++li) {
        const Layer& layer = kLayers[li];
        const float scroll = camX * layer.factor;
        const int first = static_cast<int>(std::floor(scroll / layer.period)) - 1;
        const int count = static_cast<int>(cfg::kScreenWidth / layer.period) + 3;
        for (int i = first; i < first + count; ++i) {
            const float x = static_cast<float>(i) * layer.period - scroll;
            const float h = layer.height * (0.5f + 0.5f * HashFloat01(static_cast<uint32_t>(i * 31 + li)));
            const float baseY = cfg::kGroundY;
            DrawTriangle(Vector2{x + layer.period * 0.5f, baseY - h},
                         Vector2{x - layer.period * 0.3f, baseY},
                         Vector2{x + layer.period * 1.3f, baseY},
                         Color{pal.platformBody.r, pal.platformBody.g, pal.platformBody.b, layer.alpha});
        }
    }
}

void DrawSpike(const Rect& r, const Color col, const Color edge) {
    const float baseY = r.y + r.h;
    const float apexY = baseY - std::max(14.0f, r.h);
    const int teeth = SpikeToothCount(r.w);
    const float segW = r.w / static_cast<float>(teeth);
    for (int i = 0; i < teeth; ++i) {
        const float x0 = r.x + static_cast<float>(i) * segW;
        const float x1 = x0 + segW;
        // Counter-clockwise for raylib.
        DrawTriangle(Vector2{(x0 + x1) * 0.5f, apexY}, Vector2{x0, baseY},
                     Vector2{x1, baseY}, col);
    }
    DrawLineEx(Vector2{r.x, baseY}, Vector2{r.x + r.w, baseY}, 1.0f, edge);
}

Color ParticleColor(const RunnerPalette& pal, const ParticleKind kind) {
    switch (kind) {
        case ParticleKind::Dust: return pal.dust;
        case ParticleKind::Sparkle: return pal.sparkle;
        case ParticleKind::Burst: return pal.burst;
    }
    return pal.dust;
}

}  // namespace

int SpikeToothCount(const float width) {
    return std::max(3, static_cast<int>(std::floor(width / 20.0f)));
}

void InitRenderer() {
    LOG_INFO("Renderer ready ({}x{})", cfg::kScreenWidth, cfg::kScreenHeight);
}

void CleanupRenderer() {}

void RenderFrame(const Game& game, const float alpha, const float renderTime) {
    const RunState& run = game.run;
    const RunnerPalette& pal = GetPalette(game.paletteIndex);

    const float camX = Lerp(game.previousCamX, run.camX, alpha);
    float shakeX = 0.0f;
    float shakeY = 0.0f;
    if (game.deathFlashTimer > 0.0f) {
        const float k = game.deathFlashTimer * 20.0f;
        shakeX = std::sin(renderTime * 90.0f) * k;
        shakeY = std::cos(renderTime * 70.0f) * k;
    }
    const float ox = -camX + shakeX;

    BeginDrawing();
    ClearBackground(pal.skyBottom);
    DrawParallax(pal, camX);

    // Ground with highlight.
    const int groundY = static_cast<int>(run.tuning.groundY + shakeY);
    DrawRectangle(0, groundY, cfg::kScreenWidth, cfg::kScreenHeight - groundY, pal.ground);
    DrawRectangle(0, groundY, cfg::kScreenWidth, 6, WithAlpha(pal.groundEdge, 0.4f));

    for (const auto& p : run.world.platforms) {
        const int x = static_cast<int>(std::floor(p.x + ox));
        const int y = static_cast<int>(std::floor(p.y + shakeY));
        DrawRectangle(x, y, static_cast<int>(p.w), static_cast<int>(p.h), pal.platformBody);
        DrawRectangle(x, y, static_cast<int>(p.w), 3, pal.platformTop);
    }

    for (const auto& h : run.world.hazards) {
        DrawSpike(Rect{std::floor(h.x + ox), std::floor(h.y + shakeY), h.w, h.h},
                  pal.spike, pal.spikeEdge);
    }

    // Coins pulse and sparkle.
    const float pulse = 1.0f + 0.08f * std::sin(renderTime * 10.0f);
    for (const auto& c : run.world.coins) {
        const float cx = c.x + ox + c.w * 0.5f;
        const float cy = c.y + shakeY + c.h * 0.5f;
        const float rx = c.w * 0.5f * pulse;
        const float ry = c.h * 0.5f * pulse;
        DrawEllipse(static_cast<int>(cx), static_cast<int>(cy), rx + 6.0f, ry + 6.0f,
                    WithAlpha(pal.coin, 0.18f));
        DrawEllipse(static_cast<int>(cx), static_cast<int>(cy), rx, ry, pal.coin);
        DrawEllipseLines(static_cast<int>(cx), static_cast<int>(cy),
                         std::max(2.0f, rx - 3.0f), std::max(2.0f, ry - 3.0f), pal.coinShine);
        const float sparkle = 0.5f + 0.5f * std::sin(renderTime * 6.0f + c.x * 0.02f);
        DrawCircleV(Vector2{cx + 4.0f, cy - 4.0f}, 2.2f, WithAlpha(WHITE, 0.25f * sparkle));
    }

    for (const auto& p : run.particles) {
        if (!p.active) continue;
        const float a = p.maxLife > 0.0f ? p.life / p.maxLife : 0.0f;
        DrawCircleV(Vector2{p.x + ox, p.y + shakeY}, p.radius,
                    WithAlpha(ParticleColor(pal, p.kind), 0.85f * a));
    }

    // Player with squash on landing and stretch while rising.
    if (run.status != RunStatus::Dead) {
        const Rect& pr = run.player.rect;
        const float py = Lerp(game.previousPlayerY, pr.y, alpha);
        const float squash = Clamp01(game.landSquashTimer / 0.12f);
        const float stretch = run.player.grounded ? 0.0f : Clamp01(-run.player.vy / 900.0f);
        const float sx = 1.0f + 0.14f * stretch * 0.5f + 0.10f * squash;
        const float sy = 1.0f + 0.14f * stretch - 0.10f * squash;
        const float w = pr.w * sx;
        const float h = pr.h * sy;
        // The player is pinned to a fixed screen column.
        const float cx = run.tuning.playerOffsetX + shakeX + pr.w * 0.5f;
        const float bottom = std::floor(py + shakeY) + pr.h;
        DrawRectangleRounded(Rectangle{cx - w * 0.5f, bottom - h, w, h}, 0.35f, 6, pal.playerBody);
        const float eyeY = bottom - h + 16.0f;
        DrawRectangleRounded(Rectangle{cx - 12.0f, eyeY, 7.0f, 7.0f}, 0.4f, 4, pal.playerEye);
        DrawRectangleRounded(Rectangle{cx + 4.0f, eyeY, 7.0f, 7.0f}, 0.4f, 4, pal.playerEye);
    }

    for (const auto& p : game.popups) {
        if (!p.active) continue;
        DrawText("+1", static_cast<int>(p.x + ox) - 8, static_cast<int>(p.y + shakeY),
                 18, WithAlpha(pal.coin, p.life / 0.6f));
    }

    if (game.deathFlashTimer > 0.0f) {
        DrawRectangle(0, 0, cfg::kScreenWidth, cfg::kScreenHeight,
                      WithAlpha(WHITE, game.deathFlashTimer));
    }

    render::RenderRunHUD(game, pal);
    render::RenderScreenOverlay(game, pal);

    EndDrawing();
}
