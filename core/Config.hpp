#pragma once

namespace cfg {
constexpr int kScreenWidth = 960;
constexpr int kScreenHeight = 540;

constexpr float kFixedDt = 1.0f / 120.0f;
constexpr float kMaxFrameTime = 0.25f;
constexpr float kMaxTickDt = 0.05f; // stalls never integrate more than this

// --- World layout ---
constexpr float kViewportWidth = static_cast<float>(kScreenWidth);
constexpr float kGroundHeight = 80.0f;
constexpr float kGroundY = static_cast<float>(kScreenHeight) - kGroundHeight;
constexpr float kStarterHeight = 24.0f;
constexpr float kStarterExtraWidth = 1200.0f;
constexpr float kStarterGap = 140.0f;

// --- Player ---
constexpr float kPlayerWidth = 44.0f;
constexpr float kPlayerHeight = 58.0f;
constexpr float kPlayerScreenOffsetX = 160.0f;

// --- Kinematics ---
constexpr float kGravity = 2100.0f;
constexpr float kMaxFallSpeed = 1500.0f;
constexpr float kMaxRiseSpeed = 5000.0f;
constexpr float kJumpBufferTime = 0.12f;
constexpr float kJumpCutMultiplier = 0.55f;
constexpr float kSweepStepPx = 6.0f;

// --- Scroll speed and score ---
constexpr float kBaseSpeed = 320.0f;
constexpr float kMaxSpeed = 820.0f;
constexpr float kSpeedRamp = 7.0f;          // px/s gained per second
constexpr float kScorePerPixel = 0.02f;

// --- Level generation ---
constexpr float kHorizonViewports = 2.2f;
constexpr float kPruneMargin = 280.0f;
constexpr int kPlatformMinW = 160;
constexpr int kPlatformMaxW = 380;
constexpr int kPlatformMinH = 18;
constexpr int kPlatformMaxH = 28;
constexpr int kMinGap = 150;
constexpr int kMaxGap = 340;
constexpr int kHeightLevelCount = 4;
constexpr float kHeightLevels[kHeightLevelCount] = {0.0f, 70.0f, 120.0f, 170.0f};
constexpr float kContinuitySpeed = 520.0f;   // stronger height bias above this
constexpr int kContinuityExtraSlow = 2;
constexpr int kContinuityExtraFast = 3;
constexpr float kMaxStepSlow = 170.0f;
constexpr float kMaxStepFast = 125.0f;

constexpr float kHazardChance = 0.52f;
constexpr float kHazardFastSpeed = 650.0f;
constexpr float kHazardFastFactor = 0.78f;
constexpr float kMinReactionTime = 0.60f;
constexpr float kMaxReactionTime = 1.00f;
constexpr float kMinHazardSepTime = 0.70f;
constexpr float kHazardSpawnMargin = 70.0f;  // past the right screen edge
constexpr int kHazardMinW = 30;
constexpr int kHazardMaxW = 68;
constexpr int kHazardMinH = 32;
constexpr int kHazardMaxH = 62;
constexpr float kHazardSink = 2.0f;

constexpr float kCoinChance = 0.62f;
constexpr int kCoinClusterMin = 3;
constexpr int kCoinClusterMax = 7;
constexpr float kCoinSpacing = 34.0f;
constexpr float kCoinSize = 18.0f;
constexpr float kCoinLift = 54.0f;
constexpr float kCoinArcHeight = 18.0f;
constexpr float kCoinArcChance = 0.55f;
constexpr int kCoinEdgeInset = 20;

// --- Coin magnet ---
constexpr float kMagnetStrength = 2.8f;
constexpr float kMagnetDeadZone = 0.1f;

// --- Upgrades ---
constexpr int kUpgradeMaxLevel = 6;
constexpr float kBaseJumpVelocity = 880.0f;
constexpr float kJumpVelocityPerLevel = 50.0f;
constexpr float kBaseCoyoteTime = 0.10f;
constexpr float kCoyoteTimePerLevel = 0.02f;
constexpr float kCoinMultiplierPerLevel = 0.20f;
constexpr float kMagnetRadiusPerLevel = 26.0f;

// --- Particles (cosmetic, no gameplay impact) ---
constexpr int kParticlePoolSize = 256;
constexpr float kParticleGravity = 1600.0f;
constexpr float kParticleDrag = 0.985f;     // per 1/60 s
constexpr int kLandingBurstPlatform = 8;
constexpr int kLandingBurstGround = 10;
constexpr int kCoinBurstCount = 12;
constexpr int kDeathBurstCount = 22;

// --- Presentation ---
constexpr int kPaletteCount = 3;

// --- Controls ---
struct KeyConfig {
  int jump = 32;        // KEY_SPACE
  int jumpAlt = 87;     // KEY_W
  int jumpAlt2 = 265;   // KEY_UP
  int pause = 80;       // KEY_P
  int back = 256;       // KEY_ESCAPE
  int restart = 82;     // KEY_R
  int screenshot = 301; // KEY_F12
  int cyclePalette = 67; // KEY_C
};

extern KeyConfig keys;

} // namespace cfg
