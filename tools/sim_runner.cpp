// sim_runner: headless run validator
//
// Runs the simulation without a window using a deterministic bot.
// Outputs structured metrics for generator tuning and regression testing.
//
// Usage:
//   sim_runner [options]
//     --seed <hex|dec>        Run seed (default: 0xC0FFEE)
//     --ticks <n>             Max sim ticks to run (default: 36000 = 5 min at 120Hz)
//     --bot <style>           Bot style: cautious|aggressive|random (default: cautious)
//     --upgrades <j,c,m,g>    Upgrade levels jump,coyote,coinMult,magnet (default: 0,0,0,0)
//     --tuning <file>         JSON tuning overrides
//     --json                  Output as JSON instead of plain text
//     --quiet                 Only output final summary line
//     -h, --help              Print usage

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "sim/Bot.hpp"
#include "sim/Sim.hpp"

namespace {

struct RunnerArgs {
    uint32_t seed = 0xC0FFEEu;
    int maxTicks = 36000;           // 5 minutes at 120 Hz
    BotStyle botStyle = BotStyle::Cautious;
    UpgradeLevels upgrades{};
    std::string tuningPath;
    bool json = false;
    bool quiet = false;
    bool help = false;
};

uint32_t ParseSeed(const char* str) {
    // Accept 0x prefix for hex, otherwise decimal.
    return static_cast<uint32_t>(std::strtoul(str, nullptr, 0));
}

BotStyle ParseBotStyle(const char* str) {
    if (std::strcmp(str, "aggressive") == 0) return BotStyle::Aggressive;
    if (std::strcmp(str, "random") == 0) return BotStyle::Random;
    return BotStyle::Cautious;
}

std::vector<int> ParseIntList(const char* str) {
    std::vector<int> result;
    std::string token;
    for (const char* c = str; ; ++c) {
        if (*c == ',' || *c == '\0') {
            if (!token.empty()) result.push_back(std::atoi(token.c_str()));
            token.clear();
            if (*c == '\0') break;
        } else {
            token.push_back(*c);
        }
    }
    return result;
}

UpgradeLevels ParseUpgrades(const char* str) {
    const std::vector<int> values = ParseIntList(str);
    UpgradeLevels levels{};
    if (values.size() > 0) levels.jump = values[0];
    if (values.size() > 1) levels.coyote = values[1];
    if (values.size() > 2) levels.coinMult = values[2];
    if (values.size() > 3) levels.magnet = values[3];
    return levels;
}

RunnerArgs ParseArgs(int argc, char* argv[]) {
    RunnerArgs args{};
    for (int i = 1; i < argc; ++i) {
        if ((std::strcmp(argv[i], "--seed") == 0) && i + 1 < argc) {
            args.seed = ParseSeed(argv[++i]);
        } else if ((std::strcmp(argv[i], "--ticks") == 0) && i + 1 < argc) {
            args.maxTicks = std::atoi(argv[++i]);
        } else if ((std::strcmp(argv[i], "--bot") == 0) && i + 1 < argc) {
            args.botStyle = ParseBotStyle(argv[++i]);
        } else if ((std::strcmp(argv[i], "--upgrades") == 0) && i + 1 < argc) {
            args.upgrades = ParseUpgrades(argv[++i]);
        } else if ((std::strcmp(argv[i], "--tuning") == 0) && i + 1 < argc) {
            args.tuningPath = argv[++i];
        } else if (std::strcmp(argv[i], "--json") == 0) {
            args.json = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            args.quiet = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            args.help = true;
        }
    }
    return args;
}

void PrintUsage() {
    std::printf(
        "sim_runner: headless endless-runner validator\n"
        "\n"
        "Usage: sim_runner [options]\n"
        "  --seed <hex|dec>        Run seed (default: 0xC0FFEE)\n"
        "  --ticks <n>             Max sim ticks (default: 36000 = 5 min)\n"
        "  --bot <style>           cautious|aggressive|random (default: cautious)\n"
        "  --upgrades <j,c,m,g>    Upgrade levels 0-%d (default: 0,0,0,0)\n"
        "  --tuning <file>         JSON tuning overrides\n"
        "  --json                  Output as JSON\n"
        "  --quiet                 Only final summary line\n"
        "  -h, --help              This message\n",
        cfg::kUpgradeMaxLevel
    );
}

const char* BotStyleName(BotStyle s) {
    switch (s) {
        case BotStyle::Cautious:   return "cautious";
        case BotStyle::Aggressive: return "aggressive";
        case BotStyle::Random:     return "random";
    }
    return "unknown";
}

}  // namespace

int main(int argc, char* argv[]) {
    const RunnerArgs args = ParseArgs(argc, argv);
    if (args.help) {
        PrintUsage();
        return 0;
    }

    // Metrics go to stdout; keep the log for problems only.
    Log::SetLevel(spdlog::level::warn);

    SimTuning tuning{};
    if (!args.tuningPath.empty() && !LoadTuningFromFile(tuning, args.tuningPath.c_str())) {
        std::fprintf(stderr, "sim_runner: could not load tuning from %s\n", args.tuningPath.c_str());
        return 2;
    }

    // --- Init run state ---
    RunState run{};
    if (!StartRunWithUpgrades(run, tuning, args.upgrades, args.seed)) {
        std::fprintf(stderr, "sim_runner: invalid run configuration\n");
        return 2;
    }

    Bot bot{};
    InitBot(bot, args.botStyle, args.seed ^ 0x12345678u);

    using Clock = std::chrono::steady_clock;
    const auto wallStart = Clock::now();

    int ticksRun = 0;
    int jumps = 0;
    int landings = 0;
    int maxParticles = 0;
    Rect deathRect{};

    for (int t = 0; t < args.maxTicks; ++t) {
        const TickInput input = BotInput(bot, run);
        const auto& events = StepRun(run, input, cfg::kFixedDt);
        ++ticksRun;

        for (const auto& ev : events) {
            switch (ev.type) {
                case SimEventType::Jumped: ++jumps; break;
                case SimEventType::Landed: ++landings; break;
                case SimEventType::Died: deathRect = ev.rect; break;
                case SimEventType::CoinCollected: break;
            }
        }
        const int active = CountActiveParticles(run);
        if (active > maxParticles) maxParticles = active;

        if (!IsRunActive(run)) break;
    }

    const auto wallEnd = Clock::now();
    const float wallMs = std::chrono::duration<float, std::milli>(wallEnd - wallStart).count();

    // --- Compute metrics ---
    const bool survived = IsRunActive(run);
    const int payout = survived
        ? static_cast<int>(static_cast<float>(run.coinsRun) * run.params.coinMultiplier)
        : run.payout;
    const float perfMsPer1k = (ticksRun > 0) ? (wallMs / (static_cast<float>(ticksRun) / 1000.0f)) : 0.0f;

    // --- Output ---
    if (args.json) {
        std::printf("{\n");
        std::printf("  \"seed\": \"0x%08X\",\n", args.seed);
        std::printf("  \"bot\": \"%s\",\n", BotStyleName(args.botStyle));
        std::printf("  \"ticks_run\": %d,\n", ticksRun);
        std::printf("  \"ticks_max\": %d,\n", args.maxTicks);
        std::printf("  \"sim_time\": %.2f,\n", run.runTime);
        std::printf("  \"distance\": %.1f,\n", run.camX);
        std::printf("  \"speed\": %.1f,\n", run.speed);
        std::printf("  \"score\": %d,\n", run.score);
        std::printf("  \"coins\": %d,\n", run.coinsRun);
        std::printf("  \"payout\": %d,\n", payout);
        std::printf("  \"jumps\": %d,\n", jumps);
        std::printf("  \"landings\": %d,\n", landings);
        std::printf("  \"chunks\": %d,\n", run.generator.chunksSpawned);
        std::printf("  \"max_particles\": %d,\n", maxParticles);
        std::printf("  \"status\": \"%s\",\n", survived ? "SURVIVED" : "DIED");
        std::printf("  \"death_pos\": [%.1f, %.1f],\n", deathRect.x, deathRect.y);
        std::printf("  \"wall_ms\": %.2f,\n", wallMs);
        std::printf("  \"perf_ms_per_1k\": %.3f\n", perfMsPer1k);
        std::printf("}\n");
    } else if (args.quiet) {
        std::printf("seed=0x%08X  status=%-8s  score=%-8d  coins=%-5d  dist=%-9.1f  time=%-7.2fs  perf=%.3fms/1k\n",
                    args.seed,
                    survived ? "SURVIVED" : "DIED",
                    run.score, run.coinsRun, run.camX, run.runTime, perfMsPer1k);
    } else {
        std::printf("=== Endless Runner Headless Sim Runner ===\n");
        std::printf("seed:       0x%08X\n", args.seed);
        std::printf("bot:        %s\n", BotStyleName(args.botStyle));
        std::printf("upgrades:   jump=%d coyote=%d coin=%d magnet=%d\n",
                    args.upgrades.jump, args.upgrades.coyote,
                    args.upgrades.coinMult, args.upgrades.magnet);
        std::printf("ticks:      %d / %d\n", ticksRun, args.maxTicks);
        std::printf("sim_time:   %.2f s\n", run.runTime);
        std::printf("distance:   %.1f px\n", run.camX);
        std::printf("speed:      %.1f / %.1f px/s\n", run.speed, run.tuning.maxSpeed);
        std::printf("score:      %d\n", run.score);
        std::printf("coins:      %d (payout %d)\n", run.coinsRun, payout);
        std::printf("jumps:      %d  landings: %d\n", jumps, landings);
        std::printf("chunks:     %d\n", run.generator.chunksSpawned);
        std::printf("status:     %s\n", survived ? "SURVIVED" : "DIED");
        if (!survived) {
            std::printf("death:      spike at (%.1f, %.1f)\n", deathRect.x, deathRect.y);
        }
        std::printf("wall_time:  %.2f ms\n", wallMs);
        std::printf("perf:       %.3f ms / 1000 ticks\n", perfMsPer1k);
    }

    Log::Shutdown();
    return survived ? 0 : 1;
}
