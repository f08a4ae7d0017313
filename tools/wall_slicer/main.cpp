#include "WallElevationSVG.h"
#include "plan/HousePlanLoader.h"
#include "plan/HouseWallBuilder.h"
#include "plan/HouseWallsWriter.h"
#include "walls/WallSliceAnalyzer.h"
#include <SDL3/SDL_log.h>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>

void printUsage(const char* programName) {
    SDL_Log("Usage: %s <plan.json> [options]", programName);
    SDL_Log(" ");
    SDL_Log("Options:");
    SDL_Log("  -o, --output <path>       Output directory (default: current directory)");
    SDL_Log("  --epsilon <meters>        Cut tolerance (default: 0.01)");
    SDL_Log("  --story-height <meters>   Override the plan's story height");
    SDL_Log("  --exterior-only           Skip interior walls");
    SDL_Log("  --interior-only           Skip exterior walls");
    SDL_Log("  --serial                  Partition walls on one thread");
    SDL_Log("  --threads <n>             Maximum worker threads (default: all)");
    SDL_Log("  --svg                     Write one elevation SVG per wall");
    SDL_Log("  --show-bands              Draw band boundaries in the SVGs");
    SDL_Log("  --check                   Re-detect openings from the slices and report mismatches");
    SDL_Log("  -v, --verbose             Enable debug logging");
    SDL_Log("  -h, --help                Show this help message");
    SDL_Log(" ");
    SDL_Log("Output files:");
    SDL_Log("  walls.json                Every wall with its bands, slices and boxes");
    SDL_Log("  <wall name>.svg           Front elevation per wall (with --svg)");
}

// Compares the openings found in each wall's slices with what the plan asked for
static int checkWalls(const std::vector<wallslicer::BuiltWall>& walls) {
    wallslicer::WallSliceAnalyzer analyzer;
    int mismatches = 0;
    for (const auto& wall : walls) {
        int expected = static_cast<int>(analyzer.expectedOpeningCount(wall.partition, wall.openings));

        auto analysis = analyzer.analyze(wall.slices(), wall.span().height,
                                         wall.span().thickness, wall.span().length);
        int found = static_cast<int>(analysis.openings.size());
        if (found != expected) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "%s: expected %d openings, detected %d",
                        wall.name.c_str(), expected, found);
            ++mismatches;
        }
    }
    return mismatches;
}

int main(int argc, char* argv[]) {
    // Default parameters
    wallslicer::WallBuildParams params;
    wallslicer::RenderOptions renderOptions;
    std::string planPath;
    std::string outputDir = ".";
    bool writeSvg = false;
    bool runCheck = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        }
        else if ((strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--output") == 0) && i + 1 < argc) {
            outputDir = argv[++i];
        }
        else if (strcmp(argv[i], "--epsilon") == 0 && i + 1 < argc) {
            params.epsilon = static_cast<float>(std::atof(argv[++i]));
            if (params.epsilon <= 0.0f) params.epsilon = wallslicer::WALL_EPSILON;
        }
        else if (strcmp(argv[i], "--story-height") == 0 && i + 1 < argc) {
            params.storyHeightOverride = static_cast<float>(std::atof(argv[++i]));
        }
        else if (strcmp(argv[i], "--exterior-only") == 0) {
            params.includeInterior = false;
        }
        else if (strcmp(argv[i], "--interior-only") == 0) {
            params.includeExterior = false;
        }
        else if (strcmp(argv[i], "--serial") == 0) {
            params.parallel = false;
        }
        else if (strcmp(argv[i], "--threads") == 0 && i + 1 < argc) {
            int threads = std::atoi(argv[++i]);
            params.maxThreads = threads > 0 ? static_cast<unsigned int>(threads) : 0u;
        }
        else if (strcmp(argv[i], "--svg") == 0) {
            writeSvg = true;
        }
        else if (strcmp(argv[i], "--show-bands") == 0) {
            renderOptions.showBands = true;
        }
        else if (strcmp(argv[i], "--check") == 0) {
            runCheck = true;
        }
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_DEBUG);
        }
        else if (argv[i][0] != '-' && planPath.empty()) {
            planPath = argv[i];
        }
        else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Unknown option: %s", argv[i]);
        }
    }

    if (planPath.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    wallslicer::HousePlanLoader loader;
    if (!loader.loadFromJson(planPath)) {
        return 1;
    }
    const wallslicer::HousePlan& plan = loader.getPlan();

    SDL_Log("Wall Slicer");
    SDL_Log("===========");
    SDL_Log("Plan: %s", plan.name.c_str());
    SDL_Log("Rooms: %zu (%zu wall runs)", plan.rooms.size(), plan.wallCount());
    SDL_Log("Story height: %.2f m", params.storyHeightOverride > 0.0f ? params.storyHeightOverride : plan.storyHeight);
    SDL_Log("Tolerance: %.3f m", params.epsilon);
    SDL_Log(" ");

    params.onProgress = [](size_t done, size_t total, const std::string& task) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "  %s %zu/%zu", task.c_str(), done, total);
    };

    wallslicer::HouseWallBuilder builder(plan);
    wallslicer::HouseWalls walls = builder.build(params);

    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Could not create %s: %s", outputDir.c_str(), ec.message().c_str());
        return 1;
    }

    if (!wallslicer::writeHouseWallsJson(outputDir + "/walls.json", plan, walls)) {
        return 1;
    }

    if (writeSvg) {
        int failed = 0;
        for (const auto* group : {&walls.exterior, &walls.interior}) {
            for (const auto& wall : *group) {
                if (!wallslicer::writeWallElevationSVG(outputDir + "/" + wallslicer::sanitizeFileName(wall.name) + ".svg", wall, renderOptions)) {
                    ++failed;
                }
            }
        }
        if (failed > 0) {
            return 1;
        }
    }

    if (runCheck) {
        int mismatches = checkWalls(walls.exterior) + checkWalls(walls.interior);
        if (mismatches > 0) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Check: %d walls differ from their plan", mismatches);
        } else {
            SDL_Log("Check: all walls match their plan");
        }
    }

    SDL_Log(" ");
    SDL_Log("Done! %zu slices across %zu walls", walls.sliceCount(),
            walls.exterior.size() + walls.interior.size());

    return 0;
}
