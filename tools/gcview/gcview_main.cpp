// gcview: CLI that parses a G-code file and reports its toolpath and run time.
//
// Usage: gcview [--profile FILE] [--verbose] FILE.nc
//   --profile FILE  machine profile JSON (rates, accelerations, tool change times)
//   --verbose       debug logging

#include <cstdio>
#include <iostream>
#include <string>

#include "core/gcode/gcode_parser.h"
#include "core/gcode/machine_profile.h"
#include "core/gcode/playback_index.h"
#include "core/gcode/time_estimator.h"
#include "core/utils/file_utils.h"
#include "core/utils/log.h"

using namespace gv;

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--profile FILE] [--verbose] FILE.nc\n";
}

std::string formatPoint(const Vec3& p) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "(%.3f, %.3f, %.3f)", static_cast<double>(p.x),
                  static_cast<double>(p.y), static_cast<double>(p.z));
    return buf;
}

} // namespace

int main(int argc, char* argv[]) {
    log::setLevel(log::Level::Info);

    Path inputPath;
    Path profilePath;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose") {
            log::setLevel(log::Level::Debug);
        } else if (arg == "--profile") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --profile needs a file.\n";
                printUsage(argv[0]);
                return 1;
            }
            profilePath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else {
            inputPath = arg;
        }
    }

    if (inputPath.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    gcode::MachineProfile profile = gcode::MachineProfile::defaultProfile();
    if (!profilePath.empty()) {
        auto json = file::readText(profilePath);
        if (!json) {
            std::cerr << "Error: could not read profile: " << profilePath << "\n";
            return 1;
        }
        profile = gcode::MachineProfile::fromJsonString(*json);
        if (!profile.isValid()) {
            std::cerr << "Error: profile has non-positive rates or accelerations: "
                      << profilePath << "\n";
            return 1;
        }
    }

    gcode::Parser parser;
    gcode::Program program = parser.parseFile(inputPath);
    if (!parser.lastError().empty()) {
        std::cerr << "Error: " << parser.lastError() << "\n";
        return 1;
    }

    gcode::TimeEstimator estimator(profile);
    gcode::TimeEstimate estimate = estimator.estimate(program.segments);
    gcode::PlaybackIndex index(program.segments, estimate.totalSeconds);

    std::cout << "File:      " << inputPath.string() << "\n";
    std::cout << "Profile:   " << profile.name << "\n";
    std::cout << "Lines:     " << program.lineCount << "\n";
    std::cout << "Segments:  " << program.segments.size() << "\n";
    if (program.arcErrorCount > 0) {
        std::cout << "Arc errors: " << program.arcErrorCount << "\n";
    }

    if (program.bounds.isValid()) {
        std::cout << "Bounds:    " << formatPoint(program.bounds.min) << " - "
                  << formatPoint(program.bounds.max) << "\n";
    } else {
        std::cout << "Bounds:    -\n";
    }

    std::printf("Cutting:   %.1f mm\n", index.totalDistance());
    std::printf("Rapids:    %.1f mm\n", estimate.rapidPathLength);
    std::cout << "Tool changes: " << estimate.manualToolChanges << " manual, "
              << estimate.automaticToolChanges << " automatic\n";
    std::cout << "Total time: " << gcode::TimeEstimator::formatDuration(estimate.totalSeconds)
              << "\n";

    auto tools = program.tools.usedTools(program.segments);
    if (!tools.empty()) {
        std::cout << "\nTools:\n";
        for (const auto& tool : tools) {
            char color[8];
            std::snprintf(color, sizeof(color), "%06x", program.tools.colorValueFor(tool.number));
            std::cout << "  T" << tool.number << "  #" << color << "  "
                      << gcode::TimeEstimator::formatDuration(estimate.toolSecondsFor(tool.number))
                      << "  " << tool.name << "\n";
        }
    }

    return 0;
}
