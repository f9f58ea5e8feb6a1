// Keepsake - Entry Point
// Parses command-line arguments and runs the application

#include "app.h"
#include <keepsake/keepsake.h>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

void printUsage() {
    std::cout << "Keepsake - Tap, play, remember\n\n";
    std::cout << "Usage:\n";
    std::cout << "  keepsake [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>        Config file (default keepsake.json)\n";
    std::cout << "  --profile <file>       Progress file (default keepsake_progress.json)\n";
    std::cout << "  --content <file>       Content override (objects, phrases, finale)\n";
    std::cout << "  --ambient <file>       Ambient track\n";
    std::cout << "  --final <file>         Finale track\n";
    std::cout << "  --chime <file>         Unlock chime\n";
    std::cout << "  --reduced-motion       Fewer particles, faster finale\n";
    std::cout << "  --headless             Fixed time step, no audio device\n";
    std::cout << "  --script <file>        Run commands from a file instead of stdin\n";
    std::cout << "  --fps <n>              Frames per second (default 60)\n";
    std::cout << "  --frames <n>           Stop after n frames\n";
    std::cout << "  --help                 Show this help\n";
}

} // namespace

int main(int argc, char** argv) {
    keepsake::AppConfig config;

    // Config file first so flags can override it
    bool configGiven = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config.configPath = argv[++i];
            configGiven = true;
        } else if (arg.rfind("--config=", 0) == 0) {
            config.configPath = arg.substr(9);
            configGiven = true;
        }
    }

    std::string error;
    if (std::filesystem::exists(config.configPath)) {
        if (!keepsake::loadConfigFile(config.configPath, config, error)) {
            std::cerr << "Warning: " << error << " (using defaults)\n";
        }
    } else if (configGiven) {
        std::cerr << "Warning: config file " << config.configPath.string() << " not found (using defaults)\n";
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if (arg.rfind("--config=", 0) == 0) {
            // handled above
        } else if (arg == "--profile" && i + 1 < argc) {
            config.profilePath = argv[++i];
        } else if (arg.rfind("--profile=", 0) == 0) {
            config.profilePath = arg.substr(10);
        } else if (arg == "--content" && i + 1 < argc) {
            config.contentPath = argv[++i];
        } else if (arg.rfind("--content=", 0) == 0) {
            config.contentPath = arg.substr(10);
        } else if (arg == "--ambient" && i + 1 < argc) {
            config.ambientPath = argv[++i];
        } else if (arg.rfind("--ambient=", 0) == 0) {
            config.ambientPath = arg.substr(10);
        } else if (arg == "--final" && i + 1 < argc) {
            config.finalPath = argv[++i];
        } else if (arg.rfind("--final=", 0) == 0) {
            config.finalPath = arg.substr(8);
        } else if (arg == "--chime" && i + 1 < argc) {
            config.chimePath = argv[++i];
        } else if (arg.rfind("--chime=", 0) == 0) {
            config.chimePath = arg.substr(8);
        } else if (arg == "--reduced-motion") {
            config.reducedMotion = true;
        } else if (arg == "--headless") {
            config.headless = true;
        } else if (arg == "--script" && i + 1 < argc) {
            config.scriptPath = argv[++i];
        } else if (arg.rfind("--script=", 0) == 0) {
            config.scriptPath = arg.substr(9);
        } else if (arg == "--fps" && i + 1 < argc) {
            config.fps = static_cast<float>(std::atof(argv[++i]));
        } else if (arg.rfind("--fps=", 0) == 0) {
            config.fps = static_cast<float>(std::atof(arg.substr(6).c_str()));
        } else if (arg == "--frames" && i + 1 < argc) {
            config.maxFrames = std::atoi(argv[++i]);
        } else if (arg.rfind("--frames=", 0) == 0) {
            config.maxFrames = std::atoi(arg.substr(9).c_str());
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            return 1;
        }
    }

    if (config.headless && config.scriptPath.empty() && config.maxFrames == 0) {
        std::cerr << "Warning: --headless without --script or --frames reads commands from stdin\n";
        std::cerr << "         and runs until 'quit' or end of input.\n";
    }

    std::cout << "Keepsake " << KEEPSAKE_VERSION_MAJOR << "." << KEEPSAKE_VERSION_MINOR << "."
              << KEEPSAKE_VERSION_PATCH << " - Starting..." << std::endl;

    keepsake::Application app;

    int initResult = app.init(config);
    if (initResult != 0) {
        return initResult;
    }

    return app.run();
}
