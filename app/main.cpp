#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include <app/Application.hpp>
#include <core/Logger.hpp>

/**
 * @brief Parse command line arguments
 */
struct CommandLineArgs {
    EigenPlayer::ApplicationParams params;
    bool showHelp = false;
    std::string error;

    static CommandLineArgs Parse(int argc, char* argv[]) {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.showHelp = true;
            } else if (arg == "-c" || arg == "--config") {
                if (i + 1 < argc) {
                    args.params.configPath = argv[++i];
                } else {
                    args.error = "--config needs a path";
                }
            } else if (arg == "-s" || arg == "--script") {
                if (i + 1 < argc) {
                    args.params.scriptPath = argv[++i];
                } else {
                    args.error = "--script needs a path";
                }
            } else if (arg == "--no-audio") {
                args.params.enableAudio = false;
            } else {
                args.error = "unknown option '" + std::string(arg) + "'";
            }
        }

        return args;
    }

    static void PrintHelp() {
        std::cout << "EigenPlayer - terminal music player\n\n";
        std::cout << "Usage: eigenplayer [options]\n\n";
        std::cout << "Options:\n";
        std::cout << "  -h, --help          Show this help message\n";
        std::cout << "  -c, --config PATH   Configuration file (default: config.json)\n";
        std::cout << "  -s, --script PATH   Python script to run at startup\n";
        std::cout << "      --no-audio      Run without sound output\n";
    }
};

int main(int argc, char* argv[]) {
    auto args = CommandLineArgs::Parse(argc, argv);

    if (args.showHelp) {
        CommandLineArgs::PrintHelp();
        return EXIT_SUCCESS;
    }
    if (!args.error.empty()) {
        std::cerr << "eigenplayer: " << args.error << "\n";
        CommandLineArgs::PrintHelp();
        return EXIT_FAILURE;
    }

    EigenPlayer::Logger::Initialize();

    int status = EXIT_SUCCESS;
    {
        EigenPlayer::Application app;
        if (app.Initialize(args.params)) {
            app.Run(std::cin, std::cout);
            app.Shutdown();
        } else {
            status = EXIT_FAILURE;
        }
    }

    EigenPlayer::Logger::Shutdown();
    return status;
}
