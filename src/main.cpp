#include "core/CompletionLedger.hpp"
#include "core/ConsoleReporter.hpp"
#include "core/EpisodeProcessor.hpp"
#include "core/HttpClient.hpp"
#include "core/PodcastFeed.hpp"
#include "core/ResumableTransfer.hpp"
#include "core/Settings.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

using namespace podfetch::core;

namespace {

std::atomic<bool> g_cancelled{false};

void signalHandler(int) {
    g_cancelled = true;
}

void printHelp() {
    std::cout << "\npodfetch - download every episode of a podcast feed exactly once\n"
              << "Usage: podfetch [options] [command] [arguments]\n\n"
              << "Commands:\n"
              << "  run                  - Download new episodes (default)\n"
              << "  list                 - List episodes recorded as downloaded\n"
              << "  forget <name>        - Remove a recorded episode so the next run fetches it again\n"
              << "  help                 - Show this help\n\n"
              << "Options:\n"
              << "  -s, --skip           - Record new episodes as downloaded without transferring them\n"
              << "  --config <file>      - Read settings from a JSON file\n"
              << "  --help               - Show this help\n\n"
              << "Environment:\n"
              << "  PODFETCH_FEED_URL      Feed to poll (required for run)\n"
              << "  PODFETCH_BLOCK_SIZE    Bytes per write (default 1048576)\n"
              << "  PODFETCH_DESTINATION   Download directory (default: current directory)\n"
              << "  PODFETCH_LEDGER        Ledger database (default: podfetch.sqlite)\n"
              << "  PODFETCH_MAX_ATTEMPTS  Give up a transfer after this many network errors (default: never)\n\n";
}

int runFeed(const Settings& settings) {
    settings.validate();

    CompletionLedger ledger(settings.ledgerPath);

    PodcastFeed feed;
    feed.loadFromUrl(settings.feedUrl);

    std::cout << "Feed: " << feed.getTitle() << "\n"
              << "Destination: " << settings.destination << "\n"
              << "Blocksize: " << settings.blockSize << "\n"
              << (settings.skip ? "Skip mode: new episodes are recorded, not downloaded\n" : "")
              << "\n";

    CprHttpClient client;
    ResumableTransfer transfer(client, g_cancelled);
    transfer.setMaxAttempts(settings.maxAttempts);

    ProcessorOptions options;
    options.destination = settings.destination;
    options.extension = settings.extension;
    options.blockSize = settings.blockSize;
    options.skipMode = settings.skip;

    ConsoleReporter reporter;
    EpisodeProcessor processor(ledger, transfer, options, &reporter);
    BatchSummary summary = processor.run(feed, g_cancelled);

    std::cout << "\n" << summary.seen << " episodes: "
              << summary.downloaded << " downloaded, "
              << summary.skipped << " already present, "
              << summary.recorded << " recorded without download, "
              << summary.failed << " failed\n";

    if (summary.cancelled) {
        std::cout << "Program interrupted by user. Exiting.\n";
    }
    return 0;
}

int handleCommand(const Settings& settings, const std::string& command, const std::vector<std::string>& args) {
    if (command == "run") {
        return runFeed(settings);
    }
    else if (command == "list") {
        CompletionLedger ledger(settings.ledgerPath);
        auto entries = ledger.entries();
        if (entries.empty()) {
            std::cout << "No episodes recorded.\n";
            return 0;
        }
        for (const auto& entry : entries) {
            std::cout << entry << "\n";
        }
        std::cout << std::string(60, '-') << "\n"
                  << entries.size() << " episodes recorded in " << ledger.path() << "\n";
        return 0;
    }
    else if (command == "forget") {
        if (args.empty()) {
            std::cout << "Usage: forget <name>\n";
            return 1;
        }
        CompletionLedger ledger(settings.ledgerPath);
        if (!ledger.contains(args[0])) {
            std::cout << "Not recorded: " << args[0] << "\n";
            return 0;
        }
        ledger.remove(args[0]);
        std::cout << "Forgot " << args[0] << "; it will be downloaded again if it is not on disk\n";
        return 0;
    }
    else if (command == "help") {
        printHelp();
        return 0;
    }

    std::cout << "Unknown command. Type 'help' for available commands.\n";
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    // Set up signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        bool skip = false;
        std::string configFile;
        std::vector<std::string> commands;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                printHelp();
                return 0;
            } else if (arg == "-s" || arg == "--skip") {
                skip = true;
            } else if (arg == "--config") {
                if (i + 1 >= argc) {
                    std::cerr << "--config needs a file argument\n";
                    return 1;
                }
                configFile = argv[++i];
            } else {
                commands.push_back(arg);
            }
        }

        Settings settings;
        if (!configFile.empty()) {
            settings.loadFile(configFile);
        }
        settings.applyEnvironment();
        if (skip) {
            settings.skip = true;
        }

        std::string command = commands.empty() ? "run" : commands[0];
        std::vector<std::string> args;
        if (!commands.empty()) {
            args.assign(commands.begin() + 1, commands.end());
        }

        return handleCommand(settings, command, args);
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
