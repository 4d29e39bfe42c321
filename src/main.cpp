#include "console_dispatcher.hpp"
#include "engine_config.hpp"
#include "json_dispatcher.hpp"
#include "line_archive.hpp"
#include "output_channel.hpp"
#include "tail_engine.hpp"
#include "tail_log.hpp"

#include <unistd.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace watchlogs;

std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

void print_usage(const char* program) {
    std::cout << "watchlogs - follow several growing log files at once\n\n";
    std::cout << "Usage: " << program << " [options] [FILE...]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --log_files A,B,...      Comma-separated list of files to watch\n";
    std::cout << "  --config PATH            JSON engine config (flags below override it)\n";
    std::cout << "  --poll-interval SECONDS  Delay between checks, 0 disables throttling (default: 0.2)\n";
    std::cout << "  --backfill N|all         Existing lines to show on attach (default: all)\n";
    std::cout << "  --heartbeat              Report files that have gone quiet\n";
    std::cout << "  --heartbeat-interval S   Seconds between idle reports (default: 1)\n";
    std::cout << "  --mode auto|notify|poll  Change detection (default: auto)\n";
    std::cout << "  --missing-retries N      Checks before a vanished file is dropped (default: 2)\n";
    std::cout << "  --json                   Write events as JSON lines\n";
    std::cout << "  --archive PATH           Also record events in a SQLite database\n";
    std::cout << "  --no-color               Plain text output\n";
    std::cout << "  --verbose                Extra diagnostics\n";
    std::cout << "  --help                   Show this help message\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program << " --log_files train.log,eval.log --backfill 20 --heartbeat\n";
}

std::vector<std::string> split_list(const std::string& list) {
    std::vector<std::string> items;
    std::istringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> files;
    std::optional<std::string> config_path;
    std::optional<std::string> archive_path;
    std::optional<double> poll_interval;
    std::optional<int> backfill_lines;
    std::optional<double> heartbeat_interval;
    std::optional<SourceMode> mode;
    std::optional<int> missing_retries;
    bool heartbeat = false;
    bool json = false;
    bool use_color = isatty(STDOUT_FILENO) != 0;
    bool verbose = false;

    // Parse command line arguments
    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            }
            else if ((arg == "--log_files" || arg == "--log-files") && i + 1 < argc) {
                for (auto& f : split_list(argv[++i])) files.push_back(f);
            }
            else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            }
            else if (arg == "--poll-interval" && i + 1 < argc) {
                poll_interval = std::stod(argv[++i]);
            }
            else if (arg == "--backfill" && i + 1 < argc) {
                std::string value = argv[++i];
                backfill_lines = value == "all" ? -1 : std::stoi(value);
            }
            else if (arg == "--heartbeat") {
                heartbeat = true;
            }
            else if (arg == "--heartbeat-interval" && i + 1 < argc) {
                heartbeat_interval = std::stod(argv[++i]);
            }
            else if (arg == "--mode" && i + 1 < argc) {
                mode = string_to_source_mode(argv[++i]);
            }
            else if (arg == "--missing-retries" && i + 1 < argc) {
                missing_retries = std::stoi(argv[++i]);
            }
            else if (arg == "--json") {
                json = true;
            }
            else if (arg == "--archive" && i + 1 < argc) {
                archive_path = argv[++i];
            }
            else if (arg == "--no-color") {
                use_color = false;
            }
            else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            }
            else if (!arg.empty() && arg[0] != '-') {
                files.push_back(arg);
            }
            else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        return 1;
    }

    if (files.empty()) {
        std::cerr << "No files to watch" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        EngineConfig config = config_path ? load_config(*config_path) : EngineConfig{};
        if (poll_interval) config.poll_interval = *poll_interval;
        if (backfill_lines) config.backfill_lines = *backfill_lines;
        if (heartbeat) config.heartbeat_enabled = true;
        if (heartbeat_interval) config.heartbeat_interval = *heartbeat_interval;
        if (mode) config.mode = *mode;
        if (missing_retries) config.missing_retries = *missing_retries;
        config.halting = []() { return !running; };
        config.validate();

        TailLog::set_verbose(verbose);

        std::vector<std::string> resolved;
        for (const auto& f : files) {
            resolved.push_back(TailEngine::resolve_path(f));
        }

        OutputChannel channel;

        std::unique_ptr<ConsoleDispatcher> console;
        std::unique_ptr<JsonDispatcher> json_out;
        if (json) {
            json_out = std::make_unique<JsonDispatcher>(std::cout);
            json_out->attach(channel);
        } else {
            console = std::make_unique<ConsoleDispatcher>(std::cout, resolved, use_color);
            console->attach(channel);
            TailLog::set_sink(console->get_log_sink());
        }

        std::unique_ptr<LineArchive> archive;
        if (archive_path) {
            archive = std::make_unique<LineArchive>(*archive_path);
            TailLog::log("Archive", "Recording to " + *archive_path + " (" +
                         std::to_string(archive->count()) + " existing lines)");
            channel.subscribe([&archive](const LineEvent& event) {
                try {
                    archive->insert(event);
                } catch (const std::exception& e) {
                    TailLog::error("Archive", e.what());
                }
            });
        }

        TailEngine engine(channel, config);
        for (const auto& path : resolved) {
            if (!engine.add_file(path)) {
                TailLog::log("Main", "Skipping duplicate path: " + path);
            }
        }

        engine.run();

        TailLog::set_sink(nullptr);
        TailLog::log("Main", "Delivered " + std::to_string(channel.lines_delivered()) + " events");
        if (archive) {
            TailLog::log("Archive", "Total archived lines: " + std::to_string(archive->count()));
        }
    } catch (const std::exception& e) {
        TailLog::set_sink(nullptr);
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
