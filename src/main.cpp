#include "app/commands.hpp"
#include "app/logging.hpp"
#include "app/streamer.hpp"
#include "chunk/player.hpp"
#include "core/config.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace {

std::atomic<bool> g_stop{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop = true;
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <command> [args]\n"
              << "\nCommands:\n"
              << "  record -s <source> [-o <out>] <channel>...  Stream channels into a new chunk log\n"
              << "  record state <log>                          Print the state of a chunk log\n"
              << "  channels <log>                              List channel ids in a chunk log\n"
              << "  replay [-p <port>] <log>                    Serve a chunk log as a mock API\n"
              << "\nOptions:\n"
              << "  -c, --config <path>  Load configuration from JSON file\n"
              << "  -s, --source <path>  Source chunk log for record\n"
              << "  -o, --output <file>  Output chunk log for record (default chunks.jsonl)\n"
              << "  -p, --port <port>    Replay server port\n"
              << "  -d, --debug          Debug logging\n"
              << "  -h, --help           Show this help message\n"
              << "      --version        Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  CHUNKDUMP_OUTPUT_DIR         Directory for new chunk logs\n"
              << "  CHUNKDUMP_STATE_SUFFIX       State file suffix (default .state)\n"
              << "  CHUNKDUMP_FLUSH_EACH_RECORD  Flush after every record (1/0)\n"
              << "  CHUNKDUMP_REPLAY_HOST        Replay server address\n"
              << "  CHUNKDUMP_REPLAY_PORT        Replay server port\n"
              << "  CHUNKDUMP_LOG_LEVEL          trace, debug, info, warn, error\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "chunkdump v1.0.0\n"
              << "Chunk log recorder and replayer for workspace archives\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> source;
    std::optional<std::string> output;
    std::optional<int> port;
    bool debug = false;
    bool show_help = false;
    bool show_version = false;
    std::vector<std::string> positional;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "--version") {
            args.show_version = true;
        } else if (arg == "-d" || arg == "--debug") {
            args.debug = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-s" || arg == "--source") && i + 1 < argc) {
            args.source = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            args.output = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            try {
                args.port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                args.show_help = true;
            }
        } else {
            args.positional.push_back(std::move(arg));
        }
    }

    return args;
}

int fail(const chunkdump::Error& error) {
    spdlog::error("{}", error.to_string());
    return 1;
}

int run_record_command(const chunkdump::Config& config, const CliArgs& args) {
    if (!args.source) {
        spdlog::error("record: missing --source chunk log");
        return 2;
    }

    auto opened = chunkdump::chunk::Player::open(*args.source);
    if (opened.is_err()) {
        return fail(opened.error());
    }
    auto source = std::move(opened).take_value();
    chunkdump::app::ArchiveStreamer streamer(*source);

    chunkdump::app::RecordOptions options;
    options.output = args.output.value_or("chunks.jsonl");
    options.channels.assign(args.positional.begin() + 1, args.positional.end());

    auto recorded = chunkdump::app::run_record(config, options, streamer);
    if (recorded.is_err()) {
        return fail(recorded.error());
    }
    std::cout << recorded.value() << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    if (args.show_version) {
        print_version();
        return 0;
    }

    if (args.show_help || args.positional.empty()) {
        print_usage(argv[0]);
        return args.show_help ? 0 : 2;
    }

    // Load configuration with priority: CLI > env > file > defaults
    auto config = chunkdump::Config::load(args.config_path);

    if (args.debug) {
        config.logging.level = "debug";
    }
    if (args.port) {
        if (*args.port < 0 || *args.port > 65535) {
            std::cerr << "Port out of range: " << *args.port << std::endl;
            return 2;
        }
        config.replay.port = static_cast<std::uint16_t>(*args.port);
    }

    chunkdump::app::setup_logging(config.logging.level);

    const auto& command = args.positional[0];
    const std::size_t nargs = args.positional.size();

    try {
        if (command == "record" && nargs >= 3 && args.positional[1] == "state") {
            auto status = chunkdump::app::run_record_state(args.positional[2], std::cout);
            return status.is_ok() ? 0 : fail(status.error());
        }
        if (command == "record") {
            return run_record_command(config, args);
        }
        if (command == "channels" && nargs >= 2) {
            auto status = chunkdump::app::run_channels(args.positional[1], std::cout);
            return status.is_ok() ? 0 : fail(status.error());
        }
        if (command == "replay" && nargs >= 2) {
            std::signal(SIGINT, signal_handler);
            std::signal(SIGTERM, signal_handler);
            auto status = chunkdump::app::run_replay(config, args.positional[1], g_stop);
            return status.is_ok() ? 0 : fail(status.error());
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    print_usage(argv[0]);
    return 2;
}
