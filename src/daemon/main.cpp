#include "config.hpp"
#include "inference/http.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/platform_paths.hpp"

#include <optional>
#include <print>
#include <string>

namespace {

struct Options {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;
};

void print_usage() {
    std::println("Usage: meetcapd [options]");
    std::println("Records meetings from the default PipeWire source and keeps their transcripts.");
    std::println("Options:");
    std::println("  -f, --foreground    Stay attached to the terminal");
    std::println("  -v, --verbose       Log capture and store activity");
    std::println("  -c, --config PATH   Config file (default: {}/config.json)", platform::config_dir());
    std::println("  -h, --help          Show this help");
}

// nullopt means exit with the given status.
std::optional<Options> parse_args(int argc, char* argv[], int& exit_status) {
    Options opts;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            opts.foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::println(stderr, "meetcapd: {} needs a path", arg);
                exit_status = 2;
                return std::nullopt;
            }
            opts.config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            exit_status = 0;
            return std::nullopt;
        } else {
            std::println(stderr, "meetcapd: unknown option {}", arg);
            exit_status = 2;
            return std::nullopt;
        }
    }
    return opts;
}

} // namespace

int main(int argc, char* argv[]) {
    int exit_status = 0;
    auto opts = parse_args(argc, argv, exit_status);
    if (!opts) return exit_status;

    Config config = opts->config_path.empty() ? Config::load_default()
                                              : Config::load(opts->config_path);

    if (!opts->foreground) {
        platform::daemonize(platform::daemon_log_file());
    }

    if (opts->verbose) {
        std::println(stderr, "[meetcap] Starting (transcription: {} @ {}, diarization @ {}, meetings in {})",
                     config.backend.api_format, config.backend.url, config.diarization.url,
                     config.meetings_dir());
    }

    http::GlobalInit curl;

    LinuxEventLoop loop(std::move(config), opts->verbose);
    if (!loop.init()) {
        std::println(stderr, "meetcapd: failed to initialize");
        return 1;
    }

    loop.run();
    return 0;
}
