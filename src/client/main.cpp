#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdio>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start [--title TITLE]                 Start recording a meeting");
    std::println(stderr, "  stop [--no-wait]                      Stop recording and process it");
    std::println(stderr, "  status                                Show capture state");
    std::println(stderr, "  list [--folder ID|unfiled]            List meetings");
    std::println(stderr, "  show ID                               Show a meeting transcript");
    std::println(stderr, "  rename ID TITLE                       Rename a meeting");
    std::println(stderr, "  delete ID                             Delete a meeting");
    std::println(stderr, "  folders                               List folders");
    std::println(stderr, "  folder-create NAME                    Create a folder");
    std::println(stderr, "  folder-rename ID NAME                 Rename a folder");
    std::println(stderr, "  folder-delete ID                      Delete a folder, keeping its meetings");
    std::println(stderr, "  move ID [--folder ID]                 Move a meeting (no folder = unfiled)");
    std::println(stderr, "  export ID [--format txt|rttm] [--out PATH]");
    std::println(stderr, "  clear                                 Delete all meetings and folders");
    std::println(stderr, "  watch                                 Print capture and store events");
}

// Positional arguments plus --key value options.
struct Args {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    bool no_wait = false;

    std::optional<std::string> option(const std::string& key) const {
        auto it = options.find(key);
        if (it == options.end()) return std::nullopt;
        return it->second;
    }
};

Args parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--no-wait") {
            args.no_wait = true;
        } else if (arg.starts_with("--") && i + 1 < argc) {
            args.options[arg.substr(2)] = argv[++i];
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

std::optional<json> build_command(const std::string& command, const Args& args) {
    auto pos = [&](size_t i) { return i < args.positional.size(); };

    json cmd = {{"cmd", command}};
    if (command == "start") {
        if (auto t = args.option("title")) cmd["title"] = *t;
    } else if (command == "stop") {
        cmd["wait"] = !args.no_wait;
    } else if (command == "status" || command == "folders" ||
               command == "clear" || command == "watch") {
    } else if (command == "list") {
        if (auto f = args.option("folder")) cmd["folder"] = *f;
    } else if (command == "show" || command == "delete" || command == "folder-delete") {
        if (!pos(0)) return std::nullopt;
        cmd["id"] = args.positional[0];
    } else if (command == "rename") {
        if (!pos(1)) return std::nullopt;
        cmd["id"] = args.positional[0];
        cmd["title"] = args.positional[1];
    } else if (command == "folder-create") {
        if (!pos(0)) return std::nullopt;
        cmd["name"] = args.positional[0];
    } else if (command == "folder-rename") {
        if (!pos(1)) return std::nullopt;
        cmd["id"] = args.positional[0];
        cmd["name"] = args.positional[1];
    } else if (command == "move") {
        if (!pos(0)) return std::nullopt;
        cmd["id"] = args.positional[0];
        if (auto f = args.option("folder")) cmd["folder"] = *f;
    } else if (command == "export") {
        if (!pos(0)) return std::nullopt;
        cmd["id"] = args.positional[0];
        cmd["format"] = args.option("format").value_or("txt");
    } else {
        return std::nullopt;
    }
    return cmd;
}

void print_summaries(const json& meetings) {
    if (meetings.empty()) {
        std::println("No meetings.");
        return;
    }
    for (auto& m : meetings) {
        std::println("{}  {:<10}  {:>4} utt  {}  {}",
                     m.value("id", ""), m.value("status", ""),
                     m.value("utterance_count", 0),
                     m.value("started_at", ""), m.value("title", ""));
    }
}

void print_meeting(const json& m) {
    std::println("{} ({})", m.value("title", ""), m.value("status", ""));
    std::println("Started: {}", m.value("started_at", ""));
    if (m.contains("ended_at") && m["ended_at"].is_string()) {
        std::println("Ended:   {}", m["ended_at"].get<std::string>());
    }
    std::println("");
    for (auto& u : m.value("utterances", json::array())) {
        std::println("[{:7.1f}s] Speaker {}: {}",
                     u.value("start_time", 0.0), u.value("speaker_index", 0) + 1,
                     u.value("text", ""));
    }
}

int print_response(const std::string& command, const json& response, const Args& args) {
    if (response.value("status", "") == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "start") {
        std::println("Recording meeting {}", response.value("meeting_id", ""));
    } else if (command == "stop") {
        std::println("Meeting {}: {} ({} utterances)", response.value("meeting_id", ""),
                     response.value("state", ""), response.value("utterances", 0));
    } else if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        if (response.contains("meeting_id")) {
            std::println("Meeting: {}", response["meeting_id"].get<std::string>());
        }
        if (response.contains("duration")) {
            std::println("Recording duration: {:.1f}s", response["duration"].get<double>());
        }
        if (response.contains("last_error")) {
            std::println("Last error: {}", response["last_error"].get<std::string>());
        }
    } else if (command == "list") {
        print_summaries(response.value("meetings", json::array()));
    } else if (command == "show") {
        print_meeting(response.value("meeting", json::object()));
    } else if (command == "folders") {
        for (auto& f : response.value("folders", json::array())) {
            std::println("{}  {} ({} meetings)", f.value("id", ""), f.value("name", ""),
                         f.value("meeting_ids", json::array()).size());
        }
    } else if (command == "folder-create") {
        std::println("{}", response.value("folder", json::object()).value("id", ""));
    } else if (command == "export") {
        auto text = response.value("text", "");
        if (auto out = args.option("out")) {
            std::ofstream f(*out);
            if (!f.is_open() || !(f << text << '\n')) {
                std::println(stderr, "Failed to write {}", *out);
                return 1;
            }
        } else {
            std::println("{}", text);
        }
    } else {
        std::println("OK");
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    auto args = parse_args(argc, argv);

    auto cmd = build_command(command, args);
    if (!cmd) {
        std::println(stderr, "Unknown command or missing argument: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is meetcapd running?");
        return 1;
    }

    if (!client.send(*cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    // Processing a long meeting can take as long as the meeting itself.
    int timeout_ms = (command == "stop" && !args.no_wait) ? -1 : 30000;

    json response;
    if (!client.recv(response, timeout_ms)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    if (command == "watch") {
        if (response.value("status", "") != "ok") return print_response(command, response, args);
        while (client.recv(response, -1)) {
            std::println("{}", response.dump());
            std::fflush(stdout);
        }
        return 0;
    }

    return print_response(command, response, args);
}
