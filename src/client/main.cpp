#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  status                 Show daemon and listener state");
    std::println(stderr, "  history [--limit N]    Show transcription history");
    std::println(stderr, "  reload                 Re-read the config file");
    std::println(stderr, "  watch                  Print hotkey and pipeline events as they happen");
}

static void print_event(const json& ev) {
    auto name = ev.value("event", "");
    auto mode = ev.value("mode", "");
    if (name == "pipeline_completed") {
        std::println("[{}] done in {} ms: {}", mode, ev.value("duration_ms", 0),
                     ev.value("text", ""));
    } else if (name == "pipeline_error") {
        std::println("[{}] error: {}{}", mode, ev.value("message", ""),
                     ev.contains("cause") ? " (" + ev["cause"].get<std::string>() + ")" : "");
    } else if (name == "listener_failed") {
        std::println("hotkey listener failed: {}", ev.value("reason", ""));
    } else {
        std::println("[{}] {}", mode, name);
    }
    std::fflush(stdout);
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    int limit = 10;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        }
    }

    json cmd;
    if (command == "status" || command == "reload" || command == "watch") {
        cmd = {{"cmd", command}};
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is holdtalk running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    if (response.value("status", "") == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        std::println("Listener: {}", response.value("listener", "unknown"));
        std::println("Provider: {}", response.value("provider", "unknown"));
        std::println("In flight: {}", response.value("in_flight", 0));
    } else if (command == "history") {
        for (auto& entry : response.value("entries", json::array())) {
            std::println("[{}] ({}) {}", entry.value("timestamp", ""), entry.value("mode", ""),
                         entry.value("text", ""));
            if (auto models = entry.value("models", ""); !models.empty()) {
                std::println("  Models: {}", models);
            }
        }
    } else if (command == "watch") {
        json ev;
        while (client.recv(ev, -1)) {
            print_event(ev);
        }
        std::println(stderr, "Daemon closed the connection");
        return 1;
    } else {
        std::println("OK");
    }

    return 0;
}
