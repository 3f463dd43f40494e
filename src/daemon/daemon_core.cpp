#include "daemon_core.hpp"

#include "ipc_protocol.hpp"

#include <algorithm>

HotkeyBindings bindings_from(const Config& cfg) {
    HotkeyBindings b;
    b.trigger1 = keys::from_name(cfg.hotkeys.trigger1).value_or(b.trigger1);
    b.trigger2 = keys::from_name(cfg.hotkeys.trigger2).value_or(b.trigger2);
    b.trigger3 = keys::from_name(cfg.hotkeys.trigger3).value_or(b.trigger3);
    return b;
}

namespace {

ListenerSupervisor::Policy policy_from(const Config& cfg) {
    ListenerSupervisor::Policy p;
    p.base_delay = std::chrono::milliseconds(cfg.hotkeys.restart_base_ms);
    p.max_restarts = static_cast<uint32_t>(cfg.hotkeys.max_restarts);
    return p;
}

} // namespace

DaemonCore::DaemonCore(SettingsSource& settings, Logger& log, KeyEventSource& keys,
                       PipelineCollaborators collaborators, HistoryDb& history,
                       IpcServer& ipc, WorkPool& pool, MainThreadDispatcher& dispatcher,
                       std::string temp_dir)
    : settings_(settings), log_(log), history_(history), ipc_(ipc), pool_(pool),
      dispatcher_(dispatcher),
      machine_(bindings_from(*settings.current()), log,
               std::chrono::milliseconds(settings.current()->hotkeys.tts_debounce_ms)),
      supervisor_(keys, machine_, log, policy_from(*settings.current())),
      orchestrator_(collaborators, settings, pool, dispatcher, log, std::move(temp_dir)) {
    // The orchestrator subscribes first so recording starts before watchers hear about it.
    orchestrator_.attach(machine_);
    machine_.subscribe([this](const HotkeyEvent& ev) { publish(ipc::event_json(ev)); });

    orchestrator_.subscribe_completed(
        [this](const PipelineResult& r) { publish(ipc::event_json(r)); });
    orchestrator_.subscribe_error(
        [this](const PipelineError& e) { publish(ipc::event_json(e)); });

    // A hold cut short by a listener failure never sees its release.
    supervisor_.on_orphan([this](TransmissionMode) { orchestrator_.discard_recording(); });
    supervisor_.on_fatal(
        [this](const std::string& reason) { publish(ipc::listener_failed_json(reason)); });

    settings_sub_ = settings_.subscribe(
        [this](const SettingsSource::Snapshot& cfg) { apply(*cfg); });
}

DaemonCore::~DaemonCore() {
    shutdown();
    settings_.unsubscribe(settings_sub_);
}

bool DaemonCore::init() {
    auto cfg = settings_.current();

    if (history_.is_open() && cfg->history.retention_days > 0) {
        int removed = history_.prune_older_than(static_cast<uint32_t>(cfg->history.retention_days));
        if (removed > 0) {
            log_.info("history: pruned {} entries older than {} days",
                      removed, cfg->history.retention_days);
        }
    }

    supervisor_.start();
    log_.info("hotkeys: {} / {} / {}", cfg->hotkeys.trigger1, cfg->hotkeys.trigger2,
              cfg->hotkeys.trigger3);
    return true;
}

nlohmann::json DaemonCore::handle_command(int client_fd, const nlohmann::json& cmd) {
    if (cmd.contains("parse_error")) {
        return ipc::error("invalid JSON: " + cmd["parse_error"].get<std::string>());
    }

    std::string cmd_str = cmd.value("cmd", "");
    if (cmd_str == "status") return handle_status();
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "reload") return handle_reload();
    if (cmd_str == "watch") return handle_watch(client_fd);
    return ipc::error("unknown command");
}

nlohmann::json DaemonCore::handle_status() {
    auto cfg = settings_.current();
    auto mode = machine_.active_mode();

    auto resp = ipc::ok();
    resp["state"] = mode == TransmissionMode::None ? "idle" : to_string(mode);
    resp["listener"] = to_string(supervisor_.state());
    resp["in_flight"] = orchestrator_.in_flight();
    resp["provider"] = to_string(cfg->provider);
    {
        std::lock_guard lock(watchers_mutex_);
        resp["watchers"] = watchers_.size();
    }
    return resp;
}

nlohmann::json DaemonCore::handle_history(const nlohmann::json& cmd) {
    int limit = std::clamp(cmd.value("limit", 10), 1, 1000);
    if (!history_.is_open()) return ipc::error("history is unavailable");

    auto resp = ipc::ok();
    resp["entries"] = nlohmann::json::array();
    for (const auto& e : history_.recent(limit)) {
        resp["entries"].push_back(ipc::entry_json(e));
    }
    return resp;
}

nlohmann::json DaemonCore::handle_reload() {
    if (!reload()) return ipc::error("no config file to reload");
    return ipc::ok();
}

nlohmann::json DaemonCore::handle_watch(int client_fd) {
    std::lock_guard lock(watchers_mutex_);
    if (std::ranges::find(watchers_, client_fd) == watchers_.end()) {
        watchers_.push_back(client_fd);
    }
    auto resp = ipc::ok();
    resp["message"] = "watching";
    return resp;
}

bool DaemonCore::reload() {
    return settings_.reload();
}

void DaemonCore::remove_client(int fd) {
    std::lock_guard lock(watchers_mutex_);
    std::erase(watchers_, fd);
}

void DaemonCore::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    supervisor_.stop();
    if (machine_.abandon()) {
        log_.info("dropping transmission in progress at shutdown");
    }
    orchestrator_.discard_recording();
    pool_.shutdown();
}

void DaemonCore::apply(const Config& cfg) {
    machine_.set_bindings(bindings_from(cfg));
    machine_.set_tts_debounce(std::chrono::milliseconds(cfg.hotkeys.tts_debounce_ms));
    supervisor_.set_policy(policy_from(cfg));
}

void DaemonCore::publish(nlohmann::json event) {
    dispatcher_.post([this, event = std::move(event)] { broadcast(event); });
}

void DaemonCore::broadcast(const nlohmann::json& event) {
    std::lock_guard lock(watchers_mutex_);
    std::erase_if(watchers_, [&](int fd) {
        if (ipc_.send_response(fd, event)) return false;
        log_.debug("ipc: dropping watcher {}", fd);
        return true;
    });
}
