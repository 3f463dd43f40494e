#pragma once

#include "hotkey/hotkey_state_machine.hpp"
#include "hotkey/listener_supervisor.hpp"
#include "log.hpp"
#include "pipeline/dispatcher.hpp"
#include "pipeline/pipeline_orchestrator.hpp"
#include "pipeline/work_pool.hpp"
#include "platform/ipc_server.hpp"
#include "platform/key_event_source.hpp"
#include "settings_source.hpp"
#include "storage/history_db.hpp"

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Portable daemon logic: wires key source -> supervisor -> state machine ->
// orchestrator and answers IPC commands. Everything here except the pipeline
// itself runs on the main loop thread.
class DaemonCore {
public:
    DaemonCore(SettingsSource& settings, Logger& log, KeyEventSource& keys,
               PipelineCollaborators collaborators, HistoryDb& history,
               IpcServer& ipc, WorkPool& pool, MainThreadDispatcher& dispatcher,
               std::string temp_dir);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    nlohmann::json handle_command(int client_fd, const nlohmann::json& cmd);

    void remove_client(int fd);

    bool reload();

    // Stops the listener, then lets in-flight pipelines finish.
    void shutdown();

    HotkeyStateMachine& state_machine() { return machine_; }
    ListenerState listener_state() const { return supervisor_.state(); }
    ListenerSupervisor::Policy listener_policy() const { return supervisor_.policy(); }
    bool is_recording() const { return orchestrator_.is_recording(); }

private:
    nlohmann::json handle_status();
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_reload();
    nlohmann::json handle_watch(int client_fd);

    void apply(const Config& cfg);

    // Thread-safe: hops to the main loop before touching client sockets.
    void publish(nlohmann::json event);
    void broadcast(const nlohmann::json& event);

    SettingsSource& settings_;
    Logger& log_;
    HistoryDb& history_;
    IpcServer& ipc_;
    WorkPool& pool_;
    MainThreadDispatcher& dispatcher_;

    HotkeyStateMachine machine_;
    ListenerSupervisor supervisor_;
    PipelineOrchestrator orchestrator_;

    size_t settings_sub_ = 0;
    bool shut_down_ = false;

    std::mutex watchers_mutex_;
    std::vector<int> watchers_;
};

HotkeyBindings bindings_from(const Config& cfg);
