#pragma once

#include "daemon_core.hpp"
#include "llm/ollama_client.hpp"
#include "llm/openrouter_client.hpp"
#include "log.hpp"
#include "pipeline/work_pool.hpp"
#include "platform/linux/command_speaker.hpp"
#include "platform/linux/evdev_key_source.hpp"
#include "platform/linux/eventfd_dispatcher.hpp"
#include "platform/linux/grim_screen_capture.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/pw_play_notifier.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/linux/wayland_clipboard.hpp"
#include "settings_source.hpp"
#include "storage/history_db.hpp"
#include "whisper/lan_transcriber.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    LinuxEventLoop(SettingsSource& settings, Logger& log);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    // Must run before any thread is started so only signalfd sees
    // SIGINT/SIGTERM/SIGHUP.
    static void block_signals();

    bool init();
    void run();
    void request_stop();

private:
    void handle_signal();
    void handle_client(int fd);

    SettingsSource& settings_;
    Logger& log_;
    size_t settings_sub_ = 0;

    // Platform implementations (constructed before core_)
    PipeWireCapture audio_capture_;
    LanTranscriber transcriber_;
    OpenRouterClient openrouter_;
    OllamaClient ollama_;
    WaylandClipboard clipboard_;
    PwPlayNotifier notifier_;
    CommandSpeaker speaker_;
    GrimScreenCapture screen_;
    HistoryDb history_db_;
    EvdevKeySource key_source_;
    UnixSocketServer ipc_server_;
    EventFdDispatcher dispatcher_;
    WorkPool pool_;

    // Portable business logic
    DaemonCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    std::atomic<bool> running_{false};
};
