#include "platform/linux/linux_event_loop.hpp"

#include "ipc_protocol.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

constexpr size_t kPipelineWorkers = 2;

sigset_t handled_signals() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);
    return mask;
}

} // namespace

LinuxEventLoop::LinuxEventLoop(SettingsSource& settings, Logger& log)
    : settings_(settings), log_(log),
      audio_capture_(log, static_cast<uint32_t>(settings.current()->audio.sample_rate)),
      transcriber_(settings),
      openrouter_(settings),
      ollama_(settings),
      notifier_(settings),
      speaker_(settings),
      key_source_(settings, log),
      pool_(kPipelineWorkers, log),
      core_(settings, log, key_source_,
            PipelineCollaborators{
                .audio = audio_capture_,
                .transcriber = transcriber_,
                .openrouter = openrouter_,
                .ollama = ollama_,
                .clipboard = clipboard_,
                .notifier = notifier_,
                .history = history_db_,
                .speaker = speaker_,
                .screen = screen_,
            },
            history_db_, ipc_server_, pool_, dispatcher_, platform::temp_dir()) {
    settings_sub_ = settings_.subscribe([this](const SettingsSource::Snapshot& cfg) {
        audio_capture_.set_sample_rate(static_cast<uint32_t>(cfg->audio.sample_rate));
    });
}

LinuxEventLoop::~LinuxEventLoop() {
    settings_.unsubscribe(settings_sub_);
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

void LinuxEventLoop::block_signals() {
    sigset_t mask = handled_signals();
    sigprocmask(SIG_BLOCK, &mask, nullptr);
    // Peers closing pipes or sockets surface as EPIPE.
    signal(SIGPIPE, SIG_IGN);
}

bool LinuxEventLoop::init() {
    sigset_t mask = handled_signals();
    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        log_.error("signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log_.info("IPC listening on {}", ipc_path);

    if (!dispatcher_.init()) return false;

    auto data = platform::data_dir();
    std::string db_path = data.empty() ? "/tmp/holdtalk/history.db" : data + "/history.db";
    if (!history_db_.open(db_path)) {
        log_.warn("history DB failed to open, history disabled");
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        log_.error("epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_) || !add_fd(ipc_server_.server_fd()) || !add_fd(dispatcher_.fd())) {
        log_.error("epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    if (!core_.init()) return false;

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            log_.error("epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                handle_signal();
            } else if (fd == dispatcher_.fd()) {
                dispatcher_.run_pending();
            } else if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
            } else {
                handle_client(fd);
            }
        }
    }

    log_.info("shutting down");
    // Workers still finishing may need the main thread; from here on they run
    // those tasks themselves.
    dispatcher_.close();
    core_.shutdown();
    ipc_server_.stop();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::handle_signal() {
    signalfd_siginfo info;
    while (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
        if (info.ssi_signo == SIGHUP) {
            log_.info("received SIGHUP, reloading configuration");
            core_.reload();
        } else {
            log_.info("received signal {}, shutting down", info.ssi_signo);
            running_.store(false, std::memory_order_release);
        }
    }
}

void LinuxEventLoop::handle_client(int fd) {
    std::vector<nlohmann::json> cmds;
    bool open = ipc_server_.read_commands(fd, cmds);

    for (const auto& cmd : cmds) {
        if (!ipc_server_.send_response(fd, core_.handle_command(fd, cmd))) {
            open = false;
            break;
        }
    }

    if (!open) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
        core_.remove_client(fd);
        ipc_server_.close_client(fd);
    }
}
