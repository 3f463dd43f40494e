#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <pthread.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

namespace {

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
}

// Writes all of input to fd with SIGPIPE blocked on this thread, so a child
// that exits without reading yields EPIPE instead of killing the daemon.
// Returns false if the reader went away first.
bool write_all_nosignal(int fd, const std::string& input) {
    sigset_t pipe_set, old_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

    bool complete = true;
    size_t total_written = 0;
    while (total_written < input.size()) {
        ssize_t n = ::write(fd, input.data() + total_written, input.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            complete = false;
            if (errno == EPIPE && !sigismember(&old_set, SIGPIPE)) {
                // Drop the SIGPIPE this write queued before unblocking.
                timespec zero{0, 0};
                while (sigtimedwait(&pipe_set, nullptr, &zero) < 0 && errno == EINTR) {}
            }
            break;
        }
        total_written += static_cast<size_t>(n);
    }

    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    return complete;
}

} // namespace

std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv, const std::string& input,
            bool capture_stdout) {
    if (argv.empty()) return std::unexpected("empty command");

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    if (::pipe2(in_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe()"));
    }
    if (capture_stdout && ::pipe2(out_pipe, O_CLOEXEC) < 0) {
        close_pair(in_pipe);
        return std::unexpected(errno_message("pipe()"));
    }

    std::vector<char*> args;
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        close_pair(in_pipe);
        close_pair(out_pipe);
        return std::unexpected(errno_message("fork()"));
    }

    if (pid == 0) {
        // The daemon blocks its control signals and ignores SIGPIPE; neither
        // should leak into the child.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);
        ::dup2(in_pipe[0], STDIN_FILENO);
        if (capture_stdout) ::dup2(out_pipe[1], STDOUT_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(in_pipe[0]);
    if (capture_stdout) ::close(out_pipe[1]);

    ProcessResult result;
    result.input_consumed = write_all_nosignal(in_pipe[1], input);
    ::close(in_pipe[1]);

    if (capture_stdout) {
        char buf[4096];
        for (;;) {
            ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            result.output.append(buf, static_cast<size_t>(n));
        }
        ::close(out_pipe[0]);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid()"));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code == 127) {
            return std::unexpected(argv[0] + " not found");
        }
    } else {
        result.exit_code = -1;
    }
    return result;
}

} // namespace platform
