#include "platform/linux/evdev_key_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <libevdev/libevdev-uinput.h>
#include <libevdev/libevdev.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Owns the grabbed device and its uinput twin for one run().
struct Device {
    int fd = -1;
    libevdev* dev = nullptr;
    libevdev_uinput* uinput = nullptr;

    ~Device() {
        if (uinput) libevdev_uinput_destroy(uinput);
        if (dev) {
            libevdev_grab(dev, LIBEVDEV_UNGRAB);
            libevdev_free(dev);
        }
        if (fd >= 0) ::close(fd);
    }
};

} // namespace

EvdevKeySource::EvdevKeySource(SettingsSource& settings, Logger& log)
    : settings_(settings), log_(log) {
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        log_.error("hotkey: eventfd failed: {}", std::strerror(errno));
    }
}

EvdevKeySource::~EvdevKeySource() {
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

void EvdevKeySource::set_handlers(KeyHandler on_down, KeyHandler on_up) {
    on_down_ = std::move(on_down);
    on_up_ = std::move(on_up);
}

void EvdevKeySource::stop() {
    stopped_.store(true, std::memory_order_release);
    if (wake_fd_ >= 0) {
        uint64_t one = 1;
        ssize_t n = ::write(wake_fd_, &one, sizeof(one));
        (void)n;
    }
}

std::string EvdevKeySource::find_keyboard() {
    std::vector<std::string> candidates;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator("/dev/input", ec)) {
        auto name = entry.path().filename().string();
        if (name.starts_with("event")) candidates.push_back(entry.path().string());
    }
    // event2 before event10
    std::ranges::sort(candidates, [](const std::string& a, const std::string& b) {
        return a.size() != b.size() ? a.size() < b.size() : a < b;
    });

    for (const auto& path : candidates) {
        int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) continue;

        libevdev* dev = nullptr;
        bool keyboard = false;
        if (libevdev_new_from_fd(fd, &dev) >= 0) {
            keyboard = libevdev_has_event_type(dev, EV_KEY) &&
                       libevdev_has_event_code(dev, EV_KEY, KEY_A);
            libevdev_free(dev);
        }
        ::close(fd);
        if (keyboard) return path;
    }
    return {};
}

std::expected<void, std::string> EvdevKeySource::run() {
    if (stopped_.load(std::memory_order_acquire)) return {};
    if (wake_fd_ < 0) return std::unexpected("no wakeup fd");

    std::string path = settings_.current()->hotkeys.device;
    if (path.empty()) path = find_keyboard();
    if (path.empty()) {
        return std::unexpected("no keyboard device found (is the user in the input group?)");
    }

    Device d;
    d.fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (d.fd < 0) {
        return std::unexpected(std::format("open {}: {}", path, std::strerror(errno)));
    }

    int rc = libevdev_new_from_fd(d.fd, &d.dev);
    if (rc < 0) {
        return std::unexpected(std::format("libevdev on {}: {}", path, std::strerror(-rc)));
    }

    rc = libevdev_grab(d.dev, LIBEVDEV_GRAB);
    if (rc < 0) {
        return std::unexpected(std::format("grab {}: {}", path, std::strerror(-rc)));
    }

    rc = libevdev_uinput_create_from_device(d.dev, LIBEVDEV_UINPUT_OPEN_MANAGED, &d.uinput);
    if (rc < 0) {
        return std::unexpected(std::format("uinput: {}", std::strerror(-rc)));
    }

    suppressed_.clear();
    log_.info("hotkey: listening on {} ({})", path, libevdev_get_name(d.dev));
    return pump(d.dev, d.uinput);
}

std::expected<void, std::string> EvdevKeySource::pump(libevdev* dev, libevdev_uinput* uinput) {
    pollfd fds[2] = {
        {.fd = libevdev_get_fd(dev), .events = POLLIN, .revents = 0},
        {.fd = wake_fd_, .events = POLLIN, .revents = 0},
    };

    while (!stopped_.load(std::memory_order_acquire)) {
        int n = ::poll(fds, 2, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::format("poll: {}", std::strerror(errno)));
        }
        if (fds[1].revents & POLLIN) continue; // stop() was called
        if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            return std::unexpected("keyboard device disappeared");
        }

        input_event ev;
        int flag = LIBEVDEV_READ_FLAG_NORMAL;
        for (;;) {
            int rc = libevdev_next_event(dev, flag, &ev);
            if (rc == -EAGAIN) {
                if (flag == LIBEVDEV_READ_FLAG_SYNC) {
                    flag = LIBEVDEV_READ_FLAG_NORMAL;
                    continue;
                }
                break;
            }
            if (rc == LIBEVDEV_READ_STATUS_SYNC) {
                // Dropped events; replay the device state delta.
                flag = LIBEVDEV_READ_FLAG_SYNC;
            } else if (rc != LIBEVDEV_READ_STATUS_SUCCESS) {
                return std::unexpected(std::format("read: {}", std::strerror(-rc)));
            }

            bool suppress = ev.type == EV_KEY && handle_key(ev.code, ev.value);
            if (!suppress) {
                libevdev_uinput_write_event(uinput, ev.type, ev.code, ev.value);
            }
        }
    }
    return {};
}

bool EvdevKeySource::handle_key(unsigned int code, int value) {
    switch (value) {
        case 1: {
            bool suppress = on_down_ && on_down_(code);
            if (suppress) suppressed_.insert(code);
            return suppress;
        }
        case 0: {
            bool was_suppressed = suppressed_.erase(code) > 0;
            bool suppress = on_up_ && on_up_(code);
            return suppress || was_suppressed;
        }
        default:
            // auto-repeat
            return suppressed_.contains(code);
    }
}
