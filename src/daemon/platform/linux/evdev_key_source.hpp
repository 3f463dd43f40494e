#pragma once

#include "log.hpp"
#include "platform/key_event_source.hpp"
#include "settings_source.hpp"

#include <atomic>
#include <set>
#include <string>

struct libevdev;
struct libevdev_uinput;

// Grabs a keyboard through libevdev and re-emits every event the handlers do
// not suppress through a uinput clone of the device.
class EvdevKeySource : public KeyEventSource {
public:
    EvdevKeySource(SettingsSource& settings, Logger& log);
    ~EvdevKeySource() override;

    EvdevKeySource(const EvdevKeySource&) = delete;
    EvdevKeySource& operator=(const EvdevKeySource&) = delete;

    void set_handlers(KeyHandler on_down, KeyHandler on_up) override;
    std::expected<void, std::string> run() override;
    // Once stopped, run() returns immediately.
    void stop() override;

    // First /dev/input/event* that reports EV_KEY with KEY_A.
    static std::string find_keyboard();

private:
    std::expected<void, std::string> pump(libevdev* dev, libevdev_uinput* uinput);
    bool handle_key(unsigned int code, int value);

    SettingsSource& settings_;
    Logger& log_;
    KeyHandler on_down_;
    KeyHandler on_up_;

    int wake_fd_ = -1;
    std::atomic<bool> stopped_{false};
    std::set<unsigned int> suppressed_; // keys whose press was swallowed
};
