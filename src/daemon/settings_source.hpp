#pragma once

#include "config.hpp"
#include "log.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Owns the live configuration. Readers take an immutable snapshot; components
// that keep a copy subscribe to changes instead of re-reading.
class SettingsSource {
public:
    using Snapshot = std::shared_ptr<const Config>;
    using ChangeCallback = std::function<void(const Snapshot&)>;

    SettingsSource(Config initial, std::string path, Logger& log);

    SettingsSource(const SettingsSource&) = delete;
    SettingsSource& operator=(const SettingsSource&) = delete;

    Snapshot current() const;

    // Callbacks run synchronously, in registration order, on the updating thread.
    size_t subscribe(ChangeCallback cb);
    void unsubscribe(size_t id);

    void update(Config cfg);

    // Re-reads the file this source was created from. False if there is none.
    bool reload();

    const std::string& path() const { return path_; }

private:
    struct Subscriber {
        size_t id;
        ChangeCallback cb;
    };

    std::string path_;
    Logger& log_;

    mutable std::mutex mutex_;
    Snapshot current_;
    std::vector<Subscriber> subscribers_;
    size_t next_id_ = 1;
};
