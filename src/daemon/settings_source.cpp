#include "settings_source.hpp"

#include <algorithm>
#include <filesystem>

SettingsSource::SettingsSource(Config initial, std::string path, Logger& log)
    : path_(std::move(path)), log_(log),
      current_(std::make_shared<const Config>(std::move(initial))) {}

SettingsSource::Snapshot SettingsSource::current() const {
    std::lock_guard lock(mutex_);
    return current_;
}

size_t SettingsSource::subscribe(ChangeCallback cb) {
    std::lock_guard lock(mutex_);
    size_t id = next_id_++;
    subscribers_.push_back({id, std::move(cb)});
    return id;
}

void SettingsSource::unsubscribe(size_t id) {
    std::lock_guard lock(mutex_);
    std::erase_if(subscribers_, [id](const Subscriber& s) { return s.id == id; });
}

void SettingsSource::update(Config cfg) {
    for (const auto& note : cfg.validate()) {
        log_.warn("settings: {}", note);
    }

    auto snapshot = std::make_shared<const Config>(std::move(cfg));
    std::vector<Subscriber> subscribers;
    {
        std::lock_guard lock(mutex_);
        current_ = snapshot;
        subscribers = subscribers_;
    }

    // Outside the lock so a callback may call current()
    for (auto& s : subscribers) {
        s.cb(snapshot);
    }
}

bool SettingsSource::reload() {
    if (path_.empty() || !std::filesystem::exists(path_)) {
        log_.warn("settings: no config file to reload");
        return false;
    }

    log_.info("settings: reloading {}", path_);
    update(Config::load(path_));
    return true;
}
