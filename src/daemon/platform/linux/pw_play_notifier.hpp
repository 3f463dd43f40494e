#pragma once

#include "platform/notification_player.hpp"
#include "settings_source.hpp"

// Plays the configured notification sound through pw-play.
class PwPlayNotifier : public NotificationPlayer {
public:
    explicit PwPlayNotifier(SettingsSource& settings);

    std::expected<void, std::string> play(NotificationKind kind) override;

private:
    SettingsSource& settings_;
};
