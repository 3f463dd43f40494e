#pragma once

#include <expected>
#include <string>

enum class NotificationKind { SpeechToText, LlmResponse };

class NotificationPlayer {
public:
    virtual ~NotificationPlayer() = default;
    virtual std::expected<void, std::string> play(NotificationKind kind) = 0;
};
