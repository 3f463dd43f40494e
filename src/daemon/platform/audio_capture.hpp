#pragma once

#include <expected>
#include <string>

class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    // Begins recording into a WAV file at path.
    virtual std::expected<void, std::string> start(const std::string& path) = 0;
    // Stops recording and closes the file.
    virtual std::expected<void, std::string> stop() = 0;
    virtual bool is_capturing() const = 0;
};
