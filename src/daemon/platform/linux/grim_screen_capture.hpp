#pragma once

#include "platform/screen_capture.hpp"

// Region capture on wlroots compositors: slurp picks, grim grabs.
class GrimScreenCapture : public ScreenCapture {
public:
    std::expected<std::vector<uint8_t>, std::string> capture_region() override;
};
