#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

class ScreenCapture {
public:
    virtual ~ScreenCapture() = default;
    // Lets the user pick a region and returns it as PNG bytes.
    virtual std::expected<std::vector<uint8_t>, std::string> capture_region() = 0;
};
