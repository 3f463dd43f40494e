#include "platform/linux/grim_screen_capture.hpp"
#include "platform/linux/subprocess.hpp"

std::expected<std::vector<uint8_t>, std::string> GrimScreenCapture::capture_region() {
    auto region = platform::run_process({"slurp"}, {}, true);
    if (!region) return std::unexpected(region.error());
    // slurp exits non-zero when the selection is cancelled with Escape
    if (region->exit_code != 0) return std::unexpected("Screen capture was cancelled");

    std::string geometry = region->output;
    while (!geometry.empty() && (geometry.back() == '\n' || geometry.back() == '\r')) {
        geometry.pop_back();
    }
    if (geometry.empty()) return std::unexpected("Screen capture was cancelled");

    auto shot = platform::run_process({"grim", "-t", "png", "-g", geometry, "-"}, {}, true);
    if (!shot) return std::unexpected(shot.error());
    if (shot->exit_code != 0) {
        return std::unexpected("grim exited with code " + std::to_string(shot->exit_code));
    }
    if (shot->output.empty()) return std::unexpected("grim produced no image");

    return std::vector<uint8_t>(shot->output.begin(), shot->output.end());
}
