#pragma once

#include <array>
#include <cstdint>
#include <fstream>
#include <span>
#include <string>

namespace wav {

constexpr size_t kHeaderSize = 44;

// Canonical PCM header for mono 16-bit audio.
std::array<uint8_t, kHeaderSize> header(uint32_t sample_rate, uint32_t data_bytes);

} // namespace wav

// Streams mono 16-bit PCM to a WAV file. The header is written with zero
// sizes on open and patched by finalize().
class WavWriter {
public:
    WavWriter() = default;
    ~WavWriter();

    WavWriter(const WavWriter&) = delete;
    WavWriter& operator=(const WavWriter&) = delete;

    bool open(const std::string& path, uint32_t sample_rate);
    bool write(std::span<const int16_t> samples);
    bool finalize();

    bool is_open() const { return out_.is_open(); }
    uint32_t samples_written() const { return samples_; }
    double duration_s() const {
        return sample_rate_ ? static_cast<double>(samples_) / sample_rate_ : 0.0;
    }

private:
    std::ofstream out_;
    std::string path_;
    uint32_t sample_rate_ = 0;
    uint32_t samples_ = 0;
};
