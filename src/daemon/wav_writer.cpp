#include "wav_writer.hpp"

#include <cstring>
#include <print>

namespace wav {

std::array<uint8_t, kHeaderSize> header(uint32_t sample_rate, uint32_t data_bytes) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;

    std::array<uint8_t, kHeaderSize> out{};
    size_t pos = 0;
    auto w = [&](const void* data, size_t len) {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(36 + data_bytes);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_bytes);

    return out;
}

} // namespace wav

WavWriter::~WavWriter() {
    if (out_.is_open()) finalize();
}

bool WavWriter::open(const std::string& path, uint32_t sample_rate) {
    if (out_.is_open()) finalize();

    out_.open(path, std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        std::println(stderr, "[holdtalk] wav: cannot create {}", path);
        return false;
    }
    path_ = path;
    sample_rate_ = sample_rate;
    samples_ = 0;

    auto hdr = wav::header(sample_rate, 0);
    out_.write(reinterpret_cast<const char*>(hdr.data()), hdr.size());
    return out_.good();
}

bool WavWriter::write(std::span<const int16_t> samples) {
    if (!out_.is_open()) return false;
    if (samples.empty()) return true;

    out_.write(reinterpret_cast<const char*>(samples.data()),
               static_cast<std::streamsize>(samples.size_bytes()));
    if (!out_.good()) {
        std::println(stderr, "[holdtalk] wav: write to {} failed", path_);
        return false;
    }
    samples_ += static_cast<uint32_t>(samples.size());
    return true;
}

bool WavWriter::finalize() {
    if (!out_.is_open()) return false;

    auto hdr = wav::header(sample_rate_, samples_ * sizeof(int16_t));
    out_.seekp(0);
    out_.write(reinterpret_cast<const char*>(hdr.data()), hdr.size());
    bool ok = out_.good();
    out_.close();
    if (!ok) {
        std::println(stderr, "[holdtalk] wav: could not finalize {}", path_);
    }
    return ok;
}
