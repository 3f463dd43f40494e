#pragma once

#include "log.hpp"
#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"
#include "wav_writer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <thread>

// Records the default PipeWire source (S16_LE, mono) into a WAV file. The
// realtime callback only touches the ring; a writer thread drains it to disk.
class PipeWireCapture : public AudioCapture {
public:
    PipeWireCapture(Logger& log, uint32_t sample_rate = 16000);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    std::expected<void, std::string> start(const std::string& path) override;
    std::expected<void, std::string> stop() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }

    void set_sample_rate(uint32_t rate);

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void writer_loop(std::stop_token st);
    void drain();
    void teardown_stream();

    static constexpr auto kDrainInterval = std::chrono::milliseconds(50);

    Logger& log_;
    std::mutex mutex_; // serializes start/stop
    uint32_t sample_rate_;
    std::atomic<bool> capturing_{false};

    RingBuffer ring_;
    WavWriter writer_;
    std::jthread writer_thread_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
