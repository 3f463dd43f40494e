#include "platform/linux/pipewire_capture.hpp"

#include <array>
#include <format>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

PipeWireCapture::PipeWireCapture(Logger& log, uint32_t sample_rate)
    : log_(log), sample_rate_(sample_rate), ring_(sample_rate * 10) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    if (auto r = stop(); !r) log_.warn("audio: {}", r.error());
    pw_deinit();
}

void PipeWireCapture::set_sample_rate(uint32_t rate) {
    std::lock_guard lock(mutex_);
    sample_rate_ = rate;
}

std::expected<void, std::string> PipeWireCapture::start(const std::string& path) {
    std::lock_guard lock(mutex_);
    if (capturing_.load(std::memory_order_relaxed)) {
        return std::unexpected("already recording");
    }

    if (!writer_.open(path, sample_rate_)) {
        return std::unexpected(std::format("cannot create {}", path));
    }

    loop_ = pw_thread_loop_new("holdtalk", nullptr);
    if (!loop_) {
        writer_.finalize();
        return std::unexpected("failed to create thread loop");
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "holdtalk",
        PW_KEY_APP_NAME, "holdtalk",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "holdtalk-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        teardown_stream();
        writer_.finalize();
        return std::unexpected("failed to create stream");
    }

    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    ring_.reset();
    capturing_.store(true, std::memory_order_release);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret >= 0) ret = pw_thread_loop_start(loop_);

    if (ret < 0) {
        capturing_.store(false, std::memory_order_release);
        teardown_stream();
        writer_.finalize();
        return std::unexpected(std::format("stream start failed: {}", spa_strerror(ret)));
    }

    writer_thread_ = std::jthread([this](std::stop_token st) { writer_loop(st); });
    log_.debug("audio: capturing {} Hz to {}", sample_rate_, path);
    return {};
}

std::expected<void, std::string> PipeWireCapture::stop() {
    std::lock_guard lock(mutex_);
    if (!capturing_.load(std::memory_order_relaxed)) return {};

    capturing_.store(false, std::memory_order_release);
    teardown_stream();

    if (writer_thread_.joinable()) {
        writer_thread_.request_stop();
        writer_thread_.join();
    }
    drain();

    if (ring_.dropped() > 0) {
        log_.warn("audio: ring overflow, dropped {} samples", ring_.dropped());
    }
    log_.debug("audio: recorded {:.2f}s", writer_.duration_s());

    if (!writer_.finalize()) {
        return std::unexpected("failed to finalize recording");
    }
    return {};
}

void PipeWireCapture::teardown_stream() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::writer_loop(std::stop_token st) {
    while (!st.stop_requested()) {
        std::this_thread::sleep_for(kDrainInterval);
        drain();
    }
}

void PipeWireCapture::drain() {
    std::array<int16_t, 4096> chunk;
    size_t n;
    while ((n = ring_.read(chunk)) > 0) {
        writer_.write(std::span<const int16_t>(chunk.data(), n));
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = reinterpret_cast<const int16_t*>(
        static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    size_t count = d->chunk->size / sizeof(int16_t);

    if (self->capturing_.load(std::memory_order_relaxed)) {
        self->ring_.write(std::span<const int16_t>(data, count));
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (error) {
        self->log_.warn("audio: stream state {} -> {}: {}",
                        pw_stream_state_as_string(old),
                        pw_stream_state_as_string(state),
                        error);
    }
}
