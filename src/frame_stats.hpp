#pragma once
#include <cstdint>
#include <optional>

struct FrameStatsSample {
    double updatesPerSec = 0.0;
    double msPerDraw = 0.0;
};

// Update rate and average draw time over a fixed sampling window.
// Counters restart at every window boundary, whether or not the caller
// shows the sample.
class FrameStats {
public:
    explicit FrameStats(uint32_t windowMs = 500) : windowMs_(windowMs ? windowMs : 1) {}

    void start(uint32_t nowMs) {
        startMs_ = nowMs;
        clearCounters();
    }

    void addUpdate() { ++updates_; }
    void addDraw(double ms) {
        drawMs_ += ms;
        ++draws_;
    }

    // A sample once windowMs has passed since the window started, else nothing.
    std::optional<FrameStatsSample> poll(uint32_t nowMs) {
        const uint32_t elapsed = nowMs - startMs_;
        if (elapsed < windowMs_) return std::nullopt;

        FrameStatsSample s;
        s.updatesPerSec = updates_ * 1000.0 / elapsed;
        s.msPerDraw = draws_ > 0 ? drawMs_ / draws_ : 0.0;
        start(nowMs);
        return s;
    }

    int updates() const { return updates_; }
    int draws() const { return draws_; }

private:
    uint32_t windowMs_;
    uint32_t startMs_ = 0;
    int updates_ = 0;
    int draws_ = 0;
    double drawMs_ = 0.0;

    void clearCounters() {
        updates_ = 0;
        draws_ = 0;
        drawMs_ = 0.0;
    }
};
