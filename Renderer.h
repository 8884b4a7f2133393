#ifndef RENDERER_H
#define RENDERER_H

#include "FrameBuffer.h"
#include "FrameSink.h"
#include "ScrollLayout.h"
#include "SnapshotStore.h"
#include "TextPainter.h"
#include "Theme.h"
#include <chrono>
#include <csignal>
#include <cstdint>
#include <vector>

struct RendererConfig {
    int width = 320;
    int height = 170;
    int line_padding = 2;
    int64_t ms_per_px = 100;
    Theme theme = STATUS_THEME;
    int perf_log_sec = 5; // 0 disables the periodic LCD PERF line
};

// Continuous frame loop: latest snapshot -> layout -> draw -> submit.
// Holds no state across snapshots other than the scroll start time.
class Renderer {
public:
    Renderer(SnapshotStore& store, const TextPainter& painter, FrameSink& sink,
             const RendererConfig& config = RendererConfig());

    // Composes and submits one frame for the given time since scroll start.
    // Returns the transport result.
    bool RenderFrame(std::chrono::milliseconds elapsed);

    // Renders until running becomes 0. No frame-rate cap: the submit call paces the loop.
    void Run(const volatile sig_atomic_t& running);

    const FrameBuffer& frame() const { return frame_; }
    const std::vector<LinePlacement>& last_layout() const { return placements_; }
    const LayoutParams& layout_params() const { return layout_; }

private:
    void logPerf(std::chrono::steady_clock::time_point now);

    SnapshotStore& store_;
    const TextPainter& painter_;
    FrameSink& sink_;
    RendererConfig config_;
    LayoutParams layout_;
    FrameBuffer frame_;

    // Frame-local scratch, reused to avoid per-frame allocation
    std::vector<int> widths_;
    std::vector<LinePlacement> placements_;

    // Perf counters
    std::chrono::steady_clock::time_point last_log_;
    double render_time_acc_ = 0.0;
    double submit_time_acc_ = 0.0;
    int frames_ = 0;
    int failed_submits_ = 0;
};

#endif // RENDERER_H
