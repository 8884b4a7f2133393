#include "Renderer.h"
#include <algorithm>
#include <iostream>

Renderer::Renderer(SnapshotStore& store, const TextPainter& painter, FrameSink& sink,
                   const RendererConfig& config)
    : store_(store),
      painter_(painter),
      sink_(sink),
      config_(config),
      frame_(config.width, config.height),
      last_log_(std::chrono::steady_clock::now()) {
    layout_.viewport_width = frame_.width();
    layout_.line_height = painter_.FontHeight() + config_.line_padding;
    layout_.ms_per_px = config_.ms_per_px;
}

bool Renderer::RenderFrame(std::chrono::milliseconds elapsed) {
    auto render_start = std::chrono::steady_clock::now();

    // Held for the whole frame; the sampler may publish a newer one meanwhile
    std::shared_ptr<const Snapshot> snapshot = store_.Current();

    // Width is recomputed every frame, never written back into the snapshot
    widths_.clear();
    for (const auto& line : snapshot->lines) {
        widths_.push_back(std::max(0, painter_.MeasureWidth(line.text)));
    }

    frame_.Clear(config_.theme.background);
    placements_ = LayoutLines(widths_, layout_, elapsed);
    for (size_t i = 0; i < placements_.size(); ++i) {
        const auto& p = placements_[i];
        painter_.DrawText(frame_, p.x, p.y, snapshot->lines[i].text, config_.theme.text);
    }

    auto submit_start = std::chrono::steady_clock::now();
    bool ok = sink_.Submit(frame_);
    auto submit_end = std::chrono::steady_clock::now();

    render_time_acc_ += std::chrono::duration<double>(submit_start - render_start).count();
    submit_time_acc_ += std::chrono::duration<double>(submit_end - submit_start).count();
    frames_++;
    if (!ok) failed_submits_++;
    return ok;
}

void Renderer::Run(const volatile sig_atomic_t& running) {
    const auto start_time = std::chrono::steady_clock::now();
    last_log_ = start_time;
    while (running) {
        auto now = std::chrono::steady_clock::now();
        RenderFrame(std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time));
        logPerf(std::chrono::steady_clock::now());
    }
}

void Renderer::logPerf(std::chrono::steady_clock::time_point now) {
    if (config_.perf_log_sec <= 0) return;
    auto log_elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - last_log_).count();
    if (log_elapsed < config_.perf_log_sec) return;

    double sec = static_cast<double>(log_elapsed);
    std::cerr << "LCD PERF: fps=" << (frames_ / sec)
              << " render_ms=" << (render_time_acc_ * 1000.0)
              << " submit_ms=" << (submit_time_acc_ * 1000.0)
              << " failed_submits=" << failed_submits_
              << " snapshot_version=" << store_.Version()
              << std::endl;
    render_time_acc_ = 0.0;
    submit_time_acc_ = 0.0;
    frames_ = 0;
    failed_submits_ = 0;
    last_log_ = now;
}
