#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

namespace fdup::infra {

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
{}

ProgressMonitor::~ProgressMonitor() {
    on_finish();
}

void ProgressMonitor::on_start(std::uint64_t total) {
    total_.store(total);
    current_.store(0);
    rate_.store(0.0);
    finished_.store(false);
    if (enabled_ && total > 0 && !render_thread_) {
        start_rendering_thread_();
    }
}

void ProgressMonitor::on_progress(const ProgressEvent& event) {
    // События приходят не по порядку: храним максимум
    auto prev = current_.load(std::memory_order_relaxed);
    while (prev < event.current &&
           !current_.compare_exchange_weak(prev, event.current, std::memory_order_relaxed)) {
    }
    rate_.store(event.rate, std::memory_order_relaxed);
}

void ProgressMonitor::on_finish() {
    if (finished_.exchange(true)) {
        return;
    }
    if (render_thread_) {
        stop_rendering_thread_();
        render_();
        std::fputs("\n", stderr); // финальный перенос
    }
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .total = total_.load(),
        .current = current_.load(),
        .rate = rate_.load()
    };
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    render_thread_->request_stop();
    render_thread_.reset(); // join
}

void ProgressMonitor::render_() const {
    if (!enabled_) return;

    const auto stats = get_stats();
    if (stats.total == 0) return;

    const double fraction = std::min(1.0, static_cast<double>(stats.current) / stats.total);
    const int bar_width = 20;
    const int filled = static_cast<int>(fraction * bar_width);

    // ETA по текущей скорости
    std::string eta_str = "inf";
    if (stats.rate > 0) {
        const double eta_sec = (stats.total - stats.current) / stats.rate;
        if (std::isfinite(eta_sec)) {
            int seconds = static_cast<int>(eta_sec);
            int hours = seconds / 3600;
            int minutes = (seconds % 3600) / 60;
            seconds = seconds % 60;
            if (hours > 0) {
                eta_str = fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
            } else {
                eta_str = fmt::format("{:02d}:{:02d}", minutes, seconds);
            }
        }
    }

    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    // \r\033[K: вернуть каретку и очистить строку
    fmt::print(stderr,
        "\r\033[K[{}] {:3.0f}% | {:.1f} files/s | ETA: {} | {}/{} files",
        bar,
        fraction * 100.0,
        stats.rate,
        eta_str,
        stats.current,
        stats.total
    );
    std::fflush(stderr);
}

} // namespace fdup::infra
