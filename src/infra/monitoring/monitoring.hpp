#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace fdup::infra {

struct ProgressEvent {
    std::uint64_t current = 0;
    std::uint64_t total = 0;
    double rate = 0.0; // файлов в секунду с начала выполнения
};

// Приёмник прогресса. on_progress вызывается из рабочих потоков.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void on_start(std::uint64_t /*total*/) {}
    virtual void on_progress(const ProgressEvent& event) = 0;
    virtual void on_finish() {}
};

class NullProgress final : public ProgressSink {
public:
    void on_progress(const ProgressEvent&) override {}
};

// Консольный прогресс-бар, перерисовывается фоновым потоком
class ProgressMonitor final : public ProgressSink {
public:
    struct Stats {
        std::uint64_t total = 0;
        std::uint64_t current = 0;
        double rate = 0.0;
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor() override;

    void on_start(std::uint64_t total) override;
    void on_progress(const ProgressEvent& event) override;
    void on_finish() override;

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    std::atomic<std::uint64_t> total_{0};
    std::atomic<std::uint64_t> current_{0};
    std::atomic<double> rate_{0.0};

    const bool enabled_;
    std::atomic<bool> finished_{false};
    std::unique_ptr<std::jthread> render_thread_;
};

} // namespace fdup::infra
