#include "copy_executor.hpp"
#include <algorithm>
#include <chrono>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"
#include "../../infra/interrupt.hpp"
#include "../../infra/retry.hpp"
#include "../../infra/thread_pool/thread_pool.hpp"

namespace fdup::core {

void CopyStats::reset() {
    processed.store(0);
    bytes_copied.store(0);
    failed.store(0);
    cancelled.store(0);
}

CopyExecutor::CopyExecutor(extensions::ResumeLedger& ledger,
                           infra::ProgressSink& progress,
                           infra::FailurePolicy policy,
                           MetadataCopier copy_metadata)
    : ledger_(ledger), progress_(progress), policy_(policy)
    , copy_metadata_(std::move(copy_metadata)) {}

auto CopyExecutor::run(const std::vector<CopyTask>& tasks,
                       std::size_t worker_count,
                       bool dry_run)
    -> infra::Result<ExecutionReport>
{
    stats_.reset();
    {
        std::lock_guard lock(failures_mutex_);
        failures_.clear();
    }

    const std::uint64_t total = tasks.size();
    progress_.on_start(total);

    const auto start_time = std::chrono::steady_clock::now();
    std::atomic<bool> abort{false};

    if (total > 0) {
        // Потоков не больше, чем задач
        infra::ThreadPool pool{std::min<std::size_t>(worker_count, tasks.size())};

        auto cancel_remaining = [&pool, this] {
            stats_.cancelled.fetch_add(pool.cancel_pending(), std::memory_order_relaxed);
        };

        for (std::size_t i = 0; i < tasks.size(); ++i) {
            pool.enqueue([&, this, i]() {
                const auto& task = tasks[i];
                if (abort.load(std::memory_order_relaxed) || infra::is_interrupted()) {
                    stats_.cancelled.fetch_add(1, std::memory_order_relaxed);
                    cancel_remaining();
                    return;
                }

                auto fail = [&](infra::Error&& error) {
                    record_failure_(task, std::move(error));
                    if (policy_ == infra::FailurePolicy::FailFast) {
                        abort.store(true, std::memory_order_relaxed);
                        cancel_remaining();
                    }
                };

                // Исключение из воркера иначе потерялось бы в packaged_task
                try {
                    if (!dry_run) {
                        auto res = copy_one_(task);
                        if (!res) {
                            fail(std::move(res.error()));
                            return;
                        }
                        stats_.bytes_copied.fetch_add(*res, std::memory_order_relaxed);
                    }

                    ledger_.record(task.id);
                    const auto current = stats_.processed.fetch_add(1, std::memory_order_relaxed) + 1;

                    const auto elapsed = std::chrono::duration<double>(
                        std::chrono::steady_clock::now() - start_time).count();
                    progress_.on_progress(infra::ProgressEvent{
                        .current = current,
                        .total = total,
                        .rate = elapsed > 0 ? current / elapsed : 0.0
                    });
                } catch (const std::exception& e) {
                    fail(infra::make_error(infra::ErrorCode::CopyFailure,
                        fmt::format("Unexpected error while copying {}: {}",
                                    task.destination.string(), e.what())));
                }
            });
        }

        pool.wait();
    }

    progress_.on_finish();

    auto snapshot = report();

    if (infra::is_interrupted()) {
        spdlog::warn("Interrupted: {} of {} tasks completed", snapshot.processed, total);
        return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
            fmt::format("Interrupted after {} of {} copies", snapshot.processed, total)));
    }

    const auto accounted = snapshot.processed + snapshot.failed + snapshot.cancelled;
    if (accounted < total) {
        return std::unexpected(infra::log_and_return(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("{} of {} copies finished without a result",
                        total - accounted, total))));
    }

    if (!snapshot.failures.empty()) {
        const auto& first = snapshot.failures.front();
        if (policy_ == infra::FailurePolicy::FailFast) {
            return std::unexpected(infra::make_error(infra::ErrorCode::CopyFailure,
                fmt::format("Copy failed for {}: {} ({} queued copies cancelled)",
                            first.id, first.error.message, snapshot.cancelled)));
        }
        return std::unexpected(infra::make_error(infra::ErrorCode::CopyFailure,
            fmt::format("{} of {} copies failed; first failure {}: {}",
                        snapshot.failed, total, first.id, first.error.message)));
    }

    return snapshot;
}

auto CopyExecutor::report() const -> ExecutionReport {
    ExecutionReport snapshot{
        .processed = stats_.processed.load(),
        .bytes_copied = stats_.bytes_copied.load(),
        .failed = stats_.failed.load(),
        .cancelled = stats_.cancelled.load(),
        .failures = {}
    };
    std::lock_guard lock(failures_mutex_);
    snapshot.failures = failures_;
    return snapshot;
}

auto CopyExecutor::copy_one_(const CopyTask& task) -> infra::Result<std::uint64_t> {
    if (auto dir = ensure_parent_(task.destination.parent_path()); !dir) {
        return std::unexpected(std::move(dir.error()));
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(task.source, ec);
    if (ec) {
        return std::unexpected(infra::make_error_from(ec,
            fmt::format("Cannot stat source {}", task.source.string())));
    }

    const auto strategy = adapters::fs::select_strategy(file_size);
    auto res = adapters::fs::copy_file(task.source, task.destination, strategy);
    if (!res) {
        return std::unexpected(std::move(res.error()));
    }

    // Метаданные после содержимого; без них копия не считается готовой
    if (auto meta = copy_metadata_(task.source, task.destination); !meta) {
        return std::unexpected(std::move(meta.error()));
    }

    return file_size;
}

auto CopyExecutor::ensure_parent_(const std::filesystem::path& dir) -> infra::VoidResult {
    const auto key = dir.string();
    {
        std::lock_guard lock(dirs_mutex_);
        if (known_dirs_.contains(key)) {
            return {};
        }
    }

    auto res = infra::with_retry([&dir]() {
        return adapters::fs::ensure_directory(dir);
    });
    if (!res) {
        return res;
    }

    std::lock_guard lock(dirs_mutex_);
    known_dirs_.insert(key);
    return {};
}

void CopyExecutor::record_failure_(const CopyTask& task, infra::Error&& error) {
    stats_.failed.fetch_add(1, std::memory_order_relaxed);
    auto logged = infra::log_and_return(std::move(error));

    std::lock_guard lock(failures_mutex_);
    failures_.push_back(TaskFailure{.id = task.id, .error = std::move(logged)});
}

} // namespace fdup::core
