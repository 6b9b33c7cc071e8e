#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <atomic>
#include <functional>
#include <mutex>
#include <unordered_set>
#include "../planner/copy_task.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../../extensions/metadata.hpp"
#include "../../extensions/resume_ledger.hpp"

namespace fdup::core {

struct TaskFailure {
    std::string id;
    infra::Error error;
};

struct ExecutionReport {
    std::uint64_t processed = 0;     // скопировано (или засчитано в dry-run)
    std::uint64_t bytes_copied = 0;
    std::uint64_t failed = 0;
    std::uint64_t cancelled = 0;     // не начаты из-за fail-fast или прерывания
    std::vector<TaskFailure> failures;
};

struct CopyStats {
    std::atomic<std::uint64_t> processed{0};
    std::atomic<std::uint64_t> bytes_copied{0};
    std::atomic<std::uint64_t> failed{0};
    std::atomic<std::uint64_t> cancelled{0};

    CopyStats() = default;

    // Запрещаем копирование и перемещение (из-за atomic)
    CopyStats(const CopyStats&) = delete;
    CopyStats& operator=(const CopyStats&) = delete;
    CopyStats(CopyStats&&) = delete;
    CopyStats& operator=(CopyStats&&) = delete;

    void reset();
};

// Перенос mtime и прав на готовую копию; ошибка проваливает задачу
using MetadataCopier = std::function<infra::VoidResult(const std::filesystem::path&,
                                                       const std::filesystem::path&)>;

class CopyExecutor {
public:
    CopyExecutor(extensions::ResumeLedger& ledger,
                 infra::ProgressSink& progress,
                 infra::FailurePolicy policy = infra::FailurePolicy::FailFast,
                 MetadataCopier copy_metadata = extensions::copy_metadata);

    /// Выполняет задачи пулом из worker_count потоков.
    /// Каждая завершённая задача попадает в журнал и в ProgressSink.
    /// dry_run: файловая система не меняется, задачи всё равно засчитываются.
    /// Ошибки: CopyFailure (по политике), Interrupted (SIGINT/SIGTERM).
    [[nodiscard]] auto run(const std::vector<CopyTask>& tasks,
                           std::size_t worker_count,
                           bool dry_run)
        -> infra::Result<ExecutionReport>;

    /// Статистика последнего run(), доступна и после ошибки
    [[nodiscard]] auto report() const -> ExecutionReport;

private:
    extensions::ResumeLedger& ledger_;
    infra::ProgressSink& progress_;
    const infra::FailurePolicy policy_;
    MetadataCopier copy_metadata_;

    auto copy_one_(const CopyTask& task) -> infra::Result<std::uint64_t>;
    auto ensure_parent_(const std::filesystem::path& dir) -> infra::VoidResult;
    void record_failure_(const CopyTask& task, infra::Error&& error);

    CopyStats stats_{};

    std::mutex dirs_mutex_;
    std::unordered_set<std::string> known_dirs_;

    mutable std::mutex failures_mutex_;
    std::vector<TaskFailure> failures_;
};

} // namespace fdup::core
