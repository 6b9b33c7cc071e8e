// resume_ledger.hpp
#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>
#include "../infra/error_handler/error.hpp"
#include "../core/planner/copy_task.hpp"

namespace fdup::extensions {

// Множество идентификаторов завершённых задач.
// record() безопасен при вызове из нескольких воркеров одновременно.
class ResumeLedger {
public:
    static constexpr std::string_view kStateFileName = ".resume_state.json";
    static constexpr std::string_view kTempFileName = ".resume_state.json.tmp";

    ResumeLedger() = default;
    explicit ResumeLedger(std::unordered_set<std::string> completed);

    ResumeLedger(const ResumeLedger&) = delete;
    ResumeLedger& operator=(const ResumeLedger&) = delete;
    ResumeLedger(ResumeLedger&& other) noexcept;
    ResumeLedger& operator=(ResumeLedger&& other) noexcept;

    [[nodiscard]] static auto state_path(const std::filesystem::path& output_root)
        -> std::filesystem::path;

    /// Читает <output_root>/.resume_state.json.
    /// Нет файла: пустой журнал. Битый файл: CorruptResumeState, без сброса.
    [[nodiscard]] static auto load(const std::filesystem::path& output_root)
        -> infra::Result<ResumeLedger>;

    /// Задачи, id которых ещё нет в журнале (порядок сохраняется)
    [[nodiscard]] auto filter(const std::vector<core::CopyTask>& tasks) const
        -> std::vector<core::CopyTask>;

    void record(std::string id);

    [[nodiscard]] auto contains(const std::string& id) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;

    /// Отсортированная копия содержимого
    [[nodiscard]] auto snapshot() const -> std::vector<std::string>;

    /// JSON-массив строк: запись во временный файл, затем rename поверх старого
    [[nodiscard]] auto save(const std::filesystem::path& output_root) const
        -> infra::VoidResult;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> completed_;
};

} // namespace fdup::extensions
