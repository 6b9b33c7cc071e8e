#include "orchestrator.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../copy_executor/copy_executor.hpp"
#include "../safety/safety_guard.hpp"
#include "../../extensions/resume_ledger.hpp"

namespace fdup::core {

Orchestrator::Orchestrator(infra::RunConfig config, IdGenerator id_generator)
    : config_(std::move(config))
    , id_generator_(std::move(id_generator))
{}

auto Orchestrator::run(infra::ProgressSink& progress) -> infra::Result<RunSummary> {
    const auto& cfg = config_;

    // 1. Источники и лимит до любых изменений на диске
    if (auto res = PathPlanner::validate_sources(cfg.sources); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (auto res = SafetyGuard::check_request(cfg.sources.size(), cfg.copies, cfg.max_limit); !res) {
        return std::unexpected(std::move(res.error()));
    }

    // 2. План
    PathPlanner planner{cfg.output, id_generator_};
    auto plan = planner.plan(cfg.sources, cfg.copies, cfg.per_subfolder, cfg.randomize);
    if (!plan) {
        return std::unexpected(std::move(plan.error()));
    }

    RunSummary summary;
    summary.planned = plan->size();
    summary.dry_run = cfg.dry_run;

    // 3. Журнал возобновления
    extensions::ResumeLedger ledger;
    std::vector<CopyTask> pending;
    if (cfg.resume) {
        if (cfg.randomize) {
            spdlog::warn("Resume with randomized names: new names never match earlier runs, "
                         "all copies will be generated again");
        }
        auto loaded = extensions::ResumeLedger::load(cfg.output);
        if (!loaded) {
            return std::unexpected(std::move(loaded.error()));
        }
        ledger = std::move(*loaded);
        pending = ledger.filter(*plan);
        summary.skipped = plan->size() - pending.size();
        if (summary.skipped > 0) {
            spdlog::info("Resume: {} of {} copies already done", summary.skipped, summary.planned);
        }
    } else {
        pending = std::move(*plan);
    }

    spdlog::info("{}{} copies of {} source(s) into {}",
                 cfg.dry_run ? "[DRY-RUN] " : "",
                 pending.size(), cfg.sources.size(), cfg.output.string());

    // 4. Копирование
    CopyExecutor executor{ledger, progress, cfg.failure_policy};
    auto executed = executor.run(pending, cfg.workers, cfg.dry_run);

    // 5. Журнал сохраняется и после сбоя: выполненная часть не теряется
    if (cfg.resume && !cfg.dry_run) {
        if (auto saved = ledger.save(cfg.output); !saved) {
            if (executed) {
                return std::unexpected(std::move(saved.error()));
            }
            spdlog::error("Failed to save resume state: {}", saved.error().message);
        }
    }

    if (!executed) {
        return std::unexpected(std::move(executed.error()));
    }

    summary.processed = executed->processed;
    summary.completed_total = summary.skipped + summary.processed;

    // 6. Упаковка
    if (cfg.zip && !cfg.dry_run) {
        ArchivePacker packer{cfg.chunk_size};
        auto chunks = packer.pack(cfg.output);
        if (!chunks) {
            return std::unexpected(std::move(chunks.error()));
        }
        summary.archives = std::move(*chunks);
    }

    return summary;
}

} // namespace fdup::core
