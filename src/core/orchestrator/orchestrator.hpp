#pragma once

#include <cstdint>
#include <vector>
#include "../archive/archive_packer.hpp"
#include "../planner/path_planner.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"

namespace fdup::core {

struct RunSummary {
    std::uint64_t planned = 0;          // размер полного плана
    std::uint64_t skipped = 0;          // уже были в журнале
    std::uint64_t processed = 0;        // выполнено в этом запуске
    std::uint64_t completed_total = 0;  // skipped + processed
    bool dry_run = false;
    std::vector<ArchiveChunk> archives;
};

/// Полный цикл одного запуска:
/// sources -> SafetyGuard -> план -> журнал -> копирование -> сохранение журнала -> ZIP.
class Orchestrator {
public:
    explicit Orchestrator(infra::RunConfig config, IdGenerator id_generator = random_hex_id);

    [[nodiscard]] auto run(infra::ProgressSink& progress) -> infra::Result<RunSummary>;

    [[nodiscard]] auto config() const -> const infra::RunConfig& { return config_; }

private:
    infra::RunConfig config_;
    IdGenerator id_generator_;
};

} // namespace fdup::core
