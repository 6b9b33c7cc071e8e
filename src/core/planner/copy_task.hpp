#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace fdup::core {

// Одна запланированная операция копирования. После планирования не меняется.
struct CopyTask {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::string id;                 // ключ в журнале resume
    std::uint64_t copy_index = 0;   // 1..copies
};

} // namespace fdup::core
