#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <fmt/core.h>

namespace fdup::testing {

// Временный каталог, удаляется вместе с содержимым
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                fmt::format("fdup_test_{:08x}{:08x}", rd(), rd());
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto operator/(const std::filesystem::path& rel) const -> std::filesystem::path {
        return path_ / rel;
    }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
}

inline auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream ifs(path, std::ios::binary);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

// Детерминированное содержимое заданного размера
inline auto pattern(std::size_t size, unsigned seed = 1) -> std::string {
    std::string s(size, '\0');
    std::minstd_rand rng(seed);
    for (auto& c : s) {
        c = static_cast<char>(rng() & 0xFF);
    }
    return s;
}

} // namespace fdup::testing
