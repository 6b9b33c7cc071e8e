#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <zip.h>
#include "../error_handler/error.hpp"

namespace fdup::infra::zip {

// ZIP-архив через libzip: записи deflate, имена в UTF-8.
// Данные читаются из исходных файлов только в finish(); libzip пишет во
// временный файл рядом и переименовывает его, так что недописанного архива
// на месте path() не бывает. ZIP64 libzip включает сам.
class ZipWriter {
public:
    explicit ZipWriter(std::filesystem::path archive_path);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    [[nodiscard]] auto open() -> VoidResult;

    // Ставит файл source в очередь как запись entry_name ('/' как разделитель)
    [[nodiscard]] auto add_file(const std::filesystem::path& source,
                                std::string_view entry_name) -> VoidResult;

    // Сжимает очередь и закрывает архив. Прерывание (SIGINT/SIGTERM) отменяет
    // запись: Interrupted, архив не создаётся.
    [[nodiscard]] auto finish() -> VoidResult;

    [[nodiscard]] auto entry_count() const -> std::size_t { return entries_; }
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    auto archive_error_(std::string_view what) const -> Error;

    std::filesystem::path path_;
    zip_t* archive_ = nullptr;
    std::size_t entries_ = 0;
};

} // namespace fdup::infra::zip
