#include "zip_writer.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../interrupt.hpp"

namespace fdup::infra::zip {

namespace {

auto libzip_message(int code) -> std::string {
    zip_error_t err;
    zip_error_init_with_code(&err, code);
    std::string message = zip_error_strerror(&err);
    zip_error_fini(&err);
    return message;
}

// libzip опрашивает колбэк во время zip_close
auto cancel_on_interrupt(zip_t*, void*) -> int {
    return is_interrupted() ? 1 : 0;
}

auto unix_attributes(const std::filesystem::path& file) -> zip_uint32_t {
    std::error_code ec;
    const auto st = std::filesystem::status(file, ec);
    const auto perms = ec ? 0644u : static_cast<zip_uint32_t>(st.permissions()) & 0777u;
    return (0100000u | perms) << 16; // S_IFREG
}

} // namespace

ZipWriter::ZipWriter(std::filesystem::path archive_path)
    : path_(std::move(archive_path))
{}

ZipWriter::~ZipWriter() {
    if (archive_ != nullptr) {
        zip_discard(archive_);
    }
}

auto ZipWriter::open() -> VoidResult {
    if (archive_ != nullptr) {
        return std::unexpected(make_error(ErrorCode::ArchiveWriteFailure,
            fmt::format("Archive {} is already open", path_.string())));
    }

    int code = 0;
    archive_ = zip_open(path_.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &code);
    if (archive_ == nullptr) {
        return std::unexpected(make_error(ErrorCode::ArchiveWriteFailure,
            fmt::format("Cannot create archive {}: {}", path_.string(), libzip_message(code))));
    }
    if (zip_register_cancel_callback_with_state(archive_, cancel_on_interrupt,
                                                nullptr, nullptr) < 0) {
        return std::unexpected(archive_error_("Cannot register cancel callback"));
    }
    return {};
}

auto ZipWriter::add_file(const std::filesystem::path& source, std::string_view entry_name)
    -> VoidResult
{
    if (archive_ == nullptr) {
        return std::unexpected(make_error(ErrorCode::ArchiveWriteFailure,
            fmt::format("Archive {} is not open", path_.string())));
    }

    // libzip откроет файл только в finish(): отсутствие проверяем сразу
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return std::unexpected(make_error(ErrorCode::ArchiveWriteFailure,
            fmt::format("Cannot add {} to {}: not a regular file",
                        source.string(), path_.string())));
    }

    zip_error_t err;
    zip_error_init(&err);
    zip_source_t* src = zip_source_file_create(source.c_str(), 0, 0, &err);
    if (src == nullptr) {
        const std::string message = zip_error_strerror(&err);
        zip_error_fini(&err);
        return std::unexpected(make_error(ErrorCode::ArchiveWriteFailure,
            fmt::format("Cannot read {}: {}", source.string(), message)));
    }
    zip_error_fini(&err);

    const std::string name(entry_name);
    const zip_int64_t index = zip_file_add(archive_, name.c_str(), src, ZIP_FL_ENC_UTF_8);
    if (index < 0) {
        zip_source_free(src);
        return std::unexpected(archive_error_(fmt::format("Cannot add entry {}", name)));
    }

    const auto entry = static_cast<zip_uint64_t>(index);
    if (zip_set_file_compression(archive_, entry, ZIP_CM_DEFLATE, 0) < 0) {
        return std::unexpected(archive_error_(fmt::format("Cannot set compression for {}", name)));
    }
    if (zip_file_set_external_attributes(archive_, entry, 0, ZIP_OPSYS_UNIX,
                                         unix_attributes(source)) < 0) {
        return std::unexpected(archive_error_(fmt::format("Cannot set attributes for {}", name)));
    }

    ++entries_;
    return {};
}

auto ZipWriter::finish() -> VoidResult {
    if (archive_ == nullptr) {
        return std::unexpected(make_error(ErrorCode::ArchiveWriteFailure,
            fmt::format("Archive {} is not open", path_.string())));
    }

    if (zip_close(archive_) < 0) {
        const bool cancelled = zip_error_code_zip(zip_get_error(archive_)) == ZIP_ER_CANCELLED;
        auto error = cancelled
            ? make_error(ErrorCode::Interrupted,
                  fmt::format("Archive {} cancelled by interrupt", path_.string()))
            : archive_error_("Cannot write archive");
        zip_discard(archive_);
        archive_ = nullptr;
        return std::unexpected(std::move(error));
    }
    archive_ = nullptr;

    spdlog::debug("Wrote {} ({} entries)", path_.string(), entries_);
    return {};
}

auto ZipWriter::archive_error_(std::string_view what) const -> Error {
    return make_error(ErrorCode::ArchiveWriteFailure,
        fmt::format("{} [{}]: {}", what, path_.string(), zip_strerror(archive_)));
}

} // namespace fdup::infra::zip
