#include "fs.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <optional>
#include <system_error>
#include <vector>
#include <fmt/core.h>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#ifdef __linux__
    #include <liburing.h>
#endif

namespace fdup::adapters::fs {

namespace {

constexpr std::size_t kBufferSize = 64 * 1024;
constexpr std::size_t kUringChunk = 4 * 1024 * 1024; // 4 MB

auto last_errno_error(std::string_view context, const std::filesystem::path& path) -> infra::Error {
    return infra::make_error_from(std::error_code(errno, std::generic_category()),
                                  fmt::format("{} {}", context, path.string()));
}

// Закрывает дескриптор при выходе из области видимости
class UniqueFd {
public:
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { if (fd_ >= 0) ::close(fd_); }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

    // close() на записываемом файле может вернуть отложенную ошибку (NFS, ENOSPC)
    [[nodiscard]] int release_and_close() {
        const int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

auto open_destination(const std::filesystem::path& dst) -> int {
    return ::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
}

// write() до конца буфера с учётом частичных записей и EINTR
auto write_all(int fd, const char* data, std::size_t size, off_t offset) -> bool {
    while (size > 0) {
        const ssize_t n = ::pwrite(fd, data, size, offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
        offset += n;
    }
    return true;
}

} // namespace

auto select_strategy(std::uintmax_t file_size) -> CopyStrategy {
    if (file_size < 1'000'000) return CopyStrategy::Buffered;      // < 1 MB
    if (file_size < 100'000'000) return CopyStrategy::MMap;        // < 100 MB
    return CopyStrategy::Uring;                                    // >= 100 MB
}

// =============== Buffered I/O ===============
auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult {
    std::ifstream ifs(src, std::ios::binary);
    if (!ifs) {
        return std::unexpected(last_errno_error("Cannot open source", src));
    }
    std::ofstream ofs(dst, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        return std::unexpected(last_errno_error("Cannot create destination", dst));
    }

    std::vector<char> buffer(kBufferSize);
    while (ifs) {
        ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = ifs.gcount();
        if (got > 0 && !ofs.write(buffer.data(), got)) {
            return std::unexpected(last_errno_error("Write failed for", dst));
        }
    }
    if (ifs.bad()) {
        return std::unexpected(last_errno_error("Read failed for", src));
    }

    ofs.close();
    if (!ofs) {
        return std::unexpected(last_errno_error("Cannot finish writing", dst));
    }
    return {};
}

// =============== Memory-mapped I/O ===============
auto copy_file_mmap(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult {
    UniqueFd src_fd(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!src_fd.valid()) {
        return std::unexpected(last_errno_error("Cannot open source for mmap", src));
    }

    struct stat sb{};
    if (::fstat(src_fd.get(), &sb) == -1) {
        return std::unexpected(last_errno_error("fstat failed for", src));
    }
    const auto size = static_cast<std::size_t>(sb.st_size);
    if (size == 0) {
        return copy_file_buffered(src, dst);
    }

    void* src_map = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, src_fd.get(), 0);
    if (src_map == MAP_FAILED) {
        // Например, файловая система без поддержки mmap
        return copy_file_buffered(src, dst);
    }
    ::madvise(src_map, size, MADV_SEQUENTIAL);

    UniqueFd dst_fd(open_destination(dst));
    if (!dst_fd.valid()) {
        auto err = last_errno_error("Cannot create destination", dst);
        ::munmap(src_map, size);
        return std::unexpected(std::move(err));
    }

    const bool ok = write_all(dst_fd.get(), static_cast<const char*>(src_map), size, 0);
    std::optional<infra::Error> err;
    if (!ok) {
        err = last_errno_error("Incomplete write in mmap copy to", dst);
    }
    ::munmap(src_map, size);

    if (err) {
        return std::unexpected(std::move(*err));
    }
    if (dst_fd.release_and_close() != 0) {
        return std::unexpected(last_errno_error("Cannot finish writing", dst));
    }
    return {};
}

// =============== io_uring ===============
auto copy_file_uring(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult {
#ifdef __linux__
    io_uring ring{};
    if (io_uring_queue_init(8, &ring, 0) < 0) {
        return copy_file_buffered(src, dst); // fallback
    }

    struct RingGuard {
        io_uring* r;
        ~RingGuard() { io_uring_queue_exit(r); }
    } ring_guard{&ring};

    UniqueFd src_fd(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!src_fd.valid()) {
        return std::unexpected(last_errno_error("Cannot open source", src));
    }
    UniqueFd dst_fd(open_destination(dst));
    if (!dst_fd.valid()) {
        return std::unexpected(last_errno_error("Cannot create destination", dst));
    }

    // Одна операция в полёте: read -> write, смещение общее
    auto submit_one = [&ring](auto&& prep) -> int {
        io_uring_sqe* sqe = io_uring_get_sqe(&ring);
        if (!sqe) return -EBUSY;
        prep(sqe);
        int rc = io_uring_submit(&ring);
        if (rc < 0) return rc;

        io_uring_cqe* cqe = nullptr;
        do {
            rc = io_uring_wait_cqe(&ring, &cqe);
        } while (rc == -EINTR);
        if (rc < 0) return rc;

        const int res = cqe->res;
        io_uring_cqe_seen(&ring, cqe);
        return res;
    };

    std::vector<char> buffer(kUringChunk);
    std::uint64_t offset = 0;
    while (true) {
        const int got = submit_one([&](io_uring_sqe* sqe) {
            io_uring_prep_read(sqe, src_fd.get(), buffer.data(),
                               static_cast<unsigned>(buffer.size()), offset);
        });
        if (got < 0) {
            return std::unexpected(infra::make_error_from(
                std::error_code(-got, std::generic_category()),
                fmt::format("io_uring read failed for {}", src.string())));
        }
        if (got == 0) break; // EOF

        int written = 0;
        while (written < got) {
            const int n = submit_one([&](io_uring_sqe* sqe) {
                io_uring_prep_write(sqe, dst_fd.get(), buffer.data() + written,
                                    static_cast<unsigned>(got - written), offset + written);
            });
            if (n <= 0) {
                const int code = n < 0 ? -n : EIO;
                return std::unexpected(infra::make_error_from(
                    std::error_code(code, std::generic_category()),
                    fmt::format("io_uring write failed for {}", dst.string())));
            }
            written += n;
        }
        offset += static_cast<std::uint64_t>(got);
    }

    if (dst_fd.release_and_close() != 0) {
        return std::unexpected(last_errno_error("Cannot finish writing", dst));
    }
    return {};
#else
    return copy_file_buffered(src, dst);
#endif
}

// =============== Unified copy_file ===============
auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    CopyStrategy strategy
) -> infra::VoidResult {
    switch (strategy) {
        case CopyStrategy::MMap:
            return copy_file_mmap(src, dst);
        case CopyStrategy::Uring:
            return copy_file_uring(src, dst);
        case CopyStrategy::Buffered:
        default:
            return copy_file_buffered(src, dst);
    }
}

auto ensure_directory(const std::filesystem::path& dir) -> infra::VoidResult {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (!ec) {
        return {};
    }

    std::error_code stat_ec;
    const auto st = std::filesystem::status(dir, stat_ec);
    if (std::filesystem::is_directory(st)) {
        return {}; // другой воркер успел раньше
    }
    if (std::filesystem::exists(st)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Not a directory: {}", dir.string())));
    }
    if (ec == std::errc::file_exists || ec == std::errc::no_such_file_or_directory) {
        return std::unexpected(infra::make_error(infra::ErrorCode::DirectoryRace,
            fmt::format("Directory {} changed while being created: {}", dir.string(), ec.message())));
    }
    return std::unexpected(infra::make_error_from(ec,
        fmt::format("Cannot create directory {}", dir.string())));
}

} // namespace fdup::adapters::fs
