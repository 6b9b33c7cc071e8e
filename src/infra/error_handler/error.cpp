#include "error.hpp"
#include <cerrno>
#include <cstdlib>
#include <fmt/core.h>

namespace fdup::infra {

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::InvalidInput:        return "InvalidInput";
        case ErrorCode::SourceNotFound:      return "SourceNotFound";
        case ErrorCode::LimitExceeded:       return "LimitExceeded";
        case ErrorCode::CorruptResumeState:  return "CorruptResumeState";
        case ErrorCode::CopyFailure:         return "CopyFailure";
        case ErrorCode::ArchiveWriteFailure: return "ArchiveWriteFailure";
        case ErrorCode::FileNotFound:        return "FileNotFound";
        case ErrorCode::PermissionDenied:    return "PermissionDenied";
        case ErrorCode::InvalidPath:         return "InvalidPath";
        case ErrorCode::DiskFull:            return "DiskFull";
        case ErrorCode::DirectoryRace:       return "DirectoryRace";
        case ErrorCode::Interrupted:         return "Interrupted";
        case ErrorCode::Unknown:             return "Unknown";
    }
    return "Unknown";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::InvalidInput:
        case ErrorCode::SourceNotFound:
        case ErrorCode::LimitExceeded:
        case ErrorCode::CorruptResumeState:
        case ErrorCode::FileNotFound:
        case ErrorCode::PermissionDenied:
        case ErrorCode::InvalidPath:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::InvalidInput:
        case ErrorCode::SourceNotFound:      return 2;
        case ErrorCode::LimitExceeded:       return 3;
        case ErrorCode::CorruptResumeState:  return 4;
        case ErrorCode::CopyFailure:         return 5;
        case ErrorCode::ArchiveWriteFailure: return 6;
        case ErrorCode::DiskFull:            return 20;
        case ErrorCode::Interrupted:         return 130; // SIGINT
        default:                             return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error make_error_from(const std::error_code& ec, std::string_view context,
                      const std::source_location& loc) {
    ErrorCode code = ErrorCode::Unknown;
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        switch (ec.value()) {
            case ENOENT:  code = ErrorCode::FileNotFound; break;
            case EACCES:
            case EPERM:
            case EROFS:   code = ErrorCode::PermissionDenied; break;
            case ENOSPC:
            case EDQUOT:  code = ErrorCode::DiskFull; break;
            case ENOTDIR:
            case EISDIR:
            case ENAMETOOLONG: code = ErrorCode::InvalidPath; break;
            default: break;
        }
    }
    return Error{code, fmt::format("{}: {}", context, ec.message()), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace fdup::infra
