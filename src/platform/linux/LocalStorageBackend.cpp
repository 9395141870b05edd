#include "LocalStorageBackend.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

// POSIX headers
#include <sys/stat.h>
#include <unistd.h>

namespace sixftp {
namespace platform {
namespace linux_os {

LocalStorageBackend::LocalStorageBackend(const std::string& directory) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(directory, ec);
    root_ = ec ? directory : absolute.lexically_normal().string();

    // "/srv/ftp/." normalizes to "/srv/ftp/"
    if (root_.size() > 1 && root_.back() == '/') {
        root_.pop_back();
    }
}

common::EmptyResult LocalStorageBackend::check_access() const {
    struct stat st;
    if (stat(root_.c_str(), &st) != 0) {
        return common::EmptyResult::err(common::ErrorCode::EngineError,
            "Storage root " + root_ + ": " + std::strerror(errno));
    }
    if (!S_ISDIR(st.st_mode)) {
        return common::EmptyResult::err(common::ErrorCode::EngineError,
            "Storage root " + root_ + " is not a directory");
    }
    if (access(root_.c_str(), R_OK | X_OK) != 0) {
        return common::EmptyResult::err(common::ErrorCode::PermissionDenied,
            "Cannot access storage root: " + root_);
    }
    return common::EmptyResult::success();
}

} // namespace linux_os
} // namespace platform
} // namespace sixftp
