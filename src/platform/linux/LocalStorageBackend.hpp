#pragma once
#include "sixftp/interfaces/IStorageBackend.hpp"
#include <string>

namespace sixftp {
namespace platform {
namespace linux_os {

// ============================================================================
// LocalStorageBackend - served directory on the local filesystem
// ============================================================================

class LocalStorageBackend final : public interfaces::IStorageBackend {
public:
    explicit LocalStorageBackend(const std::string& directory);

    const std::string& root() const override { return root_; }
    common::EmptyResult check_access() const override;

private:
    std::string root_;
};

} // namespace linux_os
} // namespace platform
} // namespace sixftp
