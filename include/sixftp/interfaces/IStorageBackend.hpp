#pragma once
#include <string>
#include "sixftp/common/Result.hpp"

namespace sixftp {
namespace interfaces {

// ============================================================================
// Storage Backend Interface
// ============================================================================
// The filesystem root served by the transfer engine. Built from the served
// directory path only; reading and writing files belongs to the engine.
// ============================================================================

class IStorageBackend {
public:
    virtual ~IStorageBackend() = default;

    // Absolute path of the served root
    virtual const std::string& root() const = 0;

    // Root exists, is a directory and can be listed
    virtual common::EmptyResult check_access() const = 0;
};

} // namespace interfaces
} // namespace sixftp
