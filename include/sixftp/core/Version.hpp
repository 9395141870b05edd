#pragma once

#ifndef SIXFTP_VERSION
#define SIXFTP_VERSION "0.0.0"
#endif

namespace sixftp {
namespace core {

    constexpr const char* PROGRAM_NAME = "sixftp";
    constexpr const char* PROGRAM_VERSION = SIXFTP_VERSION;
    constexpr const char* PROGRAM_ABOUT = "A simple portable FTP server";

} // namespace core
} // namespace sixftp
