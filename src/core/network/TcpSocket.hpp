#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace sixftp {
namespace core {
namespace network {

    enum class SocketError {
        Ok,
        WouldBlock,
        Timeout,      // wait_readable() expired
        Disconnected,
        Fatal
    };

    // Owns a connected stream socket; closes it on destruction.
    class TcpSocket {
    public:
        explicit TcpSocket(int fd);
        ~TcpSocket();

        TcpSocket(const TcpSocket&) = delete;
        TcpSocket& operator=(const TcpSocket&) = delete;

        bool set_no_delay(bool enable);

        // Loops until every byte is written
        SocketError send_all(const std::string& data);

        // Returns number of bytes received
        std::pair<size_t, SocketError> recv(uint8_t* buffer, size_t max_size);

        // poll() for readability. Ok, Timeout, Disconnected (hangup) or Fatal.
        SocketError wait_readable(int timeout_ms);

        // "ip:port" of the remote end, "?" when unknown
        std::string peer_name() const;

        void close_socket();
        bool is_valid() const { return fd_ >= 0; }
        int fd() const { return fd_; }

    private:
        int fd_;
    };

} // namespace network
} // namespace core
} // namespace sixftp
