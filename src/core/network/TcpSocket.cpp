#include "TcpSocket.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sixftp {
namespace core {
namespace network {

    TcpSocket::TcpSocket(int fd) : fd_(fd) {}

    TcpSocket::~TcpSocket() {
        close_socket();
    }

    bool TcpSocket::set_no_delay(bool enable) {
        if (fd_ < 0) return false;
        int flag = enable ? 1 : 0;
        return setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) == 0;
    }

    SocketError TcpSocket::send_all(const std::string& data) {
        if (fd_ < 0) return SocketError::Fatal;

        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EPIPE || errno == ECONNRESET) return SocketError::Disconnected;
                return SocketError::Fatal;
            }
            sent += static_cast<size_t>(n);
        }
        return SocketError::Ok;
    }

    std::pair<size_t, SocketError> TcpSocket::recv(uint8_t* buffer, size_t max_size) {
        if (fd_ < 0) return {0, SocketError::Fatal};

        ssize_t received = ::recv(fd_, buffer, max_size, 0);

        if (received > 0) {
            return {static_cast<size_t>(received), SocketError::Ok};
        } else if (received == 0) {
            return {0, SocketError::Disconnected}; // EOF
        } else {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return {0, SocketError::WouldBlock};
            if (errno == ECONNRESET) return {0, SocketError::Disconnected};
            return {0, SocketError::Fatal};
        }
    }

    SocketError TcpSocket::wait_readable(int timeout_ms) {
        if (fd_ < 0) return SocketError::Fatal;

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = poll(&pfd, 1, timeout_ms);
        if (rc == 0) return SocketError::Timeout;
        if (rc < 0) return errno == EINTR ? SocketError::Timeout : SocketError::Fatal;
        if (pfd.revents & POLLIN) return SocketError::Ok; // data or EOF, recv() tells
        if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) return SocketError::Disconnected;
        return SocketError::Timeout;
    }

    std::string TcpSocket::peer_name() const {
        struct sockaddr_storage addr;
        socklen_t len = sizeof(addr);
        if (fd_ < 0 || getpeername(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
            return "?";
        }

        char host[INET6_ADDRSTRLEN] = {0};
        uint16_t port = 0;
        if (addr.ss_family == AF_INET) {
            auto* sa = reinterpret_cast<struct sockaddr_in*>(&addr);
            if (!inet_ntop(AF_INET, &sa->sin_addr, host, sizeof(host))) return "?";
            port = ntohs(sa->sin_port);
            return std::string(host) + ":" + std::to_string(port);
        }
        if (addr.ss_family == AF_INET6) {
            auto* sa = reinterpret_cast<struct sockaddr_in6*>(&addr);
            if (!inet_ntop(AF_INET6, &sa->sin6_addr, host, sizeof(host))) return "?";
            port = ntohs(sa->sin6_port);
            return "[" + std::string(host) + "]:" + std::to_string(port);
        }
        return "?";
    }

    void TcpSocket::close_socket() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

} // namespace network
} // namespace core
} // namespace sixftp
