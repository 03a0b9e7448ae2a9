// ===================== src/tcp_socket.cpp =====================
#include "tcp_socket.hpp"
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>

namespace relay
{
    const char *to_string(ConnectStatus s)
    {
        switch (s)
        {
        case ConnectStatus::Connected: return "connected";
        case ConnectStatus::Refused: return "refused";
        case ConnectStatus::TimedOut: return "timeout";
        case ConnectStatus::Unreachable: return "unreachable";
        case ConnectStatus::SocketError: return "socket_error";
        }
        return "?";
    }

    static ConnectStatus classify_errno(int err)
    {
        switch (err)
        {
        case ECONNREFUSED:
        case ECONNRESET:
            return ConnectStatus::Refused;
        case ETIMEDOUT:
            return ConnectStatus::TimedOut;
        default:
            return ConnectStatus::Unreachable;
        }
    }

    TcpSocket::TcpSocket() : sockfd_(-1) {}
    TcpSocket::~TcpSocket() { closeSocket(); }

    void TcpSocket::closeSocket()
    {
        if (sockfd_ != -1)
        {
            ::close(sockfd_);
            sockfd_ = -1;
        }
    }

    ConnectStatus TcpSocket::connectWithTimeout(const ResolvedAddress &ra, int timeout_ms)
    {
        using clk = std::chrono::steady_clock;

        closeSocket();
        sockfd_ = ::socket(ra.family, ra.socktype, ra.protocol);
        if (sockfd_ == -1)
            return ConnectStatus::SocketError;

        int flags = ::fcntl(sockfd_, F_GETFL, 0);
        if (flags == -1 || ::fcntl(sockfd_, F_SETFL, flags | O_NONBLOCK) == -1)
        {
            closeSocket();
            return ConnectStatus::SocketError;
        }

        ConnectStatus status = ConnectStatus::Connected;
        if (::connect(sockfd_, reinterpret_cast<const sockaddr *>(&ra.addr), ra.addrlen) != 0)
        {
            if (errno != EINPROGRESS)
            {
                status = classify_errno(errno);
                closeSocket();
                return status;
            }

            // poll() may return early on EINTR; keep waiting until the deadline.
            auto deadline = clk::now() + std::chrono::milliseconds(timeout_ms);
            while (true)
            {
                auto remain = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clk::now());
                if (remain.count() <= 0)
                {
                    status = ConnectStatus::TimedOut;
                    break;
                }
                pollfd pfd{sockfd_, POLLOUT, 0};
                int rc = ::poll(&pfd, 1, static_cast<int>(remain.count()));
                if (rc < 0 && errno == EINTR)
                    continue;
                if (rc <= 0)
                {
                    status = rc == 0 ? ConnectStatus::TimedOut : ConnectStatus::SocketError;
                    break;
                }
                int err = 0;
                socklen_t len = sizeof(err);
                if (::getsockopt(sockfd_, SOL_SOCKET, SO_ERROR, &err, &len) < 0)
                    status = ConnectStatus::SocketError;
                else if (err != 0)
                    status = classify_errno(err);
                break;
            }
        }

        if (status == ConnectStatus::Connected && ::fcntl(sockfd_, F_SETFL, flags) == -1)
            status = ConnectStatus::SocketError;
        if (status != ConnectStatus::Connected)
            closeSocket();
        return status;
    }

    bool TcpSocket::setIoTimeout(int timeout_ms)
    {
        if (sockfd_ == -1)
            return false;
        timeval tv{static_cast<time_t>(timeout_ms / 1000),
                   static_cast<suseconds_t>((timeout_ms % 1000) * 1000)};
        return ::setsockopt(sockfd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
               ::setsockopt(sockfd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
    }

    bool TcpSocket::sendAll(const std::string &data) const
    {
        if (sockfd_ == -1){
            return false;
        }
        size_t sent = 0;
        while (sent < data.size())
        {
            ssize_t n = ::send(sockfd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0)
                return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    std::string TcpSocket::recvAll() const
    {
        std::string response;
        response.reserve(8192);
        char buf[4096];
        while (true)
        {
            ssize_t bytes = ::recv(sockfd_, buf, sizeof(buf), 0);
            if (bytes <= 0)
                break;
            response.append(buf, static_cast<size_t>(bytes));
        }
        return response;
    }
} // namespace relay
