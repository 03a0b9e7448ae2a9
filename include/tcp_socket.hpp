// ===================== include/tcp_socket.hpp =====================
#pragma once
#include <string>
#include "dns_resolver.hpp"

namespace relay
{
    enum class ConnectStatus
    {
        Connected,
        Refused,
        TimedOut,
        Unreachable,
        SocketError,
    };

    const char *to_string(ConnectStatus s);

    class TcpSocket
    {
        int sockfd_;

    public:
        TcpSocket();
        ~TcpSocket();

        TcpSocket(const TcpSocket &) = delete;
        TcpSocket &operator=(const TcpSocket &) = delete;

        void closeSocket();

        // Non-blocking connect bounded by timeout_ms; the socket is left
        // blocking again on success.
        ConnectStatus connectWithTimeout(const ResolvedAddress &ra, int timeout_ms);

        // SO_RCVTIMEO / SO_SNDTIMEO for the blocking send/recv helpers.
        bool setIoTimeout(int timeout_ms);

        bool sendAll(const std::string &data) const;
        std::string recvAll() const;
        int fd() const { return sockfd_; }
    };
} // namespace relay
