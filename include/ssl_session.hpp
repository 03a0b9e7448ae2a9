// ===================== include/ssl_session.hpp =====================
#pragma once
#include <string>
#include <openssl/ssl.h>

namespace relay
{
    class SslSession
    {
        SSL_CTX *ctx_;
        SSL *ssl_;
        std::string last_error_;

    public:
        // verify_peer checks the chain against the system trust store and the
        // certificate name against the hostname passed to handshake().
        explicit SslSession(bool verify_peer = true);
        ~SslSession();

        SslSession(const SslSession &) = delete;
        SslSession &operator=(const SslSession &) = delete;

        bool handshake(int sockfd, const std::string &hostname);
        bool sendAll(const std::string &data) const;
        std::string recvAll() const;
        const std::string &lastError() const { return last_error_; }
    };
} // namespace relay
