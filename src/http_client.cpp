// ===================== src/http_client.cpp =====================
#include "http_client.hpp"
#include "diag_logger.hpp"
#include "dns_resolver.hpp"
#include "parsed_url.hpp"
#include "ssl_session.hpp"
#include "tcp_socket.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace relay
{
    static std::string lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static std::string trim(const std::string &s)
    {
        size_t b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos)
            return {};
        size_t e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }

    std::string decode_chunked(const std::string &body)
    {
        std::string decoded;
        size_t pos = 0;
        while (pos < body.size())
        {
            size_t line_end = body.find("\r\n", pos);
            if (line_end == std::string::npos)
                break;
            // chunk extensions (";name=value") are ignored
            std::string size_str = body.substr(pos, line_end - pos);
            size_str = size_str.substr(0, size_str.find(';'));
            size_t chunk_size = 0;
            try
            {
                chunk_size = std::stoul(size_str, nullptr, 16);
            }
            catch (const std::exception &)
            {
                break;
            }
            pos = line_end + 2;
            if (chunk_size == 0)
                break;
            if (chunk_size > body.size() - pos)
            {
                decoded.append(body, pos, std::string::npos);
                break;
            }
            decoded.append(body, pos, chunk_size);
            pos += chunk_size + 2; // skip CRLF
        }
        return decoded;
    }

    HttpResponse parse_http_response(const std::string &raw)
    {
        size_t header_end = raw.find("\r\n\r\n");
        if (header_end == std::string::npos)
            throw std::runtime_error("malformed HTTP response (no header terminator)");

        const std::string head = raw.substr(0, header_end);
        size_t first_eol = head.find("\r\n");
        const std::string status_line = head.substr(0, first_eol);
        if (status_line.rfind("HTTP/", 0) != 0)
            throw std::runtime_error("malformed HTTP status line: " + status_line);

        HttpResponse resp;
        size_t sp = status_line.find(' ');
        if (sp == std::string::npos)
            throw std::runtime_error("malformed HTTP status line: " + status_line);
        try
        {
            resp.status = std::stoi(status_line.substr(sp + 1, 3));
        }
        catch (const std::exception &)
        {
            throw std::runtime_error("malformed HTTP status code: " + status_line);
        }

        size_t pos = first_eol == std::string::npos ? head.size() : first_eol + 2;
        while (pos < head.size())
        {
            size_t eol = head.find("\r\n", pos);
            if (eol == std::string::npos)
                eol = head.size();
            const std::string line = head.substr(pos, eol - pos);
            size_t colon = line.find(':');
            if (colon != std::string::npos)
                resp.headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
            pos = eol + 2;
        }

        resp.body = raw.substr(header_end + 4);
        auto te = resp.headers.find("transfer-encoding");
        if (te != resp.headers.end() && lower(te->second).find("chunked") != std::string::npos)
            resp.body = decode_chunked(resp.body);
        return resp;
    }

    HttpResponse HttpClient::get(const std::string &url, int timeout_ms, DiagLogger *diag)
    {
        ParsedURL parsed(url);
        auto addrs = DNSResolver::resolve(parsed.host, parsed.port);
        const std::string req = parsed.toGetRequestString();

        std::string last_error = "no addresses";
        for (const auto &ra : addrs)
        {
            TcpSocket tcp;
            ConnectStatus cs = tcp.connectWithTimeout(ra, timeout_ms);
            if (cs != ConnectStatus::Connected)
            {
                last_error = std::string("connect ") + to_string(cs);
                continue;
            }
            if (!tcp.setIoTimeout(timeout_ms))
            {
                last_error = "setsockopt timeout failed";
                continue;
            }

            std::string raw;
            if (parsed.isHttps())
            {
                SslSession tls;
                if (!tls.handshake(tcp.fd(), parsed.host))
                {
                    last_error = "TLS handshake failed: " + tls.lastError();
                    continue;
                }
                if (!tls.sendAll(req))
                {
                    last_error = "TLS send failed";
                    continue;
                }
                raw = tls.recvAll();
            }
            else
            {
                if (!tcp.sendAll(req))
                {
                    last_error = "TCP send failed";
                    continue;
                }
                raw = tcp.recvAll();
            }

            if (raw.empty())
            {
                last_error = "empty response";
                continue;
            }
            HttpResponse resp = parse_http_response(raw);
            diag_log(diag, "HTTP_GET url=" + url + " status=" + std::to_string(resp.status) +
                               " bytes=" + std::to_string(resp.body.size()));
            return resp;
        }

        diag_log(diag, "HTTP_GET_FAIL url=" + url + " err=" + last_error);
        throw std::runtime_error("GET " + url + " failed: " + last_error);
    }
} // namespace relay
