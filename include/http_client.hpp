// ===================== include/http_client.hpp =====================
#pragma once
#include <map>
#include <string>

namespace relay
{
    class DiagLogger;

    struct HttpResponse
    {
        int status = 0;
        std::map<std::string, std::string> headers; // lower-cased names
        std::string body;                           // de-chunked
    };

    // Parses a raw HTTP/1.x response; throws std::runtime_error on a missing
    // or malformed status line.
    HttpResponse parse_http_response(const std::string &raw);

    // Decodes a Transfer-Encoding: chunked body; stops at the zero chunk or
    // the first malformed size line.
    std::string decode_chunked(const std::string &body);

    class HttpClient
    {
    public:
        // GET over http:// or https://, trying each resolved address in turn.
        // Throws std::runtime_error when no address yields a response.
        static HttpResponse get(const std::string &url, int timeout_ms, DiagLogger *diag = nullptr);
    };
} // namespace relay
