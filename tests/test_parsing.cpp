#include "geo_resolver.hpp"
#include "http_client.hpp"
#include "parsed_url.hpp"
#include "probe_result.hpp"

#include <iostream>
#include <stdexcept>

using namespace relay;

static int test_urls() {
    ParsedURL u("https://raw.githubusercontent.com/ipverse/asn-ip/master/as/13335/ipv4-aggregated.txt");
    if (u.scheme != "https" || u.port != 443 || u.host != "raw.githubusercontent.com")
        return 1;
    if (u.path != "/ipverse/asn-ip/master/as/13335/ipv4-aggregated.txt")
        return 2;
    const std::string req = u.toGetRequestString();
    if (req.rfind("GET /ipverse/", 0) != 0 || req.find("Host: raw.githubusercontent.com\r\n") == std::string::npos)
        return 3;

    ParsedURL p("http://1.2.3.4:8080");
    if (p.isHttps() || p.port != 8080 || p.path != "/")
        return 4;
    if (p.toGetRequestString().find("Host: 1.2.3.4:8080\r\n") == std::string::npos)
        return 5;

    const char* bad[] = {"ftp://x/", "http://host:0/", "http://host:abc/", "http:///path"};
    for (const char* s : bad) {
        try {
            ParsedURL x(s);
            return 6;
        } catch (const std::invalid_argument&) {
        }
    }
    return 0;
}

static int test_http_response() {
    HttpResponse r = parse_http_response(
        "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nTransfer-Encoding: chunked\r\n\r\n"
        "5\r\nhello\r\n7;ext=1\r\n, world\r\n0\r\n\r\n");
    if (r.status != 200 || r.body != "hello, world")
        return 11;
    if (r.headers["content-type"] != "text/plain")
        return 12;

    HttpResponse nf = parse_http_response("HTTP/1.0 404 Not Found\r\n\r\nmissing");
    if (nf.status != 404 || nf.body != "missing")
        return 13;

    try {
        parse_http_response("garbage\r\n\r\n");
        return 14;
    } catch (const std::runtime_error&) {
    }
    try {
        parse_http_response("HTTP/1.1 200 OK\r\n");
        return 15;
    } catch (const std::runtime_error&) {
    }
    if (decode_chunked("3\r\nabc\r\nzz\r\n") != "abc")
        return 16;
    // a size near SIZE_MAX keeps whatever body is left
    if (decode_chunked("3\r\nabc\r\nFFFFFFFFFFFFFFFF\r\nxyz") != "abcxyz")
        return 17;
    return 0;
}

static int test_ipapi_body() {
    auto ok = IpApiCountryResolver::parse_body(R"({"status":"success","countryCode":"JP"})");
    if (!ok || *ok != "JP")
        return 21;
    if (IpApiCountryResolver::parse_body(R"({"status":"fail","message":"reserved range"})"))
        return 22;
    if (IpApiCountryResolver::parse_body(R"({"status":"success"})"))
        return 23;
    return 0;
}

static int test_trace_colo() {
    const std::string body = "fl=12f34\r\nh=1.2.3.4\r\nip=5.6.7.8\r\nts=1700000000.1\r\ncolo=nrt\r\nloc=JP\r\n";
    auto colo = TraceColoResolver::parse_colo(body);
    if (!colo || *colo != "NRT")
        return 31;
    if (TraceColoResolver::colo_to_country(*colo) != "JP")
        return 32;
    if (TraceColoResolver::colo_to_country("HKG") != "HK" || TraceColoResolver::colo_to_country("sjc") != "US")
        return 33;
    if (TraceColoResolver::colo_to_country("ZZZ") != kUnknownCountry)
        return 34;
    if (TraceColoResolver::parse_colo("ip=1.1.1.1\n"))
        return 35;
    return 0;
}

static int test_country_table() {
    TableCountryResolver t = TableCountryResolver::parse(
        "# offline geo table\n"
        "104.16.0.0/13 us\n"
        "104.16.128.0/20 SG   # anycast slice\n"
        "\n"
        "8.8.8.8 US\n");
    if (t.size() != 3)
        return 41;
    if (t.resolve("104.17.0.1") != "US")
        return 42;
    if (t.resolve("104.16.130.9") != "SG")
        return 43;
    if (t.resolve("8.8.8.8") != "US" || t.resolve("8.8.4.4") != kUnknownCountry)
        return 44;
    if (t.resolve("not-an-ip") != kUnknownCountry)
        return 45;

    const char* bad[] = {"104.16.0.0/13\n", "104.16.0.0/40 US\n", "1.2.3.4 USA\n"};
    for (const char* s : bad) {
        try {
            TableCountryResolver::parse(s);
            return 46;
        } catch (const std::runtime_error&) {
        }
    }
    try {
        TableCountryResolver::load_file("/nonexistent/relay_geo_table.txt");
        return 47;
    } catch (const std::runtime_error&) {
    }
    return 0;
}

int main() {
    int (*tests[])() = {
        test_urls,
        test_http_response,
        test_ipapi_body,
        test_trace_colo,
        test_country_table,
    };
    for (auto t : tests) {
        int rc = t();
        if (rc != 0) {
            std::cerr << "parsing test failed with code " << rc << "\n";
            return rc;
        }
    }
    std::cout << "parsing tests passed\n";
    return 0;
}
