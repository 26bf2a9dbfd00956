#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <openssl/ssl.h>

namespace dhcpwarden {

// Management interface location of one node.
struct Endpoint {
    bool use_tls{false};
    std::string host;       // without brackets for IPv6 literals
    uint16_t port{80};
    std::string base_path;  // "" or "/prefix", never a trailing slash

    std::string host_header() const;
    // "http://host[:port][/prefix]"
    std::string base_url() const;
};

// Accepts "host", "host:port", "[v6]:port" and http(s):// URLs, with or
// without trailing slashes. A bare host is taken as http.
bool parse_endpoint(const std::string &address, Endpoint &endpoint, std::string &error);

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method{"GET"};
    std::string target{"/"};  // path and query, relative to the endpoint base path
    HeaderList headers;
    std::string body;
    uint32_t timeout_ms{5000};  // whole request, connect included
    // False keeps the request out of the cookie jar: nothing is sent from it
    // and Set-Cookie replies are not stored.
    bool send_cookies{true};
};

struct HttpResponse {
    int status{0};
    std::string reason;
    HeaderList headers;
    std::string body;

    // Case-insensitive lookup of the first matching header.
    std::optional<std::string> header(const std::string &name) const;
    bool ok() const { return status >= 200 && status < 300; }
};

// Transport used by the probe, session and mutator. One instance per node,
// holding that node's cookies.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Returns false only when no HTTP response was obtained (resolution,
    // connect, TLS, timeout, malformed reply). Any status code is success.
    virtual bool perform(const HttpRequest &request, HttpResponse &response, std::string &error) = 0;

    virtual void clear_cookies() = 0;
};

enum class ParseStatus {
    INCOMPLETE,
    COMPLETE,
    MALFORMED,
};

// Parses a raw HTTP/1.x response. eof tells whether the peer has closed, which
// completes bodies without Content-Length.
ParseStatus parse_http_response(const std::string &raw, bool eof, HttpResponse &response);

std::string format_http_request(const std::string &method, const std::string &target,
                                const HeaderList &headers, const std::string &body);

// Cookie name/value from a Set-Cookie header. Returns nullopt for garbage.
// An empty value means the server deleted the cookie.
std::optional<std::pair<std::string, std::string>> parse_set_cookie(const std::string &header);

class SocketHttpClient : public HttpClient {
public:
    static constexpr size_t MAX_RESPONSE_BYTES = 4 * 1024 * 1024;

    SocketHttpClient(Endpoint endpoint, bool tls_verify);
    ~SocketHttpClient() override;

    SocketHttpClient(const SocketHttpClient &) = delete;
    SocketHttpClient &operator=(const SocketHttpClient &) = delete;

    bool perform(const HttpRequest &request, HttpResponse &response, std::string &error) override;
    void clear_cookies() override { cookies_.clear(); }

    const std::map<std::string, std::string> &cookies() const { return cookies_; }

private:
    bool open_socket(uint32_t timeout_ms, std::string &error);
    bool set_timeout_ms(uint32_t timeout_ms);
    bool ensure_tls(std::string &error);
    bool send_all(const std::string &data);
    // >0 bytes read, 0 orderly close, <0 error/timeout
    int recv_some(char *buf, size_t len);
    void close();
    void store_cookies(const HttpResponse &response);

    Endpoint endpoint_;
    bool tls_verify_{false};
    int sock_fd_{-1};
    SSL_CTX *ssl_ctx_{nullptr};
    SSL *ssl_handle_{nullptr};
    bool ssl_active_{false};
    std::map<std::string, std::string> cookies_;
};

} // namespace dhcpwarden
