#include "dhcpwarden/http.h"
#include "dhcpwarden/logging.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>

namespace dhcpwarden {

namespace {
constexpr const char *USER_AGENT = "dhcpwarden/1.0";
constexpr const char *CRLF = "\r\n";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string &s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

bool parse_port(const std::string &text, uint16_t &port) {
    if (text.empty() || text.size() > 5) return false;
    uint32_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    if (value == 0 || value > 65535) return false;
    port = static_cast<uint16_t>(value);
    return true;
}

bool is_ip_literal(const std::string &host) {
    in_addr v4{};
    in6_addr v6{};
    return ::inet_pton(AF_INET, host.c_str(), &v4) == 1 || ::inet_pton(AF_INET6, host.c_str(), &v6) == 1;
}

// Decodes a chunked body starting at pos. Returns INCOMPLETE until the last
// (zero sized) chunk has been seen.
ParseStatus decode_chunked(const std::string &raw, size_t pos, std::string &body) {
    body.clear();
    while (true) {
        size_t line_end = raw.find(CRLF, pos);
        if (line_end == std::string::npos) return ParseStatus::INCOMPLETE;
        std::string size_line = raw.substr(pos, line_end - pos);
        size_t ext = size_line.find(';');
        if (ext != std::string::npos) size_line.resize(ext);
        size_line = trim(size_line);
        if (size_line.empty()) return ParseStatus::MALFORMED;
        size_t chunk_size = 0;
        for (char c : size_line) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) return ParseStatus::MALFORMED;
            if (chunk_size > (SocketHttpClient::MAX_RESPONSE_BYTES >> 4)) return ParseStatus::MALFORMED;
            chunk_size = chunk_size * 16 + static_cast<size_t>(std::isdigit(static_cast<unsigned char>(c))
                                                                   ? c - '0'
                                                                   : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
        }
        pos = line_end + 2;
        if (chunk_size == 0) return ParseStatus::COMPLETE;  // trailers are ignored
        if (raw.size() < pos + chunk_size + 2) return ParseStatus::INCOMPLETE;
        body.append(raw, pos, chunk_size);
        pos += chunk_size;
        if (raw.compare(pos, 2, CRLF) != 0) return ParseStatus::MALFORMED;
        pos += 2;
    }
}

} // namespace

std::string Endpoint::host_header() const {
    std::string out = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    const uint16_t default_port = use_tls ? 443 : 80;
    if (port != default_port) out += ":" + std::to_string(port);
    return out;
}

std::string Endpoint::base_url() const {
    return std::string(use_tls ? "https://" : "http://") + host_header() + base_path;
}

bool parse_endpoint(const std::string &address, Endpoint &endpoint, std::string &error) {
    std::string rest = trim(address);
    Endpoint out;
    const std::string lowered = to_lower(rest.substr(0, 8));
    if (lowered.rfind("https://", 0) == 0) {
        out.use_tls = true;
        rest = rest.substr(8);
    } else if (lowered.rfind("http://", 0) == 0) {
        rest = rest.substr(7);
    } else if (rest.find("://") != std::string::npos) {
        error = "unsupported scheme in address '" + address + "'";
        return false;
    }
    out.port = out.use_tls ? 443 : 80;

    std::string authority = rest;
    size_t slash = rest.find('/');
    if (slash != std::string::npos) {
        authority = rest.substr(0, slash);
        out.base_path = rest.substr(slash);
        while (!out.base_path.empty() && out.base_path.back() == '/') out.base_path.pop_back();
    }
    if (authority.empty()) {
        error = "missing host in address '" + address + "'";
        return false;
    }

    if (authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            error = "unterminated IPv6 literal in address '" + address + "'";
            return false;
        }
        out.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':' || !parse_port(tail.substr(1), out.port)) {
                error = "invalid port in address '" + address + "'";
                return false;
            }
        }
    } else {
        size_t colon = authority.find(':');
        if (colon != std::string::npos && authority.find(':', colon + 1) == std::string::npos) {
            out.host = authority.substr(0, colon);
            if (!parse_port(authority.substr(colon + 1), out.port)) {
                error = "invalid port in address '" + address + "'";
                return false;
            }
        } else {
            // Either a plain name or an unbracketed IPv6 literal
            out.host = authority;
        }
    }
    if (out.host.empty()) {
        error = "missing host in address '" + address + "'";
        return false;
    }
    endpoint = out;
    return true;
}

std::optional<std::string> HttpResponse::header(const std::string &name) const {
    const std::string wanted = to_lower(name);
    for (const auto &h : headers) {
        if (to_lower(h.first) == wanted) return h.second;
    }
    return std::nullopt;
}

ParseStatus parse_http_response(const std::string &raw, bool eof, HttpResponse &response) {
    response = HttpResponse{};
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        return eof ? ParseStatus::MALFORMED : ParseStatus::INCOMPLETE;
    }

    size_t line_end = raw.find(CRLF);
    std::string status_line = raw.substr(0, line_end);
    if (status_line.rfind("HTTP/1.", 0) != 0) return ParseStatus::MALFORMED;
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos || status_line.size() < sp1 + 4) return ParseStatus::MALFORMED;
    std::string code = status_line.substr(sp1 + 1, 3);
    if (!std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return ParseStatus::MALFORMED;
    }
    response.status = std::stoi(code);
    if (status_line.size() > sp1 + 5) response.reason = status_line.substr(sp1 + 5);

    size_t pos = line_end + 2;
    while (pos < header_end) {
        size_t next = raw.find(CRLF, pos);
        std::string line = raw.substr(pos, next - pos);
        pos = next + 2;
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return ParseStatus::MALFORMED;
        response.headers.emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
    }

    const size_t body_start = header_end + 4;
    if ((response.status >= 100 && response.status < 200) || response.status == 204 || response.status == 304) {
        return ParseStatus::COMPLETE;
    }

    auto transfer_encoding = response.header("Transfer-Encoding");
    if (transfer_encoding && to_lower(*transfer_encoding).find("chunked") != std::string::npos) {
        ParseStatus st = decode_chunked(raw, body_start, response.body);
        if (st == ParseStatus::INCOMPLETE && eof) return ParseStatus::MALFORMED;
        return st;
    }

    auto content_length = response.header("Content-Length");
    if (content_length) {
        size_t length = 0;
        try {
            length = static_cast<size_t>(std::stoul(*content_length));
        } catch (const std::exception &) {
            return ParseStatus::MALFORMED;
        }
        if (raw.size() - body_start < length) {
            return eof ? ParseStatus::MALFORMED : ParseStatus::INCOMPLETE;
        }
        response.body = raw.substr(body_start, length);
        return ParseStatus::COMPLETE;
    }

    if (!eof) return ParseStatus::INCOMPLETE;
    response.body = raw.substr(body_start);
    return ParseStatus::COMPLETE;
}

std::string format_http_request(const std::string &method, const std::string &target,
                                const HeaderList &headers, const std::string &body) {
    std::string out;
    out.reserve(256 + body.size());
    out += method;
    out += ' ';
    out += target.empty() ? "/" : target;
    out += " HTTP/1.1";
    out += CRLF;
    for (const auto &h : headers) {
        out += h.first;
        out += ": ";
        out += h.second;
        out += CRLF;
    }
    out += CRLF;
    out += body;
    return out;
}

std::optional<std::pair<std::string, std::string>> parse_set_cookie(const std::string &header) {
    size_t semi = header.find(';');
    std::string pair = header.substr(0, semi);
    size_t eq = pair.find('=');
    if (eq == std::string::npos) return std::nullopt;
    std::string name = trim(pair.substr(0, eq));
    std::string value = trim(pair.substr(eq + 1));
    if (name.empty()) return std::nullopt;
    if (semi != std::string::npos) {
        std::string attrs = to_lower(header.substr(semi));
        if (attrs.find("max-age=0") != std::string::npos) value.clear();
    }
    return std::make_pair(name, value);
}

SocketHttpClient::SocketHttpClient(Endpoint endpoint, bool tls_verify)
    : endpoint_(std::move(endpoint)), tls_verify_(tls_verify) {}

SocketHttpClient::~SocketHttpClient() {
    close();
    if (ssl_ctx_) {
        SSL_CTX_free(ssl_ctx_);
        ssl_ctx_ = nullptr;
    }
}

void SocketHttpClient::close() {
    if (ssl_handle_) {
        if (ssl_active_) SSL_shutdown(ssl_handle_);
        SSL_free(ssl_handle_);
        ssl_handle_ = nullptr;
    }
    ssl_active_ = false;
    if (sock_fd_ >= 0) {
        ::close(sock_fd_);
        sock_fd_ = -1;
    }
}

bool SocketHttpClient::open_socket(uint32_t timeout_ms, std::string &error) {
    close();

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo *result = nullptr;
    const std::string port_str = std::to_string(endpoint_.port);
    int rc = ::getaddrinfo(endpoint_.host.c_str(), port_str.c_str(), &hints, &result);
    if (rc != 0) {
        error = "cannot resolve " + endpoint_.host + ": " + ::gai_strerror(rc);
        return false;
    }

    error = "no usable address for " + endpoint_.host;
    for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
        int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) continue;

        // Non-blocking connect so an unresponsive host cannot stall the cycle
        int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        int err = 0;
        if (::connect(fd, rp->ai_addr, rp->ai_addrlen) != 0) {
            err = errno;
            if (err == EINPROGRESS) {
                pollfd pfd{fd, POLLOUT, 0};
                int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
                if (ready == 1) {
                    socklen_t len = sizeof(err);
                    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) err = errno;
                } else {
                    err = ready == 0 ? ETIMEDOUT : errno;
                }
            }
        }
        if (err == 0) {
            ::fcntl(fd, F_SETFL, flags);
            sock_fd_ = fd;
            ::freeaddrinfo(result);
            return true;
        }

        error = "connect to " + endpoint_.host + ":" + port_str + " failed: " + std::strerror(err);
        ::close(fd);
    }

    ::freeaddrinfo(result);
    return false;
}

bool SocketHttpClient::set_timeout_ms(uint32_t timeout_ms) {
    if (sock_fd_ < 0) return false;
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    if (::setsockopt(sock_fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) return false;
    if (::setsockopt(sock_fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) return false;
    return true;
}

bool SocketHttpClient::ensure_tls(std::string &error) {
    if (ssl_active_) return true;

    if (!ssl_ctx_) {
        ssl_ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ssl_ctx_) {
            error = "cannot create TLS context";
            return false;
        }
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
        SSL_CTX_set_options(ssl_ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
        if (tls_verify_) {
            SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ssl_ctx_);
        } else {
            // Appliances commonly ship self-signed certificates
            SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_NONE, nullptr);
        }
    }

    ssl_handle_ = SSL_new(ssl_ctx_);
    if (!ssl_handle_) {
        error = "cannot create TLS handle";
        return false;
    }

    SSL_set_fd(ssl_handle_, sock_fd_);
    if (!is_ip_literal(endpoint_.host)) SSL_set_tlsext_host_name(ssl_handle_, endpoint_.host.c_str());
    if (tls_verify_) SSL_set1_host(ssl_handle_, endpoint_.host.c_str());

    if (SSL_connect(ssl_handle_) != 1) {
        char buf[256];
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        error = std::string("TLS handshake with ") + endpoint_.host + " failed: " + buf;
        ERR_clear_error();
        return false;
    }

    ssl_active_ = true;
    return true;
}

bool SocketHttpClient::send_all(const std::string &data) {
    size_t sent = 0;
    while (sent < data.size()) {
        int n = ssl_active_ ? SSL_write(ssl_handle_, data.data() + sent, static_cast<int>(data.size() - sent))
                            : static_cast<int>(::send(sock_fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL));
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

int SocketHttpClient::recv_some(char *buf, size_t len) {
    if (!ssl_active_) {
        ssize_t n = ::recv(sock_fd_, buf, len, 0);
        return n < 0 ? -1 : static_cast<int>(n);
    }
    int n = SSL_read(ssl_handle_, buf, static_cast<int>(len));
    if (n > 0) return n;
    int ssl_err = SSL_get_error(ssl_handle_, n);
    if (ssl_err == SSL_ERROR_ZERO_RETURN) return 0;
    if (ssl_err == SSL_ERROR_SYSCALL && errno == 0) return 0;
    return -1;
}

void SocketHttpClient::store_cookies(const HttpResponse &response) {
    for (const auto &h : response.headers) {
        if (to_lower(h.first) != "set-cookie") continue;
        auto cookie = parse_set_cookie(h.second);
        if (!cookie) continue;
        if (cookie->second.empty()) {
            LOG_TRACE(LogCategory::HTTP) << endpoint_.host << " dropped cookie " << cookie->first;
            cookies_.erase(cookie->first);
        } else {
            LOG_TRACE(LogCategory::HTTP) << endpoint_.host << " set cookie " << cookie->first;
            cookies_[cookie->first] = cookie->second;
        }
    }
}

bool SocketHttpClient::perform(const HttpRequest &request, HttpResponse &response, std::string &error) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(request.timeout_ms);
    // Every blocking phase gets what is left of the request budget
    auto remaining_ms = [&]() -> uint32_t {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        return left > 0 ? static_cast<uint32_t>(left) : 0;
    };
    auto timed_out = [&]() {
        error = "request to " + endpoint_.host + " timed out after " + std::to_string(request.timeout_ms) + "ms";
        close();
        return false;
    };

    if (!open_socket(request.timeout_ms, error)) return false;
    uint32_t left = remaining_ms();
    if (left == 0) return timed_out();
    if (!set_timeout_ms(left)) {
        error = std::string("cannot set socket timeout: ") + std::strerror(errno);
        close();
        return false;
    }

    if (endpoint_.use_tls && !ensure_tls(error)) {
        close();
        return false;
    }

    HeaderList headers{
        {"Host", endpoint_.host_header()},
        {"User-Agent", USER_AGENT},
        {"Accept", "application/json"},
        {"Referer", endpoint_.base_url() + "/"},
        {"Connection", "close"},
    };
    if (request.send_cookies && !cookies_.empty()) {
        std::string jar;
        for (const auto &c : cookies_) {
            if (!jar.empty()) jar += "; ";
            jar += c.first + "=" + c.second;
        }
        headers.emplace_back("Cookie", jar);
    }
    headers.insert(headers.end(), request.headers.begin(), request.headers.end());
    if (!request.body.empty()) {
        headers.emplace_back("Content-Type", "application/json");
    }
    if (!request.body.empty() || request.method == "POST" || request.method == "PATCH" || request.method == "PUT") {
        headers.emplace_back("Content-Length", std::to_string(request.body.size()));
    }

    const std::string target = endpoint_.base_path + request.target;
    LOG_DEBUG(LogCategory::HTTP) << request.method << " " << endpoint_.base_url() << request.target;
    log_payload(LogLevel::TRACE, LogCategory::HTTP, "request body", request.body);

    left = remaining_ms();
    if (left == 0 || !set_timeout_ms(left)) return timed_out();
    if (!send_all(format_http_request(request.method, target, headers, request.body))) {
        error = "failed to send request to " + endpoint_.host;
        close();
        return false;
    }

    std::string raw;
    char buf[8192];
    ParseStatus status = ParseStatus::INCOMPLETE;
    while (status == ParseStatus::INCOMPLETE) {
        left = remaining_ms();
        if (left == 0 || !set_timeout_ms(left)) return timed_out();
        int n = recv_some(buf, sizeof(buf));
        if (n < 0) {
            error = "receive from " + endpoint_.host + " failed or timed out";
            close();
            return false;
        }
        if (n == 0) {
            status = parse_http_response(raw, true, response);
            break;
        }
        raw.append(buf, static_cast<size_t>(n));
        if (raw.size() > MAX_RESPONSE_BYTES) {
            error = "response from " + endpoint_.host + " exceeds " + std::to_string(MAX_RESPONSE_BYTES) + " bytes";
            close();
            return false;
        }
        status = parse_http_response(raw, false, response);
    }
    close();

    if (status != ParseStatus::COMPLETE) {
        error = "malformed HTTP response from " + endpoint_.host;
        return false;
    }
    if (request.send_cookies) store_cookies(response);
    LOG_DEBUG(LogCategory::HTTP) << request.method << " " << request.target << " -> " << response.status;
    log_payload(LogLevel::TRACE, LogCategory::HTTP, "response body", response.body);
    return true;
}

} // namespace dhcpwarden
