/**
 * @file http_server.cpp
 * @brief HttpServer implementation and HTTP wire helpers.
 */

#include "server/http_server.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <limits>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace openstack_exporter {

namespace {

constexpr std::string_view kHeadTerminator = "\r\n\r\n";

std::string to_lower(std::string_view text) {
    std::string out(text);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string_view trim(std::string_view text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// Nanoseconds per unit; 0 if `unit` is not a duration unit.
int64_t unit_nanos(std::string_view unit) noexcept {
    if (unit == "ns") return 1;
    if (unit == "us" || unit == "\xC2\xB5s" || unit == "\xCE\xBCs") return 1'000;
    if (unit == "ms") return 1'000'000;
    if (unit == "s") return 1'000'000'000;
    if (unit == "m") return 60'000'000'000;
    if (unit == "h") return 3'600'000'000'000;
    return 0;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Wire Helpers
// ─────────────────────────────────────────────

std::string ServerRequest::header(const std::string& lower_name) const {
    auto it = headers.find(lower_name);
    return it == headers.end() ? std::string{} : it->second;
}

std::string url_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '+') {
            out.push_back(' ');
        } else if (text[i] == '%' && i + 2 < text.size()
                   && hex_value(text[i + 1]) >= 0 && hex_value(text[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2])));
            i += 2;
        } else {
            out.push_back(text[i]);
        }
    }
    return out;
}

std::map<std::string, std::string> parse_query(std::string_view query) {
    std::map<std::string, std::string> out;
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        if (eq == std::string_view::npos) {
            out[url_decode(pair)] = "";
        } else {
            out[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        }
    }
    return out;
}

Result<ServerRequest> parse_request(std::string_view head) {
    auto line_end = head.find("\r\n");
    auto request_line = head.substr(0, line_end);

    auto sp1 = request_line.find(' ');
    auto sp2 = sp1 == std::string_view::npos ? sp1 : request_line.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos || sp2 == std::string_view::npos) {
        return Error{ErrorKind::Configuration, "malformed request line"};
    }

    auto version = request_line.substr(sp2 + 1);
    if (!version.starts_with("HTTP/1.")) {
        return Error{ErrorKind::Configuration, "unsupported protocol " + std::string{version}};
    }

    ServerRequest request;
    request.method = std::string{request_line.substr(0, sp1)};
    auto target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    if (target.empty() || target.front() != '/') {
        return Error{ErrorKind::Configuration, "malformed request target"};
    }

    auto qmark = target.find('?');
    request.path = std::string{target.substr(0, qmark)};
    if (qmark != std::string_view::npos) {
        request.query = parse_query(target.substr(qmark + 1));
    }

    auto rest = line_end == std::string_view::npos ? std::string_view{}
                                                    : head.substr(line_end + 2);
    while (!rest.empty()) {
        auto eol = rest.find("\r\n");
        auto line = rest.substr(0, eol);
        rest = eol == std::string_view::npos ? std::string_view{} : rest.substr(eol + 2);
        if (line.empty()) break;

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return Error{ErrorKind::Configuration, "malformed header line"};
        }
        request.headers[to_lower(trim(line.substr(0, colon)))] =
            std::string{trim(line.substr(colon + 1))};
    }
    return request;
}

std::string_view status_text(int status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

std::string format_response(const ServerResponse& response) {
    std::string out = "HTTP/1.1 " + std::to_string(response.status) + " "
                      + std::string{status_text(response.status)} + "\r\n";
    out += "Content-Type: " + response.content_type + "\r\n";
    out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
    for (const auto& [key, value] : response.headers) {
        out += key + ": " + value + "\r\n";
    }
    out += "Connection: close\r\n\r\n";
    out += response.body;
    return out;
}

std::optional<Duration> parse_duration(std::string_view text) {
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();

    if (text.empty() || text.front() == '-') return std::nullopt;
    if (text.front() == '+') text.remove_prefix(1);
    if (text.empty()) return std::nullopt;

    int64_t total_ns = 0;
    while (!text.empty()) {
        size_t i = 0;
        int64_t whole = 0;
        int64_t fraction = 0;
        double scale = 1.0;
        bool digits = false;

        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            if (whole > (kMax - 9) / 10) return std::nullopt;
            whole = whole * 10 + (text[i] - '0');
            digits = true;
            ++i;
        }
        if (i < text.size() && text[i] == '.') {
            ++i;
            while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
                // Digits beyond int64 precision are dropped.
                if (fraction <= (kMax - 9) / 10) {
                    fraction = fraction * 10 + (text[i] - '0');
                    scale *= 10;
                }
                digits = true;
                ++i;
            }
        }
        if (!digits) return std::nullopt;

        size_t unit_start = i;
        while (i < text.size() && text[i] != '.'
               && !std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        const int64_t unit = unit_nanos(text.substr(unit_start, i - unit_start));
        if (unit == 0) return std::nullopt;

        if (whole > kMax / unit) return std::nullopt;
        int64_t value = whole * unit;
        value += static_cast<int64_t>(static_cast<double>(fraction)
                                      * (static_cast<double>(unit) / scale));
        if (value < 0 || total_ns > kMax - value) return std::nullopt;
        total_ns += value;

        text.remove_prefix(i);
    }

    if (total_ns <= 0) return std::nullopt;
    return Duration{(total_ns + 999'999) / 1'000'000};
}

Result<std::pair<std::string, uint16_t>> split_host_port(std::string_view text) {
    auto colon = text.rfind(':');
    if (colon == std::string_view::npos) {
        return Error{ErrorKind::Configuration, "listen address '" + std::string{text}
                                                   + "' is not host:port"};
    }
    auto host = text.substr(0, colon);
    auto port_text = text.substr(colon + 1);

    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || port > 65535) {
        return Error{ErrorKind::Configuration, "invalid port in '" + std::string{text} + "'"};
    }
    return std::make_pair(host.empty() ? std::string{"0.0.0.0"} : std::string{host},
                          static_cast<uint16_t>(port));
}

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

HttpServer::HttpServer(Logger& logger, size_t workers)
    : logger_(logger), connections_(workers) {}

HttpServer::~HttpServer() {
    stop();
}

// ─────────────────────────────────────────────
// Server Side
// ─────────────────────────────────────────────

Result<void> HttpServer::listen(const std::string& address, uint16_t port, int backlog) {
    if (server_fd_ >= 0) {
        return Error{ErrorKind::Internal, "Already listening"};
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return Error{ErrorKind::Configuration, "Invalid listen address: " + address};
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        return Error{ErrorKind::Internal,
                     "Failed to create server socket: " + std::string(strerror(errno))};
    }

    int optval = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    if (::bind(server_fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto err = std::string(strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorKind::Configuration,
                     "Bind to " + address + ":" + std::to_string(port) + " failed: " + err};
    }

    if (::listen(server_fd_, backlog) < 0) {
        auto err = std::string(strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorKind::Internal, "Listen failed: " + err};
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }
    return Result<void>{};
}

void HttpServer::serve(Handler handler) {
    if (server_fd_ < 0 || accept_thread_.joinable()) return;

    handler_ = std::move(handler);
    accept_thread_ = std::jthread([this](std::stop_token stop) {
        while (!stop.stop_requested()) {
            pollfd pfd{};
            pfd.fd = server_fd_;
            pfd.events = POLLIN;

            int ready = ::poll(&pfd, 1, 100);  // 100ms timeout for stop check
            if (ready <= 0) continue;

            int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (client_fd < 0) continue;

            int flag = 1;
            ::setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

            connections_.submit([this, client_fd] { handle_connection(client_fd); });
        }
    });
}

void HttpServer::stop() {
    stop_source_.request_stop();
    if (accept_thread_.joinable()) {
        accept_thread_.request_stop();
        accept_thread_.join();
    }
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
}

bool HttpServer::is_listening() const noexcept {
    return server_fd_ >= 0;
}

void HttpServer::handle_connection(int fd) {
    ServerResponse response;

    auto head = recv_head(fd, READ_TIMEOUT_MS);
    if (!head) {
        response.status = 400;
        response.body = head.error().message + "\n";
    } else if (auto request = parse_request(*head); !request) {
        response.status = 400;
        response.body = request.error().message + "\n";
    } else {
        try {
            response = handler_(*request, stop_source_.get_token());
        } catch (const std::exception& ex) {
            logger_.log(LogLevel::Error, "http", "handler failed: " + std::string{ex.what()});
            response = ServerResponse{.status = 500, .body = "internal error\n"};
        }
    }

    if (!send_all(fd, format_response(response))) {
        logger_.log(LogLevel::Debug, "http", "client went away before the response was sent");
    }
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
}

// ─────────────────────────────────────────────
// Socket Helpers
// ─────────────────────────────────────────────

Result<std::string> HttpServer::recv_head(int fd, uint32_t timeout_ms) {
    std::string data;
    char buffer[2048];

    while (true) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) return Error{ErrorKind::Timeout, "timed out reading request"};

        auto received = ::recv(fd, buffer, sizeof(buffer), 0);
        if (received < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
        if (received <= 0) return Error{ErrorKind::Configuration, "connection closed mid-request"};

        data.append(buffer, static_cast<size_t>(received));
        if (auto end = data.find(kHeadTerminator); end != std::string::npos) {
            data.resize(end + 2);
            return data;
        }
        if (data.size() > MAX_HEAD_SIZE) {
            return Error{ErrorKind::Configuration, "request head too large"};
        }
    }
}

bool HttpServer::send_all(int fd, std::string_view data, uint32_t timeout_ms) {
    while (!data.empty()) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready <= 0) return false;

        auto sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (sent <= 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(sent));
    }
    return true;
}

}  // namespace openstack_exporter
