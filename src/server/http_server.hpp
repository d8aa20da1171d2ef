/**
 * @file http_server.hpp
 * @brief Minimal HTTP/1.1 server for the scrape endpoint.
 *
 * One request per connection (Connection: close). The accept loop polls the
 * listening socket on a jthread; each accepted connection is handled on the
 * server's own worker pool so a long scrape does not block the landing page.
 * Only the request head is read; bodies are ignored.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace openstack_exporter {

struct ServerRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;   ///< Lower-case keys

    [[nodiscard]] std::string header(const std::string& lower_name) const;
};

struct ServerResponse {
    int status = 200;
    std::string content_type = "text/plain; charset=utf-8";
    std::string body;
    std::map<std::string, std::string> headers;
};

// ── Wire helpers ─────────────────────────────

/// Parse a request head (request line plus headers, up to the blank line).
[[nodiscard]] Result<ServerRequest> parse_request(std::string_view head);

/// Decode `a=1&b=x%20y`; later keys win.
[[nodiscard]] std::map<std::string, std::string> parse_query(std::string_view query);

/// Percent- and plus-decoding of a query component.
[[nodiscard]] std::string url_decode(std::string_view text);

/// Serialize a response with Content-Length and Connection: close.
[[nodiscard]] std::string format_response(const ServerResponse& response);

[[nodiscard]] std::string_view status_text(int status) noexcept;

/**
 * @brief Parse a Go-style duration ("30s", "1m30s", "1.5h", "500ms", "2us").
 *
 * Units: ns, us, µs, ms, s, m, h. Returns nullopt for malformed, zero or
 * negative input. Sub-millisecond results round up to 1ms.
 */
[[nodiscard]] std::optional<Duration> parse_duration(std::string_view text);

/// Split "host:port". A bare ":port" means all interfaces.
[[nodiscard]] Result<std::pair<std::string, uint16_t>> split_host_port(std::string_view text);

// ── Server ───────────────────────────────────

class HttpServer {
public:
    using Handler = std::function<ServerResponse(const ServerRequest&, std::stop_token)>;

    static constexpr size_t MAX_HEAD_SIZE = 16 * 1024;
    static constexpr int DEFAULT_BACKLOG = 16;
    static constexpr uint32_t READ_TIMEOUT_MS = 10000;

    explicit HttpServer(Logger& logger, size_t workers = 4);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and listen. Port 0 picks an ephemeral port, see port().
    Result<void> listen(const std::string& address, uint16_t port,
                        int backlog = DEFAULT_BACKLOG);

    /// Start the accept loop. Handlers receive a token stopped by stop().
    void serve(Handler handler);

    /// Stop accepting, cancel in-flight handlers and close the socket.
    void stop();

    [[nodiscard]] bool is_listening() const noexcept;
    [[nodiscard]] uint16_t port() const noexcept { return bound_port_; }

private:
    void handle_connection(int fd);
    static Result<std::string> recv_head(int fd, uint32_t timeout_ms);
    static bool send_all(int fd, std::string_view data, uint32_t timeout_ms = 5000);

    Logger& logger_;
    Handler handler_;
    std::stop_source stop_source_;
    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::jthread accept_thread_;
    ThreadPool connections_;   ///< Destroyed first; drains in-flight handlers
};

}  // namespace openstack_exporter
