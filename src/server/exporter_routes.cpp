/**
 * @file exporter_routes.cpp
 * @brief ExporterRoutes implementation.
 */

#include "server/exporter_routes.hpp"
#include "core/version.hpp"

namespace openstack_exporter {

std::optional<Duration> requested_timeout(const ServerRequest& request) {
    if (auto it = request.query.find("timeout"); it != request.query.end()) {
        return parse_duration(it->second);
    }

    auto header = request.header("x-prometheus-scrape-timeout-seconds");
    if (header.empty()) return std::nullopt;

    // Decimal seconds, e.g. "10" or "9.5".
    if (header.find_first_not_of("0123456789.") != std::string::npos) return std::nullopt;
    return parse_duration(header + "s");
}

ExporterRoutes::ExporterRoutes(const ServerConfig& server,
                               ProbeOrchestrator& orchestrator,
                               Logger& logger)
    : server_(server), orchestrator_(orchestrator), logger_(logger) {}

ServerResponse ExporterRoutes::handle(const ServerRequest& request, std::stop_token stop) {
    if (request.method != "GET") {
        ServerResponse response{.status = 405, .body = "method not allowed\n"};
        response.headers["Allow"] = "GET";
        return response;
    }

    if (request.path == server_.metrics_path) {
        auto timeout = requested_timeout(request);
        if (!timeout && request.query.contains("timeout")) {
            logger_.log(LogLevel::Debug, "http",
                        "ignoring invalid timeout '" + request.query.at("timeout") + "'");
        }
        auto scrape = orchestrator_.handle_scrape(timeout, std::move(stop));
        return ServerResponse{
            .status = 200,
            .content_type = std::string{kExpositionContentType},
            .body = std::move(scrape.body),
        };
    }

    if (request.path == "/") {
        return landing_page();
    }

    return ServerResponse{.status = 404, .body = "not found\n"};
}

HttpServer::Handler ExporterRoutes::handler() {
    return [this](const ServerRequest& request, std::stop_token stop) {
        return handle(request, std::move(stop));
    };
}

ServerResponse ExporterRoutes::landing_page() const {
    std::string body =
        "<html>\n"
        "<head><title>OpenStack Client Exporter</title></head>\n"
        "<body>\n"
        "<h1>OpenStack Client Exporter</h1>\n"
        "<p>Version " + std::string{kVersion} + "</p>\n"
        "<p><a href=\"" + server_.metrics_path + "\">Metrics</a></p>\n"
        "</body>\n"
        "</html>\n";
    return ServerResponse{.status = 200, .content_type = "text/html; charset=utf-8",
                          .body = std::move(body)};
}

}  // namespace openstack_exporter
