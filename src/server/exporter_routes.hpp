/**
 * @file exporter_routes.hpp
 * @brief Maps HTTP requests onto the probe orchestrator.
 *
 *   GET <metrics_path>[?timeout=<duration>]  run one probe round
 *   GET /                                    landing page
 *   anything else                            404, or 405 for non-GET
 */

#pragma once

#include "core/config.hpp"
#include "orchestrator/probe_orchestrator.hpp"
#include "server/http_server.hpp"

#include <optional>
#include <stop_token>

namespace openstack_exporter {

/// Content type of the Prometheus text exposition format.
inline constexpr std::string_view kExpositionContentType =
    "text/plain; version=0.0.4; charset=utf-8";

/**
 * @brief Timeout requested by a scrape, if any is valid.
 *
 * The `timeout` query parameter wins; without it the
 * X-Prometheus-Scrape-Timeout-Seconds header is used. Invalid values are
 * ignored so the configured default applies.
 */
[[nodiscard]] std::optional<Duration> requested_timeout(const ServerRequest& request);

class ExporterRoutes {
public:
    ExporterRoutes(const ServerConfig& server, ProbeOrchestrator& orchestrator, Logger& logger);

    ServerResponse handle(const ServerRequest& request, std::stop_token stop);

    /// Adapter for HttpServer::serve().
    [[nodiscard]] HttpServer::Handler handler();

private:
    ServerResponse landing_page() const;

    const ServerConfig& server_;
    ProbeOrchestrator& orchestrator_;
    Logger& logger_;
};

}  // namespace openstack_exporter
