/**
 * @file keystone.hpp
 * @brief Keystone v3 password authentication and service catalog lookup.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "executor/deadline.hpp"
#include "provider/openstack/http_transport.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace openstack_exporter {

struct CatalogEndpoint {
    std::string service_type;
    std::string interface;
    std::string region;
    std::string url;
};

/**
 * @brief A scoped token and the endpoints it grants.
 */
struct ServiceCatalog {
    std::string token;
    std::vector<CatalogEndpoint> endpoints;

    /**
     * @brief URL of `service_type` for `interface`, preferring `region`.
     *
     * An empty region matches any. Trailing slashes are stripped.
     */
    [[nodiscard]] Result<std::string> endpoint_for(std::string_view service_type,
                                                   std::string_view interface,
                                                   std::string_view region) const;
};

/// `<auth_url>/auth/tokens`, appending `/v3` when the URL has no version.
[[nodiscard]] std::string token_url(std::string_view auth_url);

/// JSON body of a project-scoped password authentication request.
[[nodiscard]] std::string build_auth_body(const Credentials& credentials);

/// Extract the token (X-Subject-Token) and catalog from a token response.
[[nodiscard]] Result<ServiceCatalog> parse_token_response(const HttpResponse& response);

/**
 * @brief Authenticate and return the scoped catalog.
 *
 * Rejected credentials (401/403) are Configuration errors so a bad
 * environment is distinguishable from a provider outage.
 */
Result<ServiceCatalog> authenticate(HttpTransport& transport,
                                    const Credentials& credentials,
                                    const Deadline& deadline);

}  // namespace openstack_exporter
