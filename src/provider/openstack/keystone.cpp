/**
 * @file keystone.cpp
 * @brief Keystone v3 client built on nlohmann/json.
 */

#include "provider/openstack/keystone.hpp"

#include <nlohmann/json.hpp>

namespace openstack_exporter {

namespace {

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

}  // anonymous namespace

Result<std::string> ServiceCatalog::endpoint_for(std::string_view service_type,
                                                 std::string_view interface,
                                                 std::string_view region) const {
    const CatalogEndpoint* fallback = nullptr;
    for (const auto& ep : endpoints) {
        if (ep.service_type != service_type || ep.interface != interface) continue;
        if (region.empty() || ep.region == region) {
            return strip_trailing_slash(ep.url);
        }
        if (!fallback && ep.region.empty()) fallback = &ep;
    }
    if (fallback) return strip_trailing_slash(fallback->url);
    return Error{ErrorKind::Configuration,
                 "no " + std::string{interface} + " endpoint for service '"
                 + std::string{service_type} + "'"
                 + (region.empty() ? std::string{} : " in region " + std::string{region})};
}

std::string token_url(std::string_view auth_url) {
    auto url = strip_trailing_slash(std::string{auth_url});
    if (!url.ends_with("/v3")) url += "/v3";
    return url + "/auth/tokens";
}

std::string build_auth_body(const Credentials& credentials) {
    nlohmann::json body = {
        {"auth", {
            {"identity", {
                {"methods", nlohmann::json::array({"password"})},
                {"password", {
                    {"user", {
                        {"name", credentials.username},
                        {"domain", {{"name", credentials.user_domain_name}}},
                        {"password", credentials.password},
                    }},
                }},
            }},
        }},
    };
    if (!credentials.project_name.empty()) {
        body["auth"]["scope"] = {
            {"project", {
                {"name", credentials.project_name},
                {"domain", {{"name", credentials.project_domain_name}}},
            }},
        };
    }
    return body.dump();
}

Result<ServiceCatalog> parse_token_response(const HttpResponse& response) {
    ServiceCatalog catalog;
    catalog.token = response.header("x-subject-token");
    if (catalog.token.empty()) {
        return Error{ErrorKind::Provider, "token response carries no X-Subject-Token header"};
    }

    try {
        auto doc = nlohmann::json::parse(response.body);
        const auto& services = doc.at("token").value("catalog", nlohmann::json::array());
        for (const auto& service : services) {
            auto type = service.value("type", std::string{});
            for (const auto& ep : service.value("endpoints", nlohmann::json::array())) {
                catalog.endpoints.push_back(CatalogEndpoint{
                    .service_type = type,
                    .interface = ep.value("interface", std::string{}),
                    .region = ep.value("region_id", ep.value("region", std::string{})),
                    .url = ep.value("url", std::string{}),
                });
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        return Error{ErrorKind::Provider, std::string{"malformed token response: "} + ex.what()};
    }

    return catalog;
}

Result<ServiceCatalog> authenticate(HttpTransport& transport,
                                    const Credentials& credentials,
                                    const Deadline& deadline) {
    HttpRequest request{
        .method = "POST",
        .url = token_url(credentials.auth_url),
        .headers = {{"Content-Type", "application/json"}, {"Accept", "application/json"}},
        .body = build_auth_body(credentials),
    };

    auto response = transport.perform(request, deadline);
    if (!response) return response.error();

    if (response->status == 401 || response->status == 403) {
        return Error{ErrorKind::Configuration,
                     "authentication failure: HTTP " + std::to_string(response->status)};
    }
    if (!response->ok()) {
        return http_error("authentication", *response);
    }
    return parse_token_response(*response);
}

}  // namespace openstack_exporter
