/**
 * @file openstack_session.hpp
 * @brief CloudSession over the OpenStack REST APIs.
 *
 * Services used: Nova (servers, flavors), Glance (image lookup), Neutron
 * (networks, ports, floating IPs) and Swift (containers, objects). Endpoints
 * come from the Keystone catalog of the session's token.
 */

#pragma once

#include "core/config.hpp"
#include "provider/cloud.hpp"
#include "provider/openstack/http_transport.hpp"
#include "provider/openstack/keystone.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace openstack_exporter {

class OpenStackSession : public CloudSession {
public:
    OpenStackSession(std::shared_ptr<HttpTransport> transport,
                     ServiceCatalog catalog,
                     std::string region,
                     std::string interface);

    Result<ResourceHandle> create_server(const std::string& name,
                                         const ServerSpec& spec,
                                         const Deadline& deadline) override;
    Result<std::string> server_status(const ResourceHandle& server,
                                      const Deadline& deadline) override;
    Result<FloatingIp> attach_floating_ip(const ResourceHandle& server,
                                          const std::string& name,
                                          const std::string& external_network,
                                          const Deadline& deadline) override;

    Result<ResourceHandle> create_container(const std::string& name,
                                            const Deadline& deadline) override;
    Result<void> put_object(const std::string& container,
                            const std::string& object,
                            const std::string& data,
                            const Deadline& deadline) override;
    Result<std::string> get_object(const std::string& container,
                                   const std::string& object,
                                   const Deadline& deadline) override;
    Result<void> delete_object(const std::string& container,
                               const std::string& object,
                               const Deadline& deadline) override;
    Result<std::vector<std::string>> list_objects(const std::string& container,
                                                  const Deadline& deadline) override;

    Result<std::vector<ResourceHandle>> list_resources(ResourceKind kind,
                                                       std::string_view tag,
                                                       const Deadline& deadline) override;
    Result<void> delete_resource(const ResourceHandle& resource,
                                 const Deadline& deadline) override;

private:
    Result<std::string> endpoint(std::string_view service_type) const;
    Result<std::string> network_api() const;
    Result<std::string> image_api() const;

    Result<HttpResponse> call(const std::string& method,
                              const std::string& url,
                              const Deadline& deadline,
                              std::string body = {},
                              std::string content_type = "application/json");
    Result<nlohmann::json> call_json(const std::string& what,
                                     const std::string& method,
                                     const std::string& url,
                                     const Deadline& deadline,
                                     const nlohmann::json* body = nullptr);

    Result<std::string> resolve_flavor(const std::string& name, const Deadline& deadline);
    Result<std::string> resolve_image(const std::string& name, const Deadline& deadline);
    Result<std::string> resolve_network(const std::string& name, const Deadline& deadline);
    Result<std::string> server_port(const std::string& server_id, const Deadline& deadline);

    std::shared_ptr<HttpTransport> transport_;
    ServiceCatalog catalog_;
    std::string region_;
    std::string interface_;
};

/**
 * @brief Authenticates against Keystone on every open().
 *
 * Credentials are read through `credentials` at open time, so a fixed
 * environment is picked up without restarting the exporter.
 */
class OpenStackSessionFactory : public SessionFactory {
public:
    using CredentialsSource = std::function<Result<Credentials>()>;

    explicit OpenStackSessionFactory(std::shared_ptr<HttpTransport> transport,
                                     CredentialsSource credentials = credentials_from_env);

    Result<std::shared_ptr<CloudSession>> open(const Deadline& deadline) override;

private:
    std::shared_ptr<HttpTransport> transport_;
    CredentialsSource credentials_;
};

/// Percent-encode a URL path segment or query value.
[[nodiscard]] std::string url_encode(std::string_view text);

}  // namespace openstack_exporter
