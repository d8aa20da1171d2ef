/**
 * @file openstack_session.cpp
 * @brief OpenStack REST implementation of CloudSession.
 */

#include "provider/openstack/openstack_session.hpp"

#include <cctype>

namespace openstack_exporter {

namespace {

std::string with_version(std::string base, std::string_view version) {
    if (!base.ends_with(version)) {
        base += version;
    }
    return base;
}

/// String member of `obj`; empty when absent, null or not a string.
std::string string_field(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return {};
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

/// Array member of `doc`; empty when absent or not an array.
const nlohmann::json& array_field(const nlohmann::json& doc, const char* key) {
    static const nlohmann::json kEmpty = nlohmann::json::array();
    if (!doc.is_object()) return kEmpty;
    auto it = doc.find(key);
    return it != doc.end() && it->is_array() ? *it : kEmpty;
}

}  // anonymous namespace

std::string url_encode(std::string_view text) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

// ─────────────────────────────────────────────
// Construction / plumbing
// ─────────────────────────────────────────────

OpenStackSession::OpenStackSession(std::shared_ptr<HttpTransport> transport,
                                   ServiceCatalog catalog,
                                   std::string region,
                                   std::string interface)
    : transport_(std::move(transport))
    , catalog_(std::move(catalog))
    , region_(std::move(region))
    , interface_(std::move(interface)) {}

Result<std::string> OpenStackSession::endpoint(std::string_view service_type) const {
    return catalog_.endpoint_for(service_type, interface_, region_);
}

Result<std::string> OpenStackSession::network_api() const {
    auto base = endpoint("network");
    if (!base) return base.error();
    return with_version(*base, "/v2.0");
}

Result<std::string> OpenStackSession::image_api() const {
    auto base = endpoint("image");
    if (!base) return base.error();
    return with_version(*base, "/v2");
}

Result<HttpResponse> OpenStackSession::call(const std::string& method,
                                            const std::string& url,
                                            const Deadline& deadline,
                                            std::string body,
                                            std::string content_type) {
    HttpRequest request{
        .method = method,
        .url = url,
        .headers = {{"X-Auth-Token", catalog_.token}, {"Accept", "application/json"}},
        .body = std::move(body),
    };
    if (!request.body.empty() || method == "PUT" || method == "POST") {
        request.headers.emplace_back("Content-Type", std::move(content_type));
    }
    return transport_->perform(request, deadline);
}

Result<nlohmann::json> OpenStackSession::call_json(const std::string& what,
                                                   const std::string& method,
                                                   const std::string& url,
                                                   const Deadline& deadline,
                                                   const nlohmann::json* body) {
    auto response = call(method, url, deadline, body ? body->dump() : std::string{});
    if (!response) return response.error();
    if (!response->ok()) return http_error(what, *response);
    if (response->body.empty()) return nlohmann::json::object();

    try {
        return nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::exception& ex) {
        return Error{ErrorKind::Provider, what + ": malformed response: " + ex.what()};
    }
}

// ─────────────────────────────────────────────
// Name → id resolution
// ─────────────────────────────────────────────

Result<std::string> OpenStackSession::resolve_flavor(const std::string& name,
                                                     const Deadline& deadline) {
    auto compute = endpoint("compute");
    if (!compute) return compute.error();

    auto doc = call_json("list flavors", "GET", *compute + "/flavors", deadline);
    if (!doc) return doc.error();

    for (const auto& flavor : array_field(*doc, "flavors")) {
        if (string_field(flavor, "name") == name || string_field(flavor, "id") == name) {
            return string_field(flavor, "id");
        }
    }
    return Error{ErrorKind::Provider, "flavor '" + name + "' not found"};
}

Result<std::string> OpenStackSession::resolve_image(const std::string& name,
                                                    const Deadline& deadline) {
    auto api = image_api();
    if (!api) return api.error();

    auto doc = call_json("list images", "GET", *api + "/images?name=" + url_encode(name), deadline);
    if (!doc) return doc.error();

    const auto& images = array_field(*doc, "images");
    if (images.empty()) {
        return Error{ErrorKind::Provider, "image '" + name + "' not found"};
    }
    return string_field(images.front(), "id");
}

Result<std::string> OpenStackSession::resolve_network(const std::string& name,
                                                      const Deadline& deadline) {
    auto api = network_api();
    if (!api) return api.error();

    auto doc = call_json("list networks", "GET",
                         *api + "/networks?name=" + url_encode(name), deadline);
    if (!doc) return doc.error();

    const auto& networks = array_field(*doc, "networks");
    if (networks.empty()) {
        return Error{ErrorKind::Provider, "network '" + name + "' not found"};
    }
    return string_field(networks.front(), "id");
}

Result<std::string> OpenStackSession::server_port(const std::string& server_id,
                                                  const Deadline& deadline) {
    auto api = network_api();
    if (!api) return api.error();

    auto doc = call_json("list ports", "GET",
                         *api + "/ports?device_id=" + url_encode(server_id), deadline);
    if (!doc) return doc.error();

    const auto& ports = array_field(*doc, "ports");
    if (ports.empty()) {
        return Error{ErrorKind::Provider, "server " + server_id + " has no port"};
    }
    return string_field(ports.front(), "id");
}

// ─────────────────────────────────────────────
// Compute
// ─────────────────────────────────────────────

Result<ResourceHandle> OpenStackSession::create_server(const std::string& name,
                                                       const ServerSpec& spec,
                                                       const Deadline& deadline) {
    auto compute = endpoint("compute");
    if (!compute) return compute.error();

    auto flavor_id = resolve_flavor(spec.flavor, deadline);
    if (!flavor_id) return flavor_id.error();
    auto image_id = resolve_image(spec.image, deadline);
    if (!image_id) return image_id.error();
    auto network_id = resolve_network(spec.network, deadline);
    if (!network_id) return network_id.error();

    nlohmann::json body = {
        {"server", {
            {"name", name},
            {"flavorRef", *flavor_id},
            {"imageRef", *image_id},
            {"networks", nlohmann::json::array({{{"uuid", *network_id}}})},
        }},
    };
    if (!spec.keypair.empty()) {
        body["server"]["key_name"] = spec.keypair;
    }

    auto doc = call_json("create server", "POST", *compute + "/servers", deadline, &body);
    if (!doc) return doc.error();

    try {
        return ResourceHandle{ResourceKind::Server, doc->at("server").at("id").get<std::string>(),
                              name};
    } catch (const nlohmann::json::exception& ex) {
        return Error{ErrorKind::Provider, std::string{"create server: "} + ex.what()};
    }
}

Result<std::string> OpenStackSession::server_status(const ResourceHandle& server,
                                                    const Deadline& deadline) {
    auto compute = endpoint("compute");
    if (!compute) return compute.error();

    auto doc = call_json("get server", "GET",
                         *compute + "/servers/" + url_encode(server.id), deadline);
    if (!doc) return doc.error();

    try {
        return doc->at("server").at("status").get<std::string>();
    } catch (const nlohmann::json::exception& ex) {
        return Error{ErrorKind::Provider, std::string{"get server: "} + ex.what()};
    }
}

Result<FloatingIp> OpenStackSession::attach_floating_ip(const ResourceHandle& server,
                                                        const std::string& name,
                                                        const std::string& external_network,
                                                        const Deadline& deadline) {
    auto api = network_api();
    if (!api) return api.error();

    auto network_id = resolve_network(external_network, deadline);
    if (!network_id) return network_id.error();
    auto port_id = server_port(server.id, deadline);
    if (!port_id) return port_id.error();

    nlohmann::json body = {
        {"floatingip", {
            {"floating_network_id", *network_id},
            {"port_id", *port_id},
            {"description", name},
        }},
    };

    auto doc = call_json("create floating ip", "POST", *api + "/floatingips", deadline, &body);
    if (!doc) return doc.error();

    try {
        const auto& fip = doc->at("floatingip");
        return FloatingIp{
            ResourceHandle{ResourceKind::FloatingIp, fip.at("id").get<std::string>(), name},
            fip.at("floating_ip_address").get<std::string>()};
    } catch (const nlohmann::json::exception& ex) {
        return Error{ErrorKind::Provider, std::string{"create floating ip: "} + ex.what()};
    }
}

// ─────────────────────────────────────────────
// Object store
// ─────────────────────────────────────────────

Result<ResourceHandle> OpenStackSession::create_container(const std::string& name,
                                                          const Deadline& deadline) {
    auto store = endpoint("object-store");
    if (!store) return store.error();

    auto response = call("PUT", *store + "/" + url_encode(name), deadline);
    if (!response) return response.error();
    if (!response->ok()) return http_error("create container", *response);
    return ResourceHandle{ResourceKind::Container, name, name};
}

Result<void> OpenStackSession::put_object(const std::string& container,
                                          const std::string& object,
                                          const std::string& data,
                                          const Deadline& deadline) {
    auto store = endpoint("object-store");
    if (!store) return store.error();

    auto response = call("PUT", *store + "/" + url_encode(container) + "/" + url_encode(object),
                         deadline, data, "application/octet-stream");
    if (!response) return response.error();
    if (!response->ok()) return http_error("upload object", *response);
    return Result<void>{};
}

Result<std::string> OpenStackSession::get_object(const std::string& container,
                                                 const std::string& object,
                                                 const Deadline& deadline) {
    auto store = endpoint("object-store");
    if (!store) return store.error();

    auto response = call("GET", *store + "/" + url_encode(container) + "/" + url_encode(object),
                         deadline);
    if (!response) return response.error();
    if (!response->ok()) return http_error("download object", *response);
    return std::move(response->body);
}

Result<void> OpenStackSession::delete_object(const std::string& container,
                                             const std::string& object,
                                             const Deadline& deadline) {
    auto store = endpoint("object-store");
    if (!store) return store.error();

    auto response = call("DELETE", *store + "/" + url_encode(container) + "/" + url_encode(object),
                         deadline);
    if (!response) return response.error();
    if (!response->ok()) return http_error("delete object", *response);
    return Result<void>{};
}

Result<std::vector<std::string>> OpenStackSession::list_objects(const std::string& container,
                                                                const Deadline& deadline) {
    auto store = endpoint("object-store");
    if (!store) return store.error();

    auto doc = call_json("list objects", "GET",
                         *store + "/" + url_encode(container) + "?format=json", deadline);
    if (!doc) return doc.error();

    std::vector<std::string> names;
    if (doc->is_array()) {
        for (const auto& entry : *doc) names.push_back(string_field(entry, "name"));
    }
    return names;
}

// ─────────────────────────────────────────────
// Inventory
// ─────────────────────────────────────────────

Result<std::vector<ResourceHandle>> OpenStackSession::list_resources(ResourceKind kind,
                                                                     std::string_view tag,
                                                                     const Deadline& deadline) {
    std::vector<ResourceHandle> out;

    switch (kind) {
        case ResourceKind::Server: {
            auto compute = endpoint("compute");
            if (!compute) return compute.error();
            // Nova treats the name filter as a regular expression.
            auto doc = call_json("list servers", "GET",
                                 *compute + "/servers?name=" + url_encode("^" + std::string{tag}),
                                 deadline);
            if (!doc) return doc.error();
            for (const auto& server : array_field(*doc, "servers")) {
                auto name = string_field(server, "name");
                auto id = string_field(server, "id");
                if (name.starts_with(tag) && !id.empty()) {
                    out.push_back({ResourceKind::Server, std::move(id), name});
                }
            }
            break;
        }
        case ResourceKind::FloatingIp: {
            auto api = network_api();
            if (!api) return api.error();
            auto doc = call_json("list floating ips", "GET", *api + "/floatingips", deadline);
            if (!doc) return doc.error();
            for (const auto& fip : array_field(*doc, "floatingips")) {
                auto description = string_field(fip, "description");
                auto id = string_field(fip, "id");
                if (description.starts_with(tag) && !id.empty()) {
                    out.push_back({ResourceKind::FloatingIp, std::move(id), description});
                }
            }
            break;
        }
        case ResourceKind::Container: {
            auto store = endpoint("object-store");
            if (!store) return store.error();
            auto doc = call_json("list containers", "GET",
                                 *store + "?format=json&prefix=" + url_encode(tag), deadline);
            if (!doc) return doc.error();
            if (doc->is_array()) {
                for (const auto& container : *doc) {
                    auto name = string_field(container, "name");
                    if (name.starts_with(tag)) {
                        out.push_back({ResourceKind::Container, name, name});
                    }
                }
            }
            break;
        }
    }

    return out;
}

Result<void> OpenStackSession::delete_resource(const ResourceHandle& resource,
                                               const Deadline& deadline) {
    std::string url;
    switch (resource.kind) {
        case ResourceKind::Server: {
            auto compute = endpoint("compute");
            if (!compute) return compute.error();
            url = *compute + "/servers/" + url_encode(resource.id);
            break;
        }
        case ResourceKind::FloatingIp: {
            auto api = network_api();
            if (!api) return api.error();
            url = *api + "/floatingips/" + url_encode(resource.id);
            break;
        }
        case ResourceKind::Container: {
            auto store = endpoint("object-store");
            if (!store) return store.error();
            auto objects = list_objects(resource.id, deadline);
            if (!objects) return objects.error();
            for (const auto& object : *objects) {
                if (auto deleted = delete_object(resource.id, object, deadline);
                    !deleted && !deleted.error().is(ErrorKind::NotFound)) {
                    return deleted.error();
                }
            }
            url = *store + "/" + url_encode(resource.id);
            break;
        }
    }

    auto response = call("DELETE", url, deadline);
    if (!response) return response.error();
    if (!response->ok()) {
        return http_error("delete " + std::string{to_string(resource.kind)} + " " + resource.id,
                          *response);
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// OpenStackSessionFactory
// ─────────────────────────────────────────────

OpenStackSessionFactory::OpenStackSessionFactory(std::shared_ptr<HttpTransport> transport,
                                                 CredentialsSource credentials)
    : transport_(std::move(transport)), credentials_(std::move(credentials)) {}

Result<std::shared_ptr<CloudSession>> OpenStackSessionFactory::open(const Deadline& deadline) {
    auto credentials = credentials_();
    if (!credentials) return credentials.error();

    auto catalog = authenticate(*transport_, *credentials, deadline);
    if (!catalog) return catalog.error();

    return std::shared_ptr<CloudSession>(std::make_shared<OpenStackSession>(
        transport_, std::move(*catalog), credentials->region_name, credentials->interface));
}

}  // namespace openstack_exporter
