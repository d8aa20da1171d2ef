/**
 * @file cloud.hpp
 * @brief Provider collaborator interfaces consumed by probes and the collector.
 *
 * CloudSession is the authenticated view of one provider project. Every call
 * is bound to a Deadline and must return promptly (with a Timeout error) once
 * it expires. Sessions hold no cached inventory; every lifecycle decision
 * re-queries the provider.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/deadline.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace openstack_exporter {

/**
 * @brief What to boot. Flavor, image and network are given by name.
 */
struct ServerSpec {
    std::string flavor;
    std::string image;
    std::string network;
    std::string keypair;   ///< Empty = none
};

/// Provider status strings the compute probe reacts to.
inline constexpr std::string_view kServerActive = "ACTIVE";
inline constexpr std::string_view kServerError = "ERROR";

/**
 * @brief A floating IP bound to an instance.
 */
struct FloatingIp {
    ResourceHandle handle;
    std::string address;
};

/**
 * @brief Authenticated provider session.
 */
class CloudSession {
public:
    virtual ~CloudSession() = default;

    // ── Compute ──────────────────────────────
    virtual Result<ResourceHandle> create_server(const std::string& name,
                                                 const ServerSpec& spec,
                                                 const Deadline& deadline) = 0;
    /// Provider status string, e.g. "BUILD", "ACTIVE", "ERROR".
    virtual Result<std::string> server_status(const ResourceHandle& server,
                                              const Deadline& deadline) = 0;
    virtual Result<FloatingIp> attach_floating_ip(const ResourceHandle& server,
                                                  const std::string& name,
                                                  const std::string& external_network,
                                                  const Deadline& deadline) = 0;

    // ── Object store ─────────────────────────
    virtual Result<ResourceHandle> create_container(const std::string& name,
                                                    const Deadline& deadline) = 0;
    virtual Result<void> put_object(const std::string& container,
                                    const std::string& object,
                                    const std::string& data,
                                    const Deadline& deadline) = 0;
    virtual Result<std::string> get_object(const std::string& container,
                                           const std::string& object,
                                           const Deadline& deadline) = 0;
    virtual Result<void> delete_object(const std::string& container,
                                       const std::string& object,
                                       const Deadline& deadline) = 0;
    virtual Result<std::vector<std::string>> list_objects(const std::string& container,
                                                          const Deadline& deadline) = 0;

    // ── Inventory ────────────────────────────

    /// Every resource of `kind` whose name starts with `tag`.
    virtual Result<std::vector<ResourceHandle>> list_resources(ResourceKind kind,
                                                               std::string_view tag,
                                                               const Deadline& deadline) = 0;

    /// Delete one resource. Containers are emptied first.
    virtual Result<void> delete_resource(const ResourceHandle& resource,
                                         const Deadline& deadline) = 0;
};

/**
 * @brief Creates authenticated sessions; called once per probe run and per sweep.
 */
class SessionFactory {
public:
    virtual ~SessionFactory() = default;
    virtual Result<std::shared_ptr<CloudSession>> open(const Deadline& deadline) = 0;
};

/**
 * @brief Runs one command on a remote host over a remote shell.
 */
class RemoteShell {
public:
    virtual ~RemoteShell() = default;

    /// Returns the command's combined output on exit status 0.
    virtual Result<std::string> run(const std::string& host,
                                    const std::string& user,
                                    const std::string& command,
                                    const Deadline& deadline) = 0;
};

}  // namespace openstack_exporter
