/**
 * @file compute_probe.hpp
 * @brief Boots an instance, reaches it over ssh, deletes it.
 *
 * Steps: start, authenticated, server_created, server_active,
 * floating_ip_attached, ssh_connected, resources_deleted.
 */

#pragma once

#include "core/config.hpp"
#include "probe/probe.hpp"

namespace openstack_exporter {

class ComputeProbe : public Probe {
public:
    ComputeProbe(const ProbesConfig& probes,
                 const InstanceConfig& instance,
                 SessionFactory& sessions,
                 RemoteShell& shell,
                 Logger& logger);

protected:
    Result<void> exercise(const Deadline& deadline,
                          CloudSession& session,
                          StepTimer& timer) override;

private:
    /// Poll the server status with backoff until ACTIVE.
    Result<void> wait_until_active(const Deadline& deadline,
                                   CloudSession& session,
                                   const ResourceHandle& server);

    /// Run the verification command, retrying while sshd comes up.
    Result<void> connect(const Deadline& deadline, const std::string& address);

    const ProbesConfig& probes_;
    const InstanceConfig& instance_;
    RemoteShell& shell_;
};

}  // namespace openstack_exporter
