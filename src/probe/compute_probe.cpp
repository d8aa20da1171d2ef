/**
 * @file compute_probe.cpp
 * @brief ComputeProbe implementation.
 */

#include "probe/compute_probe.hpp"
#include "naming/resource_name.hpp"

namespace openstack_exporter {

ComputeProbe::ComputeProbe(const ProbesConfig& probes,
                           const InstanceConfig& instance,
                           SessionFactory& sessions,
                           RemoteShell& shell,
                           Logger& logger)
    : Probe(ProbeKind::Compute, sessions, logger)
    , probes_(probes)
    , instance_(instance)
    , shell_(shell) {}

Result<void> ComputeProbe::exercise(const Deadline& deadline,
                                    CloudSession& session,
                                    StepTimer& timer) {
    const auto name = create_name();

    // ── Create ───────────────────────────────
    ServerSpec spec{
        .flavor = instance_.flavor,
        .image = instance_.image,
        .network = instance_.internal_network,
        .keypair = instance_.keypair,
    };
    auto server = session.create_server(name, spec, deadline);
    if (!server) return server.error();
    logger().log(LogLevel::Debug, "instance", "created server " + server->id + " " + name);
    if (auto s = timer.step(deadline, "server_created"); !s) return s;

    // ── Wait for ready ───────────────────────
    if (auto ready = wait_until_active(deadline, session, *server); !ready) return ready;
    if (auto s = timer.step(deadline, "server_active"); !s) return s;

    auto fip = session.attach_floating_ip(*server, name, instance_.external_network, deadline);
    if (!fip) return fip.error();
    if (auto s = timer.step(deadline, "floating_ip_attached"); !s) return s;

    // ── Exercise ─────────────────────────────
    if (auto shell = connect(deadline, fip->address); !shell) return shell;
    if (auto s = timer.step(deadline, "ssh_connected"); !s) return s;

    // ── Delete ───────────────────────────────
    if (auto d = session.delete_resource(fip->handle, deadline); !d) return d;
    if (auto d = session.delete_resource(*server, deadline); !d) return d;
    return timer.step(deadline, "resources_deleted");
}

Result<void> ComputeProbe::wait_until_active(const Deadline& deadline,
                                             CloudSession& session,
                                             const ResourceHandle& server) {
    Duration interval{probes_.poll_interval_ms};
    const Duration max_interval{probes_.max_poll_interval_ms};

    while (true) {
        auto status = session.server_status(server, deadline);
        if (!status) return status.error();
        if (*status == kServerActive) return Result<void>{};
        if (*status == kServerError) {
            return Error{ErrorKind::Provider, "server " + server.id + " entered ERROR state"};
        }

        if (!deadline.sleep_for(interval)) {
            return Error{ErrorKind::Timeout,
                         "timeout waiting for server " + server.id + " (last status "
                         + *status + ")"};
        }
        interval = next_poll_interval(interval, max_interval);
    }
}

Result<void> ComputeProbe::connect(const Deadline& deadline, const std::string& address) {
    Duration interval{probes_.poll_interval_ms};
    const Duration max_interval{probes_.max_poll_interval_ms};

    for (uint32_t attempt = 1;; ++attempt) {
        auto output = shell_.run(address, instance_.user, instance_.ssh_command, deadline);
        if (output) return Result<void>{};

        const auto& error = output.error();
        if (!error.is(ErrorKind::RemoteShell) || attempt >= instance_.ssh_attempts) {
            return error;
        }
        logger().log(LogLevel::Debug, "instance",
                     "ssh attempt " + std::to_string(attempt) + " to " + address
                     + " failed: " + error.message);

        // A deadline that ends the retries still reports the shell failure.
        if (!deadline.sleep_for(interval)) return error;
        interval = next_poll_interval(interval, max_interval);
    }
}

}  // namespace openstack_exporter
