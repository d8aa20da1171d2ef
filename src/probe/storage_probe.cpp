/**
 * @file storage_probe.cpp
 * @brief StorageProbe implementation.
 */

#include "probe/storage_probe.hpp"
#include "naming/resource_name.hpp"

#include <random>

namespace openstack_exporter {

std::string random_payload(size_t size) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> byte(0, 255);

    std::string data(size, '\0');
    for (auto& c : data) c = static_cast<char>(byte(rng));
    return data;
}

StorageProbe::StorageProbe(const ProbesConfig& probes, SessionFactory& sessions, Logger& logger)
    : Probe(ProbeKind::Storage, sessions, logger), probes_(probes) {}

Result<void> StorageProbe::exercise(const Deadline& deadline,
                                    CloudSession& session,
                                    StepTimer& timer) {
    auto container = session.create_container(create_name(), deadline);
    if (!container) return container.error();
    if (auto s = timer.step(deadline, "container_created"); !s) return s;

    const auto object = create_name();
    const auto payload = random_payload(static_cast<size_t>(probes_.payload_bytes));

    if (auto up = session.put_object(container->id, object, payload, deadline); !up) return up;
    if (auto s = timer.step(deadline, "object_uploaded"); !s) return s;

    auto downloaded = session.get_object(container->id, object, deadline);
    if (!downloaded) return downloaded.error();
    if (auto s = timer.step(deadline, "object_downloaded"); !s) return s;

    if (*downloaded != payload) {
        return Error{ErrorKind::Verification,
                     "object " + object + " differs from upload ("
                     + std::to_string(downloaded->size()) + " of "
                     + std::to_string(payload.size()) + " bytes returned)"};
    }
    if (auto s = timer.step(deadline, "object_verified"); !s) return s;

    if (auto d = session.delete_object(container->id, object, deadline); !d) return d;
    if (auto d = session.delete_resource(*container, deadline); !d) return d;
    return timer.step(deadline, "resources_deleted");
}

}  // namespace openstack_exporter
