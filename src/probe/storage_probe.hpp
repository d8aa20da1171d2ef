/**
 * @file storage_probe.hpp
 * @brief Object-store round trip: upload, download, compare, delete.
 *
 * Steps: start, authenticated, container_created, object_uploaded,
 * object_downloaded, object_verified, resources_deleted.
 */

#pragma once

#include "core/config.hpp"
#include "probe/probe.hpp"

#include <string>

namespace openstack_exporter {

class StorageProbe : public Probe {
public:
    StorageProbe(const ProbesConfig& probes, SessionFactory& sessions, Logger& logger);

protected:
    Result<void> exercise(const Deadline& deadline,
                          CloudSession& session,
                          StepTimer& timer) override;

private:
    const ProbesConfig& probes_;
};

/// `size` random bytes.
[[nodiscard]] std::string random_payload(size_t size);

}  // namespace openstack_exporter
