/**
 * @file version.hpp
 * @brief Build version, injected by the build system.
 */

#pragma once

#include <string_view>

#ifndef OPENSTACK_EXPORTER_VERSION
#define OPENSTACK_EXPORTER_VERSION "0.0.0-dev"
#endif

namespace openstack_exporter {

inline constexpr std::string_view kVersion = OPENSTACK_EXPORTER_VERSION;
inline constexpr std::string_view kProgramName = "openstack_client_exporter";

}  // namespace openstack_exporter
