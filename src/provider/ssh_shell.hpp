/**
 * @file ssh_shell.hpp
 * @brief RemoteShell backed by the system ssh client.
 */

#pragma once

#include "provider/cloud.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace openstack_exporter {

struct SshOptions {
    std::string binary = "ssh";
    std::string identity_file;       ///< Empty = client default
    uint32_t connect_timeout_s = 10;
};

/**
 * @brief Runs commands with `ssh -o BatchMode=yes`.
 *
 * Host keys are not checked: every probe instance is freshly booted and its
 * key is unknown by construction. The child is killed once the deadline
 * expires or stop is requested.
 */
class SshRemoteShell : public RemoteShell {
public:
    explicit SshRemoteShell(SshOptions options = {});

    Result<std::string> run(const std::string& host,
                            const std::string& user,
                            const std::string& command,
                            const Deadline& deadline) override;

    /// Argument vector passed to execvp, exposed for tests.
    [[nodiscard]] std::vector<std::string> command_line(const std::string& host,
                                                        const std::string& user,
                                                        const std::string& command) const;

private:
    SshOptions options_;
};

}  // namespace openstack_exporter
