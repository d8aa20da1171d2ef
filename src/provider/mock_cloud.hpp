/**
 * @file mock_cloud.hpp
 * @brief In-memory provider for tests and dry runs.
 *
 * MockCloud keeps an inventory of servers, floating IPs and containers and
 * hands out sessions that operate on it. Faults are configured per resource
 * kind; artificial latency is spent in Deadline::sleep_for so mocked calls
 * honor cancellation like real provider calls.
 */

#pragma once

#include "provider/cloud.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace openstack_exporter {

/**
 * @brief Fault injection switches. All default to "healthy".
 */
struct MockFaults {
    bool fail_auth = false;
    std::set<ResourceKind> fail_create;
    std::set<ResourceKind> fail_delete;
    std::set<ResourceKind> fail_list;
    bool fail_upload = false;
    bool corrupt_download = false;
    bool server_error_state = false;
    uint32_t polls_until_active = 1;   ///< status() calls before ACTIVE
    Duration latency{0};               ///< Added to every call
};

class MockCloud : public SessionFactory {
public:
    MockCloud() = default;

    Result<std::shared_ptr<CloudSession>> open(const Deadline& deadline) override;

    // ── Test helpers ─────────────────────────
    void set_faults(MockFaults faults);
    [[nodiscard]] MockFaults faults() const;

    /// Insert a pre-existing resource, e.g. a leftover from an earlier crash.
    ResourceHandle add_resource(ResourceKind kind, const std::string& name);

    [[nodiscard]] std::vector<ResourceHandle> resources(ResourceKind kind) const;
    [[nodiscard]] size_t count(ResourceKind kind) const;
    [[nodiscard]] size_t total_count() const;
    [[nodiscard]] std::vector<ResourceHandle> deleted() const;
    /// Create calls made for `kind`, rejected ones included.
    [[nodiscard]] size_t create_attempts(ResourceKind kind) const;
    [[nodiscard]] size_t sessions_opened() const noexcept { return sessions_opened_.load(); }

private:
    friend class MockSession;

    struct Entry {
        ResourceHandle handle;
        std::string status;
        uint32_t polls{0};
        std::map<std::string, std::string> objects;
    };

    Result<void> delay(const Deadline& deadline) const;
    std::string next_id(ResourceKind kind);

    mutable std::mutex mutex_;
    MockFaults faults_;
    std::map<ResourceKind, std::vector<Entry>> inventory_;
    std::vector<ResourceHandle> deleted_;
    std::map<ResourceKind, size_t> create_attempts_;
    uint64_t next_id_{1};
    std::atomic<size_t> sessions_opened_{0};
};

/**
 * @brief Scripted remote shell.
 */
class MockRemoteShell : public RemoteShell {
public:
    Result<std::string> run(const std::string& host,
                            const std::string& user,
                            const std::string& command,
                            const Deadline& deadline) override;

    void set_failure(bool fail) noexcept { fail_.store(fail); }
    void set_latency(Duration latency) noexcept { latency_ms_.store(latency.count()); }
    [[nodiscard]] std::vector<std::string> hosts() const;

private:
    std::atomic<bool> fail_{false};
    std::atomic<Duration::rep> latency_ms_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> hosts_;
};

}  // namespace openstack_exporter
