/**
 * @file mock_cloud.cpp
 * @brief MockCloud implementation: configurable in-memory provider for testing.
 */

#include "provider/mock_cloud.hpp"

#include <algorithm>

namespace openstack_exporter {

namespace {

Error rejected(std::string_view what) {
    return Error{ErrorKind::Provider, "mock provider rejected " + std::string{what}};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// MockSession
// ─────────────────────────────────────────────

class MockSession : public CloudSession {
public:
    explicit MockSession(MockCloud& cloud) : cloud_(cloud) {}

    Result<ResourceHandle> create_server(const std::string& name,
                                         const ServerSpec& /*spec*/,
                                         const Deadline& deadline) override {
        if (auto d = cloud_.delay(deadline); !d) return d.error();
        std::lock_guard lock(cloud_.mutex_);
        ++cloud_.create_attempts_[ResourceKind::Server];
        if (cloud_.faults_.fail_create.contains(ResourceKind::Server)) {
            return rejected("server creation: flavor not found");
        }
        MockCloud::Entry entry;
        entry.handle = {ResourceKind::Server, cloud_.next_id(ResourceKind::Server), name};
        entry.status = "BUILD";
        cloud_.inventory_[ResourceKind::Server].push_back(entry);
        return entry.handle;
    }

    Result<std::string> server_status(const ResourceHandle& server,
                                      const Deadline& deadline) override {
        if (auto d = cloud_.delay(deadline); !d) return d.error();
        std::lock_guard lock(cloud_.mutex_);
        auto* entry = find(server);
        if (!entry) return Error{ErrorKind::NotFound, "server " + server.id + " not found"};
        if (cloud_.faults_.server_error_state) {
            entry->status = std::string{kServerError};
        } else if (++entry->polls >= cloud_.faults_.polls_until_active) {
            entry->status = std::string{kServerActive};
        }
        return entry->status;
    }

    Result<FloatingIp> attach_floating_ip(const ResourceHandle& server,
                                          const std::string& name,
                                          const std::string& /*external_network*/,
                                          const Deadline& deadline) override {
        if (auto d = cloud_.delay(deadline); !d) return d.error();
        std::lock_guard lock(cloud_.mutex_);
        ++cloud_.create_attempts_[ResourceKind::FloatingIp];
        if (cloud_.faults_.fail_create.contains(ResourceKind::FloatingIp)) {
            return rejected("floating ip creation: external network not found");
        }
        if (!find(server)) return Error{ErrorKind::NotFound, "server " + server.id + " not found"};

        MockCloud::Entry entry;
        entry.handle = {ResourceKind::FloatingIp, cloud_.next_id(ResourceKind::FloatingIp), name};
        cloud_.inventory_[ResourceKind::FloatingIp].push_back(entry);
        return FloatingIp{entry.handle,
                          "203.0.113." + std::to_string(cloud_.next_id_ % 250 + 1)};
    }

    Result<ResourceHandle> create_container(const std::string& name,
                                            const Deadline& deadline) override {
        if (auto d = cloud_.delay(deadline); !d) return d.error();
        std::lock_guard lock(cloud_.mutex_);
        ++cloud_.create_attempts_[ResourceKind::Container];
        if (cloud_.faults_.fail_create.contains(ResourceKind::Container)) {
            return rejected("container creation");
        }
        MockCloud::Entry entry;
        entry.handle = {ResourceKind::Container, name, name};
        cloud_.inventory_[ResourceKind::Container].push_back(entry);
        return entry.handle;
    }

    Result<void> put_object(const std::string& container,
                            const std::string& object,
                            const std::string& data,
                            const Deadline& deadline) override {
        if (auto d = cloud_.delay(deadline); !d) return d.error();
        std::lock_guard lock(cloud_.mutex_);
        if (cloud_.faults_.fail_upload) return rejected("object upload");
        auto* entry = find({ResourceKind::Container, container, container});
        if (!entry) return Error{ErrorKind::NotFound, "container " + container + " not found"};
        entry->objects[object] = data;
        return Result<void>{};
    }

    Result<std::string> get_object(const std::string& container,
                                   const std::string& object,
                                   const Deadline& deadline) override {
        if (auto d = cloud_.delay(deadline); !d) return d.error();
        std::lock_guard lock(cloud_.mutex_);
        auto* entry = find({ResourceKind::Container, container, container});
        if (!entry) return Error{ErrorKind::NotFound, "container " + container + " not found"};
        auto it = entry->objects.find(object);
        if (it == entry->objects.end()) {
            return Error{ErrorKind::NotFound, "object " + object + " not found"};
        }
        auto data = it->second;
        if (cloud_.faults_.corrupt_download && !data.empty()) {
            data[0] = static_cast<char>(data[0] ^ 0x5A);
        }
        return data;
    }

    Result<void> delete_object(const std::string& container,
                               const std::string& object,
                               const Deadline& deadline) override {
        if (auto d = cloud_.delay(deadline); !d) return d.error();
        std::lock_guard lock(cloud_.mutex_);
        auto* entry = find({ResourceKind::Container, container, container});
        if (!entry || entry->objects.erase(object) == 0) {
            return Error{ErrorKind::NotFound, "object " + object + " not found"};
        }
        return Result<void>{};
    }

    Result<std::vector<std::string>> list_objects(const std::string& container,
                                                  const Deadline& deadline) override {
        if (auto d = cloud_.delay(deadline); !d) return d.error();
        std::lock_guard lock(cloud_.mutex_);
        auto* entry = find({ResourceKind::Container, container, container});
        if (!entry) return Error{ErrorKind::NotFound, "container " + container + " not found"};
        std::vector<std::string> names;
        for (const auto& [name, data] : entry->objects) names.push_back(name);
        return names;
    }

    Result<std::vector<ResourceHandle>> list_resources(ResourceKind kind,
                                                       std::string_view tag,
                                                       const Deadline& deadline) override {
        if (auto d = cloud_.delay(deadline); !d) return d.error();
        std::lock_guard lock(cloud_.mutex_);
        if (cloud_.faults_.fail_list.contains(kind)) {
            return rejected("listing of " + std::string{to_string(kind)});
        }
        std::vector<ResourceHandle> out;
        for (const auto& entry : cloud_.inventory_[kind]) {
            if (entry.handle.name.starts_with(tag)) out.push_back(entry.handle);
        }
        return out;
    }

    Result<void> delete_resource(const ResourceHandle& resource,
                                 const Deadline& deadline) override {
        if (auto d = cloud_.delay(deadline); !d) return d.error();
        std::lock_guard lock(cloud_.mutex_);
        if (cloud_.faults_.fail_delete.contains(resource.kind)) {
            return rejected("deletion of " + resource.id);
        }
        auto& entries = cloud_.inventory_[resource.kind];
        auto it = std::find_if(entries.begin(), entries.end(), [&](const MockCloud::Entry& e) {
            return e.handle.id == resource.id;
        });
        if (it == entries.end()) {
            return Error{ErrorKind::NotFound, std::string{to_string(resource.kind)} + " "
                         + resource.id + " not found"};
        }
        cloud_.deleted_.push_back(it->handle);
        entries.erase(it);
        return Result<void>{};
    }

private:
    MockCloud::Entry* find(const ResourceHandle& handle) {
        for (auto& entry : cloud_.inventory_[handle.kind]) {
            if (entry.handle.id == handle.id) return &entry;
        }
        return nullptr;
    }

    MockCloud& cloud_;
};

// ─────────────────────────────────────────────
// MockCloud
// ─────────────────────────────────────────────

Result<std::shared_ptr<CloudSession>> MockCloud::open(const Deadline& deadline) {
    if (auto d = delay(deadline); !d) return d.error();
    if (faults().fail_auth) {
        return Error{ErrorKind::Configuration, "authentication failure: mock credentials rejected"};
    }
    ++sessions_opened_;
    return std::shared_ptr<CloudSession>(std::make_shared<MockSession>(*this));
}

void MockCloud::set_faults(MockFaults faults) {
    std::lock_guard lock(mutex_);
    faults_ = std::move(faults);
}

MockFaults MockCloud::faults() const {
    std::lock_guard lock(mutex_);
    return faults_;
}

ResourceHandle MockCloud::add_resource(ResourceKind kind, const std::string& name) {
    std::lock_guard lock(mutex_);
    Entry entry;
    entry.handle = {kind, kind == ResourceKind::Container ? name : next_id(kind), name};
    entry.status = kind == ResourceKind::Server ? std::string{kServerActive} : std::string{};
    if (kind == ResourceKind::Container) {
        entry.objects[name] = "leftover";
    }
    inventory_[kind].push_back(entry);
    return entry.handle;
}

std::vector<ResourceHandle> MockCloud::resources(ResourceKind kind) const {
    std::lock_guard lock(mutex_);
    std::vector<ResourceHandle> out;
    if (auto it = inventory_.find(kind); it != inventory_.end()) {
        for (const auto& entry : it->second) out.push_back(entry.handle);
    }
    return out;
}

size_t MockCloud::count(ResourceKind kind) const {
    std::lock_guard lock(mutex_);
    auto it = inventory_.find(kind);
    return it == inventory_.end() ? 0 : it->second.size();
}

size_t MockCloud::total_count() const {
    std::lock_guard lock(mutex_);
    size_t total = 0;
    for (const auto& [kind, entries] : inventory_) total += entries.size();
    return total;
}

std::vector<ResourceHandle> MockCloud::deleted() const {
    std::lock_guard lock(mutex_);
    return deleted_;
}

size_t MockCloud::create_attempts(ResourceKind kind) const {
    std::lock_guard lock(mutex_);
    auto it = create_attempts_.find(kind);
    return it == create_attempts_.end() ? 0 : it->second;
}

Result<void> MockCloud::delay(const Deadline& deadline) const {
    Duration latency;
    {
        std::lock_guard lock(mutex_);
        latency = faults_.latency;
    }
    if (deadline.expired()) {
        return Error{ErrorKind::Timeout, "mock provider call cancelled"};
    }
    if (latency.count() > 0 && !deadline.sleep_for(latency)) {
        return Error{ErrorKind::Timeout, "mock provider call cancelled"};
    }
    return Result<void>{};
}

std::string MockCloud::next_id(ResourceKind kind) {
    return std::string{to_string(kind)} + "-" + std::to_string(next_id_++);
}

// ─────────────────────────────────────────────
// MockRemoteShell
// ─────────────────────────────────────────────

Result<std::string> MockRemoteShell::run(const std::string& host,
                                         const std::string& /*user*/,
                                         const std::string& /*command*/,
                                         const Deadline& deadline) {
    {
        std::lock_guard lock(mutex_);
        hosts_.push_back(host);
    }
    auto latency = Duration{latency_ms_.load()};
    if (latency.count() > 0 && !deadline.sleep_for(latency)) {
        return Error{ErrorKind::Timeout, "remote shell cancelled"};
    }
    if (fail_.load()) {
        return Error{ErrorKind::RemoteShell, "Permission denied (publickey)"};
    }
    return std::string{};
}

std::vector<std::string> MockRemoteShell::hosts() const {
    std::lock_guard lock(mutex_);
    return hosts_;
}

}  // namespace openstack_exporter
