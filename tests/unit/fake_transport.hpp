/**
 * @file fake_transport.hpp
 * @brief Scripted HttpTransport for provider tests.
 */

#pragma once

#include "provider/openstack/http_transport.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace openstack_exporter::test_support {

/**
 * @brief Replies with the response registered for "METHOD url"; 404 otherwise.
 */
class FakeTransport : public HttpTransport {
public:
    void on(const std::string& method, const std::string& url, long status,
            std::string body = {}, std::map<std::string, std::string> headers = {}) {
        std::lock_guard lock(mutex_);
        routes_[method + " " + url] = HttpResponse{status, std::move(headers), std::move(body)};
    }

    Result<HttpResponse> perform(const HttpRequest& request, const Deadline& deadline) override {
        std::lock_guard lock(mutex_);
        requests_.push_back(request);
        if (deadline.expired()) {
            return Error{ErrorKind::Timeout, request.method + " " + request.url + ": deadline exceeded"};
        }
        auto it = routes_.find(request.method + " " + request.url);
        if (it == routes_.end()) {
            return HttpResponse{404, {}, "no route for " + request.url};
        }
        return it->second;
    }

    [[nodiscard]] std::vector<HttpRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    [[nodiscard]] bool called(const std::string& method, const std::string& url) const {
        std::lock_guard lock(mutex_);
        for (const auto& r : requests_) {
            if (r.method == method && r.url == url) return true;
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, HttpResponse> routes_;
    std::vector<HttpRequest> requests_;
};

/// Header value of `request`, or empty.
inline std::string request_header(const HttpRequest& request, const std::string& name) {
    for (const auto& [key, value] : request.headers) {
        if (key == name) return value;
    }
    return {};
}

}  // namespace openstack_exporter::test_support
