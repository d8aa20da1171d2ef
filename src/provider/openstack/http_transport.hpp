/**
 * @file http_transport.hpp
 * @brief Deadline-bound HTTP request execution for the OpenStack APIs.
 */

#pragma once

#include "core/result.hpp"
#include "executor/deadline.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace openstack_exporter {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct HttpResponse {
    long status = 0;
    std::map<std::string, std::string> headers;   ///< Keys lower-cased
    std::string body;

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
    [[nodiscard]] std::string header(const std::string& lower_name) const;
};

/**
 * @brief Executes one HTTP request; transport failures become Provider or
 *        Timeout errors, HTTP status codes are left to the caller.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual Result<HttpResponse> perform(const HttpRequest& request,
                                         const Deadline& deadline) = 0;
};

/**
 * @brief libcurl easy-interface transport.
 *
 * The transfer timeout is the deadline's remaining time and a progress
 * callback aborts the transfer as soon as the deadline's stop is requested.
 */
class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    Result<HttpResponse> perform(const HttpRequest& request,
                                 const Deadline& deadline) override;
};

/// Map a non-2xx response onto NotFound (404) or Provider errors.
[[nodiscard]] Error http_error(const std::string& what, const HttpResponse& response);

}  // namespace openstack_exporter
