/**
 * @file http_transport.cpp
 * @brief CurlTransport implementation.
 */

#include "provider/openstack/http_transport.hpp"

#include <algorithm>
#include <cctype>

#include <curl/curl.h>

namespace openstack_exporter {

namespace {

constexpr long kMinTimeoutMs = 1;
constexpr size_t kMaxErrorBody = 256;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string line(buffer, size * nitems);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = line.substr(0, colon);
        std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        std::string value = line.substr(colon + 1);
        auto first = value.find_first_not_of(" \t");
        auto last = value.find_last_not_of(" \t\r\n");
        value = first == std::string::npos ? std::string{} : value.substr(first, last - first + 1);
        (*headers)[key] = value;
    }
    return size * nitems;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* deadline = static_cast<const Deadline*>(clientp);
    return deadline->stop_requested() ? 1 : 0;
}

}  // anonymous namespace

std::string HttpResponse::header(const std::string& lower_name) const {
    auto it = headers.find(lower_name);
    return it == headers.end() ? std::string{} : it->second;
}

CurlTransport::CurlTransport() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlTransport::~CurlTransport() { curl_global_cleanup(); }

Result<HttpResponse> CurlTransport::perform(const HttpRequest& request,
                                            const Deadline& deadline) {
    if (deadline.expired()) {
        return Error{ErrorKind::Timeout, request.method + " " + request.url + ": deadline exceeded"};
    }

    CURL* curl = curl_easy_init();
    if (curl == nullptr) {
        return Error{ErrorKind::Internal, "curl_easy_init failed"};
    }

    HttpResponse response;
    long timeout_ms = 0;  // 0 = no transfer limit
    if (auto remaining = deadline.remaining(); remaining != Duration::max()) {
        timeout_ms = std::max<long>(kMinTimeoutMs, static_cast<long>(remaining.count()));
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &deadline);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "openstack-client-exporter");

    if (request.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (!request.body.empty() || request.method == "PUT" || request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : request.headers) {
        std::string line = key + ": " + value;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    // Swift would otherwise see "Expect: 100-continue" on uploads and stall a round trip.
    header_list = curl_slist_append(header_list, "Expect:");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    const CURLcode code = curl_easy_perform(curl);
    if (code == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (code == CURLE_OPERATION_TIMEDOUT || code == CURLE_ABORTED_BY_CALLBACK) {
        return Error{ErrorKind::Timeout,
                     request.method + " " + request.url + ": " + curl_easy_strerror(code)};
    }
    if (code != CURLE_OK) {
        return Error{ErrorKind::Provider,
                     request.method + " " + request.url + ": " + curl_easy_strerror(code)};
    }
    return response;
}

Error http_error(const std::string& what, const HttpResponse& response) {
    std::string body = response.body.substr(0, kMaxErrorBody);
    std::replace(body.begin(), body.end(), '\n', ' ');
    auto kind = response.status == 404 ? ErrorKind::NotFound : ErrorKind::Provider;
    return Error{kind, what + ": HTTP " + std::to_string(response.status)
                       + (body.empty() ? std::string{} : " " + body)};
}

}  // namespace openstack_exporter
