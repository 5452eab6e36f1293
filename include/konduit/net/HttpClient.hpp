#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace konduit::net {

using Headers = std::map<std::string, std::string>;

struct HttpResponse {
    int status = 0;
    std::string contentType;
    std::string body;
};

// Blocking HTTP transport. An empty optional means the request never produced
// a response (connection refused, timeout, oversized body, bad URL).
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual std::optional<HttpResponse> get(const std::string& url,
                                            const Headers& headers,
                                            std::chrono::seconds timeout) = 0;

    virtual std::optional<HttpResponse> post(const std::string& url,
                                             const std::string& body,
                                             const std::string& contentType,
                                             const Headers& headers,
                                             std::chrono::seconds timeout) = 0;
};

// cpp-httplib backed transport. Stateless; one httplib::Client per request.
class HttplibClient : public HttpClient {
public:
    explicit HttplibClient(size_t maxBodyBytes = 8 * 1024 * 1024);

    std::optional<HttpResponse> get(const std::string& url,
                                    const Headers& headers,
                                    std::chrono::seconds timeout) override;

    std::optional<HttpResponse> post(const std::string& url,
                                     const std::string& body,
                                     const std::string& contentType,
                                     const Headers& headers,
                                     std::chrono::seconds timeout) override;

private:
    size_t maxBodyBytes_;
};

} // namespace konduit::net
