#include "konduit/net/HttpClient.hpp"

#include <iostream>
#include "httplib.h"
#include "konduit/net/Url.hpp"

namespace konduit::net {

namespace {

httplib::Headers toHttplib(const Headers& headers) {
    httplib::Headers out;
    for (const auto& kv : headers) out.emplace(kv.first, kv.second);
    return out;
}

void configure(httplib::Client& cli, std::chrono::seconds timeout) {
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);
    cli.set_follow_location(true);
}

} // namespace

HttplibClient::HttplibClient(size_t maxBodyBytes) : maxBodyBytes_(maxBodyBytes) {}

std::optional<HttpResponse> HttplibClient::get(const std::string& url,
                                               const Headers& headers,
                                               std::chrono::seconds timeout) {
    auto parsed = parseUrl(url);
    if (!parsed) {
        std::cerr << "HttpClient: invalid url " << url << "\n";
        return std::nullopt;
    }

    httplib::Client cli(parsed->origin());
    if (!cli.is_valid()) {
        std::cerr << "HttpClient: unsupported origin " << parsed->origin() << "\n";
        return std::nullopt;
    }
    configure(cli, timeout);

    HttpResponse out;
    bool oversized = false;
    auto res = cli.Get(parsed->pathAndQuery(), toHttplib(headers),
        [&](const httplib::Response& r) {
            out.status = r.status;
            out.contentType = r.get_header_value("Content-Type");
            out.body.clear();
            return true;
        },
        [&](const char* data, size_t len) {
            if (out.body.size() + len > maxBodyBytes_) {
                oversized = true;
                return false;
            }
            out.body.append(data, len);
            return true;
        });

    if (!res) {
        if (oversized) {
            std::cerr << "HttpClient: download aborted, exceeded " << maxBodyBytes_ << " bytes for " << url << "\n";
        } else {
            std::cerr << "HttpClient: GET " << url << " failed: " << httplib::to_string(res.error()) << "\n";
        }
        return std::nullopt;
    }
    out.status = res->status;
    return out;
}

std::optional<HttpResponse> HttplibClient::post(const std::string& url,
                                                const std::string& body,
                                                const std::string& contentType,
                                                const Headers& headers,
                                                std::chrono::seconds timeout) {
    auto parsed = parseUrl(url);
    if (!parsed) {
        std::cerr << "HttpClient: invalid url " << url << "\n";
        return std::nullopt;
    }

    httplib::Client cli(parsed->origin());
    if (!cli.is_valid()) {
        std::cerr << "HttpClient: unsupported origin " << parsed->origin() << "\n";
        return std::nullopt;
    }
    configure(cli, timeout);

    auto res = cli.Post(parsed->pathAndQuery(), toHttplib(headers), body, contentType);
    if (!res) {
        std::cerr << "HttpClient: POST " << url << " failed: " << httplib::to_string(res.error()) << "\n";
        return std::nullopt;
    }
    if (res->body.size() > maxBodyBytes_) {
        std::cerr << "HttpClient: response exceeded " << maxBodyBytes_ << " bytes for " << url << "\n";
        return std::nullopt;
    }

    HttpResponse out;
    out.status = res->status;
    out.contentType = res->get_header_value("Content-Type");
    out.body = res->body;
    return out;
}

} // namespace konduit::net
