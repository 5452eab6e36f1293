#include "KonduitHttpServer.hpp"

#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

KonduitHttpServer::KonduitHttpServer(konduit::Config config)
    : host_(config.host), port_(config.port), engine_(config), startTime_(std::chrono::steady_clock::now()) {
    setupRoutes();
}

void KonduitHttpServer::run() {
    std::cout << "Konduit HTTP server listening on "
              << host_ << ":" << port_ << std::endl;
    if (!server_.listen(host_.c_str(), port_)) {
        throw std::runtime_error("failed to bind " + host_ + ":" + std::to_string(port_));
    }
}

void KonduitHttpServer::setupRoutes() {

    // JSON helpers
    auto ok = [](const json& data) {
        return json{
            {"status", "ok"},
            {"data", data}
        };
    };

    auto err = [](int code, const std::string& message) {
        return json{
            {"status", "error"},
            {"error", {
                {"code", code},
                {"message", message}
            }}
        };
    };

    // Request body as JSON; empty body is an empty object.
    auto parseBody = [](const httplib::Request& req) {
        if (req.body.empty()) return json::object();
        return json::parse(req.body);
    };

    // CORS helper to add to ALL responses
    auto addCors = [](httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    };

    auto reply = [addCors](httplib::Response& res, int status, const json& body) {
        res.status = status;
        res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
        addCors(res);
    };

    // Handle preflight OPTIONS requests for ANY route
    server_.Options(R"(.*)", [addCors](const httplib::Request&, httplib::Response& res) {
        addCors(res);
        res.status = 200;
        res.set_content("", "text/plain");
    });

    // --- HEALTH ---
    server_.Get("/v1/health", [this, ok, reply](const httplib::Request&, httplib::Response& res) {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime_).count();
        reply(res, 200, ok(json{{"uptime_seconds", uptime}}));
    });

    // --- CONFIG ---
    server_.Get("/v1/config", [this, ok, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, 200, ok(engine_.config().toJson()));
    });

    // --- INDEX STATUS ---
    server_.Get("/v1/index", [this, ok, err, reply](const httplib::Request&, httplib::Response& res) {
        try {
            reply(res, 200, ok(engine_.indexStatus()));
        } catch (const std::exception& e) {
            reply(res, 500, err(500, e.what()));
        }
    });

    // --- CRAWL ---
    server_.Post("/api/crawl", [this, parseBody, reply](const httplib::Request& req, httplib::Response& res) {
        konduit::QueryRequest request;
        try {
            request = parseBody(req).get<konduit::QueryRequest>();
        } catch (const json::exception& e) {
            reply(res, 400, json{{"success", false}, {"message", std::string("Invalid JSON: ") + e.what()}});
            return;
        }
        if (request.url.empty() && request.url2.empty()) {
            reply(res, 400, json{{"success", false}, {"message", "Please provide at least one URL."}});
            return;
        }

        try {
            auto crawl = engine_.crawlAndIndex(request.url, request.url2);
            if (crawl.pages.empty()) {
                reply(res, 400, json{
                    {"success", false},
                    {"message", "No pages found, possibly blocked by robots.txt."},
                    {"blocked", crawl.blocked}
                });
                return;
            }
            std::string message = "Crawled " + std::to_string(crawl.pages.size()) + " pages successfully.";
            if (!crawl.blocked.empty()) {
                message += " " + std::to_string(crawl.blocked.size()) + " URLs blocked by robots.txt.";
            }
            reply(res, 200, json{
                {"success", true},
                {"pages", crawl.pages.size()},
                {"blocked", crawl.blocked},
                {"message", message}
            });
        } catch (const std::exception& e) {
            std::cerr << "Server: crawl failed: " << e.what() << "\n";
            reply(res, 500, json{{"success", false}, {"message", std::string("Internal crawl error: ") + e.what()}});
        }
    });

    // --- SEARCH ---
    server_.Post("/api/search", [this, parseBody, reply](const httplib::Request& req, httplib::Response& res) {
        konduit::QueryRequest request;
        try {
            request = parseBody(req).get<konduit::QueryRequest>();
        } catch (const json::exception& e) {
            reply(res, 400, json{{"success", false}, {"message", std::string("Invalid JSON: ") + e.what()}});
            return;
        }
        if (request.query.empty()) {
            reply(res, 400, json{{"success", false}, {"message", "Query is required."}});
            return;
        }

        try {
            json out = engine_.answer(request);
            reply(res, 200, out);
        } catch (const std::exception& e) {
            std::cerr << "Server: search failed: " << e.what() << "\n";
            reply(res, 500, json{{"success", false}, {"message", std::string("Internal search error: ") + e.what()}});
        }
    });
}
