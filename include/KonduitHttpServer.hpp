#pragma once

#include <string>
#include <chrono>
#include "httplib.h"
#include "Konduit.hpp"
#include <nlohmann/json.hpp>

class KonduitHttpServer {
public:
    explicit KonduitHttpServer(konduit::Config config);
    void run();

private:
    void setupRoutes();

    std::string host_;
    int port_;
    httplib::Server server_;
    konduit::Konduit engine_;
    std::chrono::steady_clock::time_point startTime_;
};
