#include "KonduitHttpServer.hpp"
#include <iostream>

int main() {
    try {
        auto config = konduit::Config::fromEnvironment();
        KonduitHttpServer app(config);
        std::cout << "Starting server...\n";
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "Fatal unknown error\n";
        return 1;
    }
    return 0;
}
