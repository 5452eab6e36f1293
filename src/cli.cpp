#include "Konduit.hpp"

#include <iomanip>
#include <iostream>
#include "konduit/Analyzer.hpp"

namespace {

std::string prompt(const std::string& text) {
    std::cout << text << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) return "exit";
    return konduit::Analyzer::trim(line);
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto config = konduit::Config::fromEnvironment();
        konduit::Konduit engine(config);

        std::string startUrl = argc > 1 ? argv[1] : prompt("Enter website URL to crawl: ");
        if (startUrl.empty()) {
            std::cerr << "No URL given.\n";
            return 1;
        }
        if (startUrl.rfind("http", 0) != 0) startUrl = "https://" + startUrl;

        std::cout << "Crawling started from: " << startUrl << "\n";
        auto crawl = engine.crawlSites({startUrl}, "");
        if (crawl.pages.empty()) {
            std::cout << "No pages crawled. Exiting.\n";
            return 1;
        }
        std::cout << "Crawled " << crawl.pages.size() << " pages. Building index...\n";

        auto report = engine.index().build(crawl.pages);
        if (!report.built) {
            std::cout << "Nothing to index: " << report.message << "\n";
            return 1;
        }
        std::cout << "Index built: " << report.message << "\n";

        while (true) {
            std::string query = prompt("\nEnter your search query (or type 'exit'): ");
            if (konduit::Analyzer::toLower(query) == "exit") {
                std::cout << "Exiting.\n";
                break;
            }
            if (query.empty()) continue;

            auto results = engine.search(query, 3);
            if (results.empty()) {
                std::cout << konduit::Konduit::kNothingFound << "\n";
                continue;
            }
            std::cout << "\nTop results:\n" << std::string(60, '=') << "\n";
            for (size_t i = 0; i < results.size(); ++i) {
                const auto& r = results[i];
                std::cout << "\nResult " << (i + 1) << "\n"
                          << "URL: " << r.url << "\n"
                          << "Score: " << std::fixed << std::setprecision(3) << r.finalScore << "\n"
                          << r.content << "\n"
                          << std::string(60, '-') << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
