#include "Konduit.hpp"
#include "TestSupport.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace konduit;

namespace fs = std::filesystem;

static const std::string kSolar =
    "Our solar panel range delivers outstanding efficiency in every season of the year";
static const std::string kGarden =
    "The garden centre sells flowering plants, seeds and tools for every kind of gardener";

static Config testConfig(const fs::path& root) {
    Config c;
    c.dataDir = (root / "data").string();
    c.logDir = (root / "logs").string();
    c.crawlDelayMs = 0;
    c.fallbackBase = "https://ref.test/wiki/";
    c.fallbackSeed = "https://ref.test/wiki/Main_Page";
    return c;
}

static void testConfigFromEnvironment() {
    setenv("KONDUIT_MAX_PAGES", "7", 1);
    setenv("KONDUIT_TOP_K", "abc", 1);
    setenv("KONDUIT_HYBRID_WEIGHT", "1.5", 1);
    setenv("KONDUIT_ROBOTS_CACHE", "1", 1);
    auto c = Config::fromEnvironment();
    unsetenv("KONDUIT_MAX_PAGES");
    unsetenv("KONDUIT_TOP_K");
    unsetenv("KONDUIT_HYBRID_WEIGHT");
    unsetenv("KONDUIT_ROBOTS_CACHE");

    expect(c.maxPages == 7, "max pages from environment");
    expect(c.topK == 7, "invalid value keeps default");
    expect(c.hybridWeight == 1.0, "weight clamped to [0, 1]");
    expect(c.cacheRobots, "flag parsed");
    auto j = c.toJson();
    expect(j["max_pages"] == 7 && j["min_score"] == 0.15, "config json");

    setenv("KONDUIT_MAX_PAGES", "-5", 1);
    setenv("KONDUIT_TOP_K", " -2", 1);
    auto negative = Config::fromEnvironment();
    unsetenv("KONDUIT_MAX_PAGES");
    unsetenv("KONDUIT_TOP_K");
    expect(negative.maxPages == 1, "negative page cap clamped to the minimum");
    expect(negative.topK == 1, "negative top k clamped to the minimum");

    Config defaults;
    expect(defaults.maxPages == 50 && defaults.maxDepth == 2 && defaults.crawlDelayMs == 200, "crawl defaults");
    expect(defaults.topK == 7 && defaults.hybridWeight == 0.7 && defaults.minScore == 0.15, "retrieval defaults");
}

static void testQueryRequestFromJson() {
    auto request = nlohmann::json{
        {"query", "  solar panels  "}, {"url", " https://solar.test "}, {"smart", true}
    }.get<QueryRequest>();
    expect(request.query == "solar panels" && request.url == "https://solar.test", "request strings trimmed");
    expect(request.url2.empty() && request.smart, "missing keys keep defaults");

    bool threw = false;
    try {
        nlohmann::json{{"url", 5}}.get<QueryRequest>();
    } catch (const nlohmann::json::type_error&) {
        threw = true;
    }
    expect(threw, "non-string url rejected as invalid JSON");

    threw = false;
    try {
        nlohmann::json::array({"https://solar.test"}).get<QueryRequest>();
    } catch (const nlohmann::json::type_error&) {
        threw = true;
    }
    expect(threw, "non-object body rejected as invalid JSON");
}

static void testAnswer(const fs::path& root) {
    auto client = std::make_shared<FakeHttpClient>();
    client->page("https://solar.test/", htmlPage({kSolar}));
    Konduit engine(testConfig(root), client);

    QueryRequest request;
    request.query = "solar panel efficiency";
    request.url = "https://solar.test";
    auto response = engine.answer(request);
    expect(response.success, "answer succeeds");
    expect(!response.results.empty() && response.results.size() <= 7, "results bounded by top k");
    expect(response.results[0].url == "https://solar.test/", "result from crawled page");
    expect(response.results[0].rerankScore.has_value(), "reranked");
    expect(!response.summary.has_value(), "no summary without smart mode");
    expect(response.blocked.empty(), "nothing blocked");
    expect(!response.degraded, "local capabilities");

    request.smart = true;
    auto smart = engine.answer(request);
    expect(smart.summary.has_value() && smart.summary->find("solar panel") != std::string::npos, "smart summary");

    auto j = nlohmann::json(response);
    expect(j["success"] == true && j["summary"].is_null(), "response json");
    expect(j["results"][0].contains("rerank_score") && j["results"][0].contains("final_score"), "result json keys");

    QueryRequest empty;
    auto invalid = engine.answer(empty);
    expect(!invalid.success && invalid.message == "Query is required.", "empty query rejected");

    auto status = engine.indexStatus();
    expect(status["built"] == true && status["generation"] == 2, "index rebuilt per query");
    expect(status["query_cache"] == 1, "query vector cached across requests");
}

static void testBlockedSiteUsesFallbackSeed(const fs::path& root) {
    auto client = std::make_shared<FakeHttpClient>();
    client->robots("https://closed.test", "User-agent: *\nDisallow: /\n");
    client->page("https://closed.test/", htmlPage({kSolar}));
    client->page("https://ref.test/wiki/Main_Page", htmlPage({
        "Solar panel efficiency measures how much sunlight a module converts into power"}));
    Konduit engine(testConfig(root), client);

    QueryRequest request;
    request.query = "solar panel efficiency";
    request.url = "https://closed.test/";
    auto response = engine.answer(request);
    expect(response.success, "fallback answer succeeds");
    expect(response.blocked.size() == 1 && response.blocked[0] == "https://closed.test/", "blocked url reported");
    expect(!response.results.empty() && response.results[0].url == "https://ref.test/wiki/Main_Page", "fallback seed indexed");
    expect(client->getCount("https://closed.test/") == 0, "blocked page never fetched");

    std::ifstream log(fs::path(testConfig(root).logDir) / "robots_log.txt");
    std::string text((std::istreambuf_iterator<char>(log)), std::istreambuf_iterator<char>());
    expect(text.find("[BLOCKED] https://closed.test/") != std::string::npos, "audit log records block");
}

static void testNothingFound(const fs::path& root) {
    auto client = std::make_shared<FakeHttpClient>();
    client->robots("https://closed.test", "User-agent: *\nDisallow: /\n");
    Konduit engine(testConfig(root), client);

    QueryRequest request;
    request.query = "solar";
    request.url = "https://closed.test/";
    auto response = engine.answer(request);
    expect(response.success, "total failure is still a success response");
    expect(response.summary && *response.summary == Konduit::kNothingFound, "nothing found marker");
    expect(response.results.empty(), "no results");
    expect(response.blocked.size() == 1, "blocked urls still reported");
    expect(!engine.index().built(), "index left unbuilt");

    bool threw = false;
    try {
        engine.search("solar", 5);
    } catch (const IndexNotBuilt&) {
        threw = true;
    }
    expect(threw, "direct search on unbuilt index raises");
}

static void testCrawlAndIndex(const fs::path& root) {
    auto client = std::make_shared<FakeHttpClient>();
    client->page("https://solar.test/", htmlPage({kSolar}));
    client->page("https://garden.test/", htmlPage({kGarden}));
    Konduit engine(testConfig(root), client);

    auto both = engine.crawlSites({"https://solar.test", "", "https://garden.test"}, "");
    expect(both.pages.size() == 2, "both seeds crawled");
    expect(both.pages[0].url == "https://solar.test/" && both.pages[1].url == "https://garden.test/", "seed order kept");
    expect(both.artifacts.size() == 2, "one artifact per seed");

    std::shared_future<retrieval::BuildReport> build;
    auto crawl = engine.crawlAndIndex("https://solar.test", "https://garden.test", &build);
    expect(crawl.pages.size() == 2, "crawl and index collects pages");
    expect(build.valid(), "build future returned");
    auto report = build.get();
    expect(report.built && report.chunks == 2, "background build completes");

    auto status = engine.indexStatus();
    expect(status["build_pending"] == false, "build no longer pending");
    expect(status["last_build"]["built"] == true, "last build recorded");
    expect(fs::exists(fs::path(testConfig(root).dataDir) / "embeddings.json"), "index artifact persisted");

    auto results = engine.search("flowering plants", 3);
    expect(!results.empty() && results[0].url == "https://garden.test/", "search after background build");

    std::shared_future<retrieval::BuildReport> none;
    auto nothing = engine.crawlAndIndex("https://missing.test", "", &none);
    expect(nothing.pages.empty() && !none.valid(), "no build without pages");
}

int main() {
    const fs::path root = fs::temp_directory_path() / "konduit_facade_tests";
    fs::remove_all(root);

    testConfigFromEnvironment();
    testQueryRequestFromJson();
    testAnswer(root / "answer");
    testBlockedSiteUsesFallbackSeed(root / "fallback");
    testNothingFound(root / "nothing");
    testCrawlAndIndex(root / "index");

    fs::remove_all(root);
    std::cout << "All facade tests passed." << std::endl;
    return 0;
}
