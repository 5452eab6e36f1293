#include "TestSupport.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <iterator>
#include <set>
#include <nlohmann/json.hpp>
#include "konduit/ArtifactStore.hpp"
#include "konduit/AuditLog.hpp"
#include "konduit/crawler/ContentExtractor.hpp"
#include "konduit/crawler/Crawler.hpp"
#include "konduit/crawler/Fetcher.hpp"
#include "konduit/crawler/PolicyGate.hpp"
#include "konduit/net/Url.hpp"

using namespace konduit;
using namespace konduit::crawler;

namespace fs = std::filesystem;

static const std::string kOrigin = "https://example.com";

static const std::string kFiller =
    "This paragraph describes the example company and the many products it builds for customers";

static CrawlOptions quickOptions(size_t maxPages, int maxDepth, const std::string& query = "") {
    CrawlOptions o;
    o.maxPages = maxPages;
    o.maxDepth = maxDepth;
    o.query = query;
    o.politeDelay = std::chrono::milliseconds(0);
    return o;
}

static std::string readFile(const fs::path& p) {
    std::ifstream in(p);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static void testUrls() {
    auto u = net::parseUrl("HTTPS://Example.COM:8443/a/b?x=1#frag");
    expect(u.has_value(), "url should parse");
    expect(u->scheme == "https" && u->host == "example.com" && u->port == 8443, "scheme/host/port");
    expect(u->path == "/a/b" && u->query == "x=1", "path and query");
    expect(u->origin() == "https://example.com:8443", "origin keeps port");
    expect(net::parseUrl("https://example.com")->toString() == "https://example.com/", "empty path becomes /");
    expect(!net::parseUrl("mailto:someone@example.com"), "non-hierarchical urls rejected");

    const std::string base = "https://example.com/docs/guide/intro.html";
    expect(net::resolveUrl(base, "setup.html") == "https://example.com/docs/guide/setup.html", "relative path");
    expect(net::resolveUrl(base, "../api/") == "https://example.com/docs/api/", "dot segments");
    expect(net::resolveUrl(base, "/about") == "https://example.com/about", "absolute path");
    expect(net::resolveUrl(base, "//cdn.example.com/lib.js") == "https://cdn.example.com/lib.js", "scheme relative");
    expect(net::resolveUrl(base, "?page=2") == "https://example.com/docs/guide/intro.html?page=2", "query only");
    expect(net::resolveUrl(base, "#section") == "https://example.com/docs/guide/intro.html", "fragment only");
    expect(net::resolveUrl(base, "http://other.org/x#y") == "http://other.org/x", "absolute drops fragment");

    expect(net::hostMatches("example.com", "example.com"), "same host");
    expect(net::hostMatches("docs.example.com", "example.com"), "subdomain");
    expect(!net::hostMatches("badexample.com", "example.com"), "suffix without dot is foreign");
    expect(!net::hostMatches("example.com.evil.org", "example.com"), "prefix is foreign");
}

static void testRobotsRules() {
    auto rules = RobotsRules::parse(
        "# comment\n"
        "User-agent: googlebot\n"
        "Disallow: /\n"
        "\n"
        "User-agent: *\n"
        "Disallow: /private\n"
        "Allow: /private/public\n"
        "Disallow: /*.pdf$\n"
        "Disallow:\n");
    expect(rules.rules().size() == 3, "only wildcard group kept, empty disallow ignored");
    expect(rules.allows("/"), "root allowed");
    expect(!rules.allows("/private/data"), "private disallowed");
    expect(rules.allows("/private/public/page"), "longer allow wins");
    expect(!rules.allows("/files/report.pdf"), "anchored wildcard");
    expect(rules.allows("/files/report.pdf?download=1"), "anchor requires end of path");

    auto tie = RobotsRules::parse("User-agent: *\nDisallow: /page\nAllow: /page\n");
    expect(tie.allows("/page"), "allow wins ties");

    expect(!RobotsRules::denyAll().allows("/"), "deny all");
    expect(RobotsRules::allowAll().allows("/anything"), "allow all");
    expect(matchRobotsPattern("/a*b", "/a/x/b/c"), "star matches any run");
    expect(!matchRobotsPattern("/a*b$", "/a/x/b/c"), "anchored star");
}

static void testPolicyGate(const fs::path& logDir) {
    FakeHttpClient client;
    AuditLog audit(logDir.string());

    client.robots("https://allowed.test", "User-agent: *\nDisallow: /secret\n");
    client.respond("https://forbidden.test/robots.txt", 403, "text/plain", "");
    client.respond("https://broken.test/robots.txt", 503, "text/plain", "");
    client.fail("https://offline.test/robots.txt");

    PolicyGate gate(client, &audit);
    expect(gate.decide("https://allowed.test/page") == PolicyDecision::Allowed, "allowed page");
    expect(gate.decide("https://allowed.test/secret/x") == PolicyDecision::Blocked, "blocked page");
    expect(gate.decide("https://missing.test/page") == PolicyDecision::Allowed, "404 robots allows");
    expect(gate.decide("https://forbidden.test/") == PolicyDecision::Blocked, "403 robots denies");
    expect(gate.decide("https://broken.test/") == PolicyDecision::Unreadable, "5xx robots fails closed");
    expect(gate.decide("https://offline.test/") == PolicyDecision::Unreadable, "transport failure fails closed");
    expect(!gate.allowed("https://offline.test/other"), "unreadable is denied");
    expect(client.getCount("https://allowed.test/robots.txt") == 2, "no cache: robots fetched per url");

    std::string log = readFile(audit.path());
    expect(log.find("[ALLOWED] https://allowed.test/page") != std::string::npos, "allowed logged");
    expect(log.find("[BLOCKED] https://allowed.test/secret/x") != std::string::npos, "blocked logged");
    expect(log.find("[FAILED TO READ robots.txt] https://broken.test/") != std::string::npos, "unreadable logged");

    FakeHttpClient cachedClient;
    cachedClient.robots("https://cached.test", "User-agent: *\nDisallow: /no\n");
    cachedClient.fail("https://flaky.test/robots.txt");
    PolicyGate cached(cachedClient, nullptr, std::chrono::seconds(10), true);
    expect(cached.allowed("https://cached.test/a"), "cached gate allows");
    expect(!cached.allowed("https://cached.test/no/b"), "cached gate blocks");
    expect(cachedClient.getCount("https://cached.test/robots.txt") == 1, "robots fetched once per origin");
    expect(!cached.allowed("https://flaky.test/a") && !cached.allowed("https://flaky.test/b"), "flaky denied");
    expect(cachedClient.getCount("https://flaky.test/robots.txt") == 2, "unreadable outcomes are not cached");
}

static void testFetcher() {
    FakeHttpClient client;
    client.page("https://example.com/ok", "<p>hello</p>");
    client.respond("https://example.com/json", 200, "application/json", "{}");
    client.respond("https://example.com/err", 500, "text/html", "<p>oops</p>");
    client.fail("https://example.com/down");

    Fetcher fetcher(client);
    auto body = fetcher.fetch("https://example.com/ok");
    expect(body && *body == "<p>hello</p>", "html page fetched");
    auto headers = client.lastHeaders();
    const auto& agents = userAgentPool();
    expect(std::find(agents.begin(), agents.end(), headers["User-Agent"]) != agents.end(), "user agent from pool");
    expect(!headers["Accept-Language"].empty(), "accept-language set");

    expect(!fetcher.fetch("https://example.com/json"), "non-html skipped");
    expect(!fetcher.fetch("https://example.com/err"), "error status skipped");
    expect(!fetcher.fetch("https://example.com/down"), "transport failure skipped");
    expect(fetcher.gate().inFlight() == 0, "permits released");
    expect(fetcher.gate().capacity() == 5, "default gate capacity");

    ConcurrencyGate gate(2);
    {
        ConcurrencyGate::Permit a(gate);
        ConcurrencyGate::Permit b(gate);
        expect(gate.inFlight() == 2, "two permits held");
    }
    expect(gate.inFlight() == 0, "permits returned");
}

static void testExtractor() {
    std::string html = htmlPage({kFiller, "Too short to keep", "Second paragraph explains how the widgets are assembled by hand"},
                                {"/about#team", "contact.html", "https://blog.example.com/post", "https://other.org/page",
                                 "mailto:info@example.com"});
    std::string text = ContentExtractor::extract(html);
    expect(text.find("example company") != std::string::npos, "paragraph kept");
    expect(text.find("widgets are assembled") != std::string::npos, "second paragraph kept");
    expect(text.find("Too short") == std::string::npos, "short element dropped");
    expect(text.find("tracking") == std::string::npos, "script removed");
    expect(text.find("Careers") == std::string::npos, "nav removed");
    expect(text.find("rights reserved") == std::string::npos, "footer removed");

    auto links = ContentExtractor::links(html, "https://example.com/dir/index.html", "example.com");
    expect(links.count("https://example.com/about"), "fragment stripped from link");
    expect(links.count("https://example.com/dir/contact.html"), "relative link resolved");
    expect(links.count("https://blog.example.com/post"), "subdomain link kept");
    expect(!links.count("https://other.org/page"), "foreign link dropped");
    expect(links.size() == 3, "mailto ignored");

    expect(ContentExtractor::extract("").empty(), "empty html gives empty text");
    std::string articleOnly = "<html><body><div>Sidebar words that are outside of the article body here</div>"
                              "<article><p>" + kFiller + "</p></article></body></html>";
    std::string articleText = ContentExtractor::extract(articleOnly);
    expect(articleText.find("Sidebar") == std::string::npos, "article preferred over body");
    std::string copyright = "<html><body><p>\xC2\xA9 2024 Example Corporation all rights reserved forever</p></body></html>";
    expect(ContentExtractor::extract(copyright).empty(), "copyright lines dropped");
}

static void testRanking() {
    const std::string text =
        "The sun rises over the quiet hills every single morning. "
        "Solar panel efficiency depends on the angle of the panel and the temperature. "
        "Short one. "
        "Batteries store the energy produced by each solar installation overnight";
    expect(rankTextByQuery(text, "") == text, "empty query leaves text unchanged");

    std::string ranked = rankTextByQuery(text, "solar panel efficiency");
    expect(ranked.rfind("Solar panel efficiency", 0) == 0, "best overlap first");
    expect(ranked.find("Short one") == std::string::npos, "short segments dropped");
    expect(ranked.find("quiet hills") != std::string::npos, "non matching long segments kept");

    std::string many;
    for (int i = 0; i < 10; ++i) many += "segment number " + std::to_string(i) + " has quite a few words inside. ";
    std::string capped = rankTextByQuery(many, "nothing");
    size_t segments = 1;
    for (size_t pos = capped.find(". "); pos != std::string::npos; pos = capped.find(". ", pos + 2)) ++segments;
    expect(segments == 6, "at most six segments kept");
    expect(capped.rfind("segment number 0", 0) == 0, "ties keep document order");

    expect(relevanceHits("Solar power and solar panels", "solar solar panel") == 2, "distinct terms counted once");
    expect(relevanceHits("nothing here", "solar") == 0, "no hits");
    expect(brandFallbackUrl("www.example.com", "https://en.wikipedia.org/wiki/") == "https://en.wikipedia.org/wiki/Example",
           "brand fallback url");
    expect(brandFallbackUrl("SHOP.Acme.co.uk:8080", "https://ref.test/") == "https://ref.test/Shop", "first label capitalized");
}

static void testSinglePageCrawl(const fs::path& dataDir) {
    FakeHttpClient client;
    client.page(kOrigin + "/", htmlPage({kFiller}));
    ArtifactStore store(dataDir.string());
    Crawler crawler(client, nullptr, &store);

    auto result = crawler.crawl(kOrigin, quickOptions(1, 0));
    expect(result.pages.size() == 1, "single page crawled");
    expect(result.pages[0].url == kOrigin + "/", "page url");
    expect(!result.pages[0].content.empty(), "page content non-empty");
    expect(result.blocked.empty(), "nothing blocked");
    expect(!result.fallbackAttempted, "no fallback");

    expect(!result.artifactPath.empty() && fs::exists(result.artifactPath), "crawl artifact written");
    expect(fs::path(result.artifactPath).filename().string().rfind("crawled_example.com_", 0) == 0, "artifact name");
    auto doc = nlohmann::json::parse(readFile(result.artifactPath));
    expect(doc.is_array() && doc.size() == 1 && doc[0]["url"] == kOrigin + "/", "artifact content");
}

static void testSameDomainArtifacts(const fs::path& dataDir) {
    ArtifactStore store(dataDir.string());
    std::vector<Page> first = {{kOrigin + "/one", "first crawl"}};
    std::vector<Page> second = {{kOrigin + "/two", "second crawl"}};

    auto a = std::async(std::launch::async, [&]() { return store.writeCrawl("example.com", first); });
    auto b = std::async(std::launch::async, [&]() { return store.writeCrawl("example.com", second); });
    std::string pathA = a.get();
    std::string pathB = b.get();
    expect(!pathA.empty() && !pathB.empty(), "both crawl artifacts written");
    expect(pathA != pathB, "concurrent crawls of one domain get distinct files");

    auto docA = nlohmann::json::parse(readFile(pathA));
    auto docB = nlohmann::json::parse(readFile(pathB));
    expect(docA.size() == 1 && docA[0]["url"] == kOrigin + "/one", "first artifact intact");
    expect(docB.size() == 1 && docB[0]["url"] == kOrigin + "/two", "second artifact intact");
}

static void testDisallowedSite() {
    FakeHttpClient client;
    client.robots(kOrigin, "User-agent: *\nDisallow: /\n");
    client.page(kOrigin + "/", htmlPage({kFiller}));
    Crawler crawler(client, nullptr, nullptr);

    auto result = crawler.crawl(kOrigin + "/", quickOptions(10, 2));
    expect(result.pages.empty(), "disallowed site yields no pages");
    expect(result.blocked.size() == 1 && result.blocked[0] == kOrigin + "/", "seed recorded as blocked");
    expect(result.fallbackAttempted, "fallback attempted");
    expect(client.getCount("https://en.wikipedia.org/wiki/Example") == 1, "fallback page requested");
    expect(client.getCount(kOrigin + "/") == 0, "blocked page never fetched");
}

static void testFallbackPage() {
    FakeHttpClient client;
    client.fail(kOrigin + "/");
    client.page("https://ref.test/wiki/Example", htmlPage({kFiller}));
    Crawler crawler(client, nullptr, nullptr);

    auto opts = quickOptions(5, 1);
    opts.fallbackBase = "https://ref.test/wiki/";
    auto result = crawler.crawl("https://www.example.com/", opts);
    expect(result.fallbackAttempted, "fallback attempted after failed fetch");
    expect(result.pages.size() == 1 && result.pages[0].url == "https://ref.test/wiki/Example", "fallback page included");
}

static void testBounds() {
    FakeHttpClient client;
    client.page(kOrigin + "/", htmlPage({kFiller},
        {"/a", "/b", "/c", "/d", "https://other.org/x", "https://blog.example.com/post"}));
    for (const char* p : {"/a", "/b", "/c", "/d"}) client.page(kOrigin + p, htmlPage({kFiller}, {"/"}));
    client.page("https://blog.example.com/post", htmlPage({kFiller}));
    client.page("https://other.org/x", htmlPage({kFiller}));
    Crawler crawler(client, nullptr, nullptr);

    auto result = crawler.crawl(kOrigin, quickOptions(3, 2));
    expect(result.pages.size() == 3, "page cap reached");
    for (const auto& page : result.pages) {
        auto u = net::parseUrl(page.url);
        expect(u && net::hostMatches(u->host, "example.com"), "page stays in domain: " + page.url);
    }
    expect(client.getCount("https://other.org/x") == 0, "foreign link never fetched");

    FakeHttpClient chain;
    chain.page(kOrigin + "/", htmlPage({kFiller}, {"/d1"}));
    chain.page(kOrigin + "/d1", htmlPage({kFiller}, {"/d2"}));
    chain.page(kOrigin + "/d2", htmlPage({kFiller}, {"/d3"}));
    Crawler chainCrawler(chain, nullptr, nullptr);
    auto shallow = chainCrawler.crawl(kOrigin, quickOptions(10, 1));
    expect(shallow.pages.size() == 2, "depth cap stops expansion");
    expect(chain.getCount(kOrigin + "/d2") == 0, "page beyond max depth never fetched");

    auto rootOnly = chainCrawler.crawl(kOrigin, quickOptions(10, 0));
    expect(rootOnly.pages.size() == 1, "depth 0 crawls the seed only");

    // Links are queued only while the queue is below maxPages, so failures
    // among the first links do not let later links in.
    FakeHttpClient wide;
    wide.page(kOrigin + "/", htmlPage({kFiller}, {"/l1", "/l2", "/l3", "/l4", "/l5", "/l6"}));
    wide.fail(kOrigin + "/l1");
    wide.fail(kOrigin + "/l2");
    wide.respond(kOrigin + "/l3", 200, "application/pdf", "%PDF");
    for (const char* p : {"/l4", "/l5", "/l6"}) wide.page(kOrigin + p, htmlPage({kFiller}));
    Crawler wideCrawler(wide, nullptr, nullptr);
    auto bounded = wideCrawler.crawl(kOrigin, quickOptions(3, 2));
    expect(bounded.pages.size() == 1, "only the seed yields content");
    expect(bounded.visited == 4, "seed plus the three queued links visited");
    for (const char* p : {"/l1", "/l2", "/l3"}) {
        expect(wide.getCount(kOrigin + p) == 1, std::string("queued link fetched: ") + p);
    }
    for (const char* p : {"/l4", "/l5", "/l6"}) {
        expect(wide.getCount(kOrigin + p) == 0, std::string("link past the queue bound never fetched: ") + p);
    }
}

static void testUniqueVisits() {
    FakeHttpClient client;
    client.page(kOrigin + "/", htmlPage({kFiller}, {"/a", "/b", "/"}));
    client.page(kOrigin + "/a", htmlPage({kFiller}, {"/b", "/", "/a#top"}));
    client.page(kOrigin + "/b", htmlPage({kFiller}, {"/a", "/"}));
    Crawler crawler(client, nullptr, nullptr);

    auto result = crawler.crawl(kOrigin, quickOptions(20, 3));
    std::set<std::string> urls;
    for (const auto& p : result.pages) urls.insert(p.url);
    expect(urls.size() == result.pages.size(), "no page collected twice");
    expect(result.pages.size() == 3, "all pages of the cycle collected");
    for (const char* p : {"/", "/a", "/b"}) {
        expect(client.getCount(kOrigin + p) == 1, std::string("fetched once: ") + p);
    }
    expect(result.visited == 3, "visited set size");
}

static void testEarlyExit() {
    FakeHttpClient client;
    client.page(kOrigin + "/", htmlPage({
        "Our solar panel range delivers outstanding efficiency in every season of the year"
    }, {"/a", "/b"}));
    client.page(kOrigin + "/a", htmlPage({kFiller}));
    client.page(kOrigin + "/b", htmlPage({kFiller}));
    Crawler crawler(client, nullptr, nullptr);

    auto result = crawler.crawl(kOrigin, quickOptions(50, 2, "solar panel pricing"));
    expect(result.earlyExit, "early exit triggered");
    expect(result.pages.size() == 1, "crawl stopped after the relevant page");
    expect(client.getCount(kOrigin + "/a") == 0, "remaining queue abandoned");

    auto single = crawler.crawl(kOrigin, quickOptions(50, 2, "solar pricing"));
    expect(!single.earlyExit && single.pages.size() == 3, "one hit does not stop the crawl");
}

static void testFailedFetchesMarkedVisited() {
    FakeHttpClient client;
    client.page(kOrigin + "/", htmlPage({kFiller}, {"/broken", "/json"}));
    client.fail(kOrigin + "/broken");
    client.respond(kOrigin + "/json", 200, "application/json", "{}");
    Crawler crawler(client, nullptr, nullptr);

    auto result = crawler.crawl(kOrigin, quickOptions(10, 2));
    expect(result.pages.size() == 1, "failed fetches are skipped");
    expect(result.visited == 3, "failed fetches still count as visited");
    expect(result.blocked.empty(), "fetch failures are not policy blocks");
}

int main() {
    const fs::path root = fs::temp_directory_path() / "konduit_crawler_tests";
    fs::remove_all(root);
    fs::create_directories(root);

    testUrls();
    testRobotsRules();
    testPolicyGate(root / "logs");
    testFetcher();
    testExtractor();
    testRanking();
    testSinglePageCrawl(root / "data");
    testSameDomainArtifacts(root / "artifacts");
    testDisallowedSite();
    testFallbackPage();
    testBounds();
    testUniqueVisits();
    testEarlyExit();
    testFailedFetchesMarkedVisited();

    fs::remove_all(root);
    std::cout << "All crawler tests passed." << std::endl;
    return 0;
}
