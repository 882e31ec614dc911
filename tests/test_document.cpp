#include <catch2/catch_all.hpp>
#include <future>
#include "TestContext.hpp"
#include "core/DocumentLoader.hpp"
#include "parser/DocumentParser.hpp"

using namespace OwStats;
using namespace OwStats::Testing;

TEST_CASE("DocumentParser exposes title, text and attributes") {
    DocumentParser parser;
    auto doc = parser.Parse(
        "<html><head><title>Foo - Profile</title></head><body>"
        "<div class=\"stat\">Wins: 12</div><div class=\"stat other\">Losses: 3</div>"
        "<a href=\"/a\">A</a><a>no href</a><a href=\"/b\">B</a>"
        "</body></html>");
    REQUIRE(doc);
    CHECK(doc->Title() == "Foo - Profile");

    auto stats = doc->TextByClassName("stat");
    REQUIRE(stats.size() == 2);
    CHECK(stats[0] == "Wins: 12");
    CHECK(stats[1] == "Losses: 3");

    auto links = doc->AttributeValues("a", "href");
    REQUIRE(links.size() == 2);
    CHECK(links[0] == "/a");
    CHECK(links[1] == "/b");
    CHECK(doc->TextByTagName("a").size() == 3);
}

TEST_CASE("DocumentParser accepts malformed markup") {
    DocumentParser parser;
    auto doc = parser.Parse("<div><p>unclosed <b>bold</div><span>tail");
    REQUIRE(doc);
    auto paragraphs = doc->TextByTagName("p");
    REQUIRE(paragraphs.size() == 1);
    CHECK(paragraphs[0] == "unclosed bold");
    CHECK(doc->TextByTagName("span") == std::vector<std::string>{"tail"});
    CHECK(doc->Title().empty());
}

TEST_CASE("DocumentLoader parses the fetched body") {
    TestContext t;
    t.transport.Respond("https://x.test/doc", 200, "<title>Loaded</title>");
    DocumentLoader loader(t.ctx);

    auto doc = loader.Load("https://x.test/doc", std::chrono::seconds(60));
    REQUIRE(doc);
    CHECK(doc->Title() == "Loaded");

    // Cache hit is parsed again into a separate document.
    auto again = loader.Load("https://x.test/doc", std::chrono::seconds(60));
    REQUIRE(again);
    CHECK(again.get() != doc.get());
    CHECK(again->Title() == "Loaded");
    CHECK(t.transport.CountRequests("https://x.test/doc") == 1);
}

TEST_CASE("DocumentLoader returns null when the fetch fails") {
    TestContext t;
    DocumentLoader loader(t.ctx);
    CHECK(loader.Load("https://x.test/nothing", std::chrono::seconds(60)) == nullptr);
}

TEST_CASE("Concurrent loads get the document for their own body") {
    TestContext t;
    for (int i = 0; i < 8; ++i) {
        t.transport.Respond("https://x.test/p" + std::to_string(i), 200,
                            "<title>page " + std::to_string(i) + "</title>");
    }

    std::vector<std::future<std::string>> titles;
    for (int i = 0; i < 8; ++i) {
        titles.push_back(std::async(std::launch::async, [&t, i] {
            DocumentLoader loader(t.ctx);
            auto doc = loader.Load("https://x.test/p" + std::to_string(i), std::chrono::seconds(60));
            return doc ? doc->Title() : std::string();
        }));
    }
    for (int i = 0; i < 8; ++i) {
        CHECK(titles[i].get() == "page " + std::to_string(i));
    }
}
