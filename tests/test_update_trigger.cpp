#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include "TestContext.hpp"
#include "core/UpdateTrigger.hpp"
#include "utils/UrlUtil.hpp"

using namespace OwStats;
using namespace OwStats::Testing;

namespace {
const std::string kUpdateUrl = "https://mo.test/profile/pc/eu/Foo-1234/update";
}

TEST_CASE("Exact not-found message reports NotFound") {
    TestContext t;
    t.transport.Respond(kUpdateUrl, 200,
        R"({"status":"error","message":"We couldn't find a player with that name."})");
    UpdateTrigger trigger(t.ctx);

    CHECK(trigger.TriggerUpdate("Foo#1234", "eu") == UpdateResult::NotFound);
    CHECK_FALSE(LogContains("Updated user"));
}

TEST_CASE("Other error messages count as updated but are logged as warnings") {
    TestContext t;
    t.transport.Respond(kUpdateUrl, 200, R"({"status":"error","message":"rate limited"})");
    UpdateTrigger trigger(t.ctx);

    CHECK(trigger.TriggerUpdate("Foo#1234", "eu") == UpdateResult::Updated);
    CHECK(LogContains("[Warn]"));
    CHECK(LogContains("rate limited"));
}

TEST_CASE("Successful update is logged with the raw payload") {
    TestContext t;
    t.transport.Respond(kUpdateUrl, 200, R"({"status":"ok"})");
    UpdateTrigger trigger(t.ctx);

    CHECK(trigger.TriggerUpdate("Foo#1234", "eu") == UpdateResult::Updated);
    CHECK(LogContains("Updated user `Foo#1234` => `{\"status\":\"ok\"}`"));
}

TEST_CASE("Update log keeps the payload as received") {
    TestContext t;
    t.transport.Respond(kUpdateUrl, 200, R"({"status": "ok", "battletag": "Foo-1234"})");
    UpdateTrigger trigger(t.ctx);

    CHECK(trigger.TriggerUpdate("Foo#1234", "eu") == UpdateResult::Updated);
    CHECK(LogContains(R"(=> `{"status": "ok", "battletag": "Foo-1234"}`)"));
}

TEST_CASE("Near-miss messages and odd payloads count as updated") {
    TestContext t;
    UpdateTrigger trigger(t.ctx);

    SECTION("message differs in punctuation") {
        t.transport.Respond(kUpdateUrl, 200,
            R"({"status":"error","message":"We couldn't find a player with that name"})");
        CHECK(trigger.TriggerUpdate("Foo#1234", "eu") == UpdateResult::Updated);
    }
    SECTION("status missing") {
        t.transport.Respond(kUpdateUrl, 200, R"({"message":"We couldn't find a player with that name."})");
        CHECK(trigger.TriggerUpdate("Foo#1234", "eu") == UpdateResult::Updated);
    }
    SECTION("payload is not an object") {
        t.transport.Respond(kUpdateUrl, 200, R"(["error"])");
        CHECK(trigger.TriggerUpdate("Foo#1234", "eu") == UpdateResult::Updated);
    }
}

TEST_CASE("Update endpoint failures propagate") {
    TestContext t;
    UpdateTrigger trigger(t.ctx);

    SECTION("HTTP failure") {
        t.transport.Respond(kUpdateUrl, 500, "oops");
        CHECK_THROWS_AS(trigger.TriggerUpdate("Foo#1234", "eu"), UpdateError);
    }
    SECTION("transport failure") {
        t.transport.FailWith(kUpdateUrl, "Connection refused");
        CHECK_THROWS_AS(trigger.TriggerUpdate("Foo#1234", "eu"), UpdateError);
    }
    SECTION("body is not JSON") {
        t.transport.Respond(kUpdateUrl, 200, "<html>maintenance</html>");
        CHECK_THROWS_AS(trigger.TriggerUpdate("Foo#1234", "eu"), nlohmann::json::parse_error);
    }
}
