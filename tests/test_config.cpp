#include <catch2/catch_all.hpp>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "../config/Config.hpp"

using namespace OwStats;

namespace {

std::filesystem::path TempConfigPath(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "ow_stats_tests";
    std::filesystem::create_directories(dir);
    auto path = dir / name;
    std::filesystem::remove(path);
    return path;
}

} // anonymous namespace

TEST_CASE("Config defaults match the live sites") {
    Config c;
    CHECK(c.blizzard_base_url == "https://playoverwatch.com/en-gb/");
    CHECK(c.mo_base_url == "https://masteroverwatch.com/");
    CHECK(c.default_cache_ttl_seconds == 300);
}

TEST_CASE("Config load applies values and writes missing keys back") {
    auto path = TempConfigPath("partial.json");
    {
        std::ofstream o(path);
        o << R"({"mo_base_url":"https://mirror.test/","profile_cache_ttl_seconds":60,"custom":true})";
    }

    Config c;
    c.Load(path.string());
    CHECK(c.mo_base_url == "https://mirror.test/");
    CHECK(c.profile_cache_ttl_seconds == 60);
    CHECK(c.career_cache_ttl_seconds == 300);

    std::ifstream in(path);
    auto written = nlohmann::json::parse(in);
    CHECK(written.contains("career_cache_ttl_seconds"));
    CHECK(written.contains("http_user_agent"));
    CHECK(written["custom"] == true);
    CHECK(written["mo_base_url"] == "https://mirror.test/");
}

TEST_CASE("Config load rejects bad input") {
    Config c;
    CHECK_THROWS_AS(c.Load(TempConfigPath("absent.json").string()), std::runtime_error);

    auto bad = TempConfigPath("bad.json");
    {
        std::ofstream o(bad);
        o << "{ not json";
    }
    CHECK_THROWS_AS(c.Load(bad.string()), nlohmann::json::parse_error);

    auto negative = TempConfigPath("negative.json");
    {
        std::ofstream o(negative);
        o << R"({"career_cache_ttl_seconds":-1})";
    }
    CHECK_THROWS_AS(c.Load(negative.string()), std::runtime_error);
}

TEST_CASE("CreateDefault writes a loadable file") {
    auto path = TempConfigPath("nested/default.json");
    std::filesystem::remove_all(path.parent_path());

    Config::GetInstance().CreateDefault(path.string());
    Config c;
    c.Load(path.string());
    CHECK(c.http_user_agent == "OWAPI Scraper/1.0.0");
}
