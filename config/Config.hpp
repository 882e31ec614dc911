#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace OwStats {
    struct Config {
        std::string blizzard_base_url = "https://playoverwatch.com/en-gb/";
        std::string mo_base_url = "https://masteroverwatch.com/";
        int default_cache_ttl_seconds = 300;
        int career_cache_ttl_seconds = 300;
        int profile_cache_ttl_seconds = 300;
        size_t cache_max_size = 1000;
        long http_timeout_ms = 10000;
        long http_max_redirects = 5;
        std::string http_user_agent = "OWAPI Scraper/1.0.0";
        size_t max_body_bytes = 8388608; // 8MB
        int max_concurrency = 0;
        std::string log_level = "info";

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        void Load(const std::string& path);
        void CreateDefault(const std::string& path);
        nlohmann::json ToJson() const;
    };
}
