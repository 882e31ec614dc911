#include "Config.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include "../src/utils/Logger.hpp"

namespace OwStats {

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["blizzard_base_url"] = blizzard_base_url;
    data["mo_base_url"] = mo_base_url;
    data["default_cache_ttl_seconds"] = default_cache_ttl_seconds;
    data["career_cache_ttl_seconds"] = career_cache_ttl_seconds;
    data["profile_cache_ttl_seconds"] = profile_cache_ttl_seconds;
    data["cache_max_size"] = cache_max_size;
    data["http_timeout_ms"] = http_timeout_ms;
    data["http_max_redirects"] = http_max_redirects;
    data["http_user_agent"] = http_user_agent;
    data["max_body_bytes"] = max_body_bytes;
    data["max_concurrency"] = max_concurrency;
    data["log_level"] = log_level;
    return data;
}

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data = nlohmann::json::parse(f);
    f.close();

    const Config defaults;
    blizzard_base_url = data.value("blizzard_base_url", defaults.blizzard_base_url);
    mo_base_url = data.value("mo_base_url", defaults.mo_base_url);
    default_cache_ttl_seconds = data.value("default_cache_ttl_seconds", defaults.default_cache_ttl_seconds);
    career_cache_ttl_seconds = data.value("career_cache_ttl_seconds", defaults.career_cache_ttl_seconds);
    profile_cache_ttl_seconds = data.value("profile_cache_ttl_seconds", defaults.profile_cache_ttl_seconds);
    cache_max_size = data.value("cache_max_size", defaults.cache_max_size);
    http_timeout_ms = data.value("http_timeout_ms", defaults.http_timeout_ms);
    http_max_redirects = data.value("http_max_redirects", defaults.http_max_redirects);
    http_user_agent = data.value("http_user_agent", defaults.http_user_agent);
    max_body_bytes = data.value("max_body_bytes", defaults.max_body_bytes);
    max_concurrency = data.value("max_concurrency", defaults.max_concurrency);
    log_level = data.value("log_level", defaults.log_level);

    if (default_cache_ttl_seconds < 0 || career_cache_ttl_seconds < 0 || profile_cache_ttl_seconds < 0) {
        throw std::runtime_error("Cache TTLs in " + path + " must not be negative");
    }

    // Write back missing keys so an existing config.json picks up newly added options.
    // Unknown keys are preserved.
    bool changed = false;
    for (const auto& item : ToJson().items()) {
        if (!data.contains(item.key())) {
            data[item.key()] = item.value();
            changed = true;
        }
    }

    if (changed) {
        std::filesystem::path p(path);
        std::filesystem::path bak = p;
        bak += ".bak";
        std::error_code ec;
        std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            Logger::Log(LogLevel::Warn, "Could not back up " + path + ": " + ec.message());
        }

        std::ofstream o(path, std::ios::trunc);
        if (o.is_open()) {
            o << std::setw(4) << data << std::endl;
        }
        if (!o.good()) {
            // Not fatal: the loaded values are still valid.
            Logger::Log(LogLevel::Warn, "Could not write missing keys back to " + path);
        }
    }
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << Config().ToJson() << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

}
