#include <iostream>
#include <cstdlib>
#include <algorithm>
#include <thread>
#include <optional>
#include <curl/curl.h>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "../config/Config.hpp"
#include "core/RegionResolver.hpp"
#include "cache/PageCache.hpp"
#include "network/HttpTransport.hpp"
#include "parser/DocumentParser.hpp"
#include "utils/Logger.hpp"
#include "utils/ThreadPool.hpp"

namespace {

// RAII guard for curl_global_init/curl_global_cleanup
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_ALL); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void PrintUsage(const char* exe) {
    std::cerr << "Usage: " << exe << " <battletag> [region] [extra]" << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        OwStats::Logger::Log(OwStats::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    if (argc < 2) {
        PrintUsage(argv[0]);
        return 1;
    }
    const std::string battletag = argv[1];
    std::optional<std::string> region;
    if (argc > 2 && argv[2][0] != '\0') region = argv[2];
    const std::string extra = argc > 3 ? argv[3] : "";

    std::filesystem::path exe_path(argv[0]);
    std::filesystem::path exe_dir = exe_path.parent_path();
    std::filesystem::path config_path = exe_dir / "config" / "config.json";
    const std::string config_path_str = config_path.string();

    CurlGlobal curl_global;

    // Load Config
    try {
        OwStats::Config::GetInstance().Load(config_path_str);
        OwStats::Logger::Log(OwStats::LogLevel::Debug, "Configuration loaded from: " + config_path_str);
    } catch (const nlohmann::json::exception& e) {
        OwStats::Logger::Log(OwStats::LogLevel::Error, "Invalid config " + config_path_str + ": " + e.what());
        return 1;
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") != std::string::npos) {
            OwStats::Logger::Log(OwStats::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path_str);
            try {
                OwStats::Config::GetInstance().CreateDefault(config_path_str);
                OwStats::Logger::Log(OwStats::LogLevel::Info, "Default config.json created. Please review it and run again.");
                return 0;
            } catch (const std::exception& create_e) {
                OwStats::Logger::Log(OwStats::LogLevel::Error, "Failed to create default config: " + std::string(create_e.what()));
                return 1;
            }
        }
        OwStats::Logger::Log(OwStats::LogLevel::Error, "Failed to load config: " + error_message);
        return 1;
    }
    const auto& config = OwStats::Config::GetInstance();
    OwStats::Logger::Init(exe_dir.string(), OwStats::Logger::FromString(config.log_level));

    // Determine parse pool size
    const unsigned int hardware_cores = std::max(1u, std::thread::hardware_concurrency());
    unsigned int worker_threads = 0;
    if (config.max_concurrency <= 0) {
        worker_threads = std::max(1u, hardware_cores / 2);
    } else {
        worker_threads = std::min(static_cast<unsigned int>(config.max_concurrency), hardware_cores);
    }
    OwStats::Logger::Log(OwStats::LogLevel::Debug, "Parse workers: " + std::to_string(worker_threads));

    try {
        OwStats::ThreadPool thread_pool(worker_threads);
        OwStats::PageCache page_cache(config.cache_max_size);
        OwStats::HttpTransport transport(config);
        OwStats::DocumentParser parser;
        OwStats::FetchContext ctx{config, page_cache, transport, parser, thread_pool};

        OwStats::RegionResolver resolver(ctx);
        auto resolution = resolver.Resolve(battletag, region, extra);
        if (!resolution.Found()) {
            std::cout << "Player not found: " << battletag << std::endl;
            return 2;
        }

        std::cout << "Region: " << *resolution.region << std::endl;
        if (resolution.document) {
            std::cout << "Title: " << resolution.document->Title() << std::endl;
        } else {
            std::cout << "Profile page unavailable" << std::endl;
        }
    } catch (const std::exception& e) {
        OwStats::Logger::Log(OwStats::LogLevel::Error, "Failed to resolve " + battletag + ": " + e.what());
        return 1;
    }

    return 0;
}
