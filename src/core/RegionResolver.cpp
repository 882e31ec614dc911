#include "RegionResolver.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"

namespace OwStats {

const std::vector<std::string>& RegionResolver::DefaultRegions() {
    static const std::vector<std::string> regions{"eu", "us", "kr"};
    return regions;
}

RegionResolver::RegionResolver(FetchContext& ctx) : ctx_(ctx), loader_(ctx), updater_(ctx) {}

RegionResolution RegionResolver::Resolve(const PlayerIdentity& player, const std::string& extra) {
    return Resolve(player.battletag, player.region, extra);
}

RegionResolution RegionResolver::Resolve(const std::string& battletag, const std::optional<std::string>& region,
                                         const std::string& extra) {
    const std::vector<std::string> candidates = region ? std::vector<std::string>{*region} : DefaultRegions();
    const auto& cfg = ctx_.config;

    for (const auto& candidate : candidates) {
        // Loading the career page also prompts the profile site to pick up fresh data.
        auto career = loader_.Load(UrlUtil::CareerPageUrl(cfg.blizzard_base_url, battletag, candidate),
                                   std::chrono::seconds(cfg.career_cache_ttl_seconds));
        if (!career) {
            Logger::Log(LogLevel::Debug, "No career page for `" + battletag + "` in " + candidate);
            continue;
        }

        switch (updater_.TriggerUpdate(battletag, candidate)) {
            case UpdateResult::NotFound:
                continue;
            case UpdateResult::Updated:
                break;
        }

        RegionResolution resolution;
        resolution.document = loader_.Load(UrlUtil::ProfilePageUrl(cfg.mo_base_url, battletag, candidate, extra),
                                           std::chrono::seconds(cfg.profile_cache_ttl_seconds));
        if (!resolution.document) {
            Logger::Log(LogLevel::Warn, "Profile page for `" + battletag + "` in " + candidate + " could not be fetched");
        }
        resolution.region = candidate;
        return resolution;
    }

    Logger::Log(LogLevel::Info, "No region found for `" + battletag + "`");
    return RegionResolution{};
}

}
