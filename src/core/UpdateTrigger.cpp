#include "UpdateTrigger.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"
#include <nlohmann/json.hpp>

namespace OwStats {

namespace {

std::string StringField(const nlohmann::json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

} // anonymous namespace

UpdateTrigger::UpdateTrigger(FetchContext& ctx) : ctx_(ctx), fetcher_(ctx) {}

UpdateResult UpdateTrigger::TriggerUpdate(const std::string& battletag, const std::string& region) {
    const std::string url = UrlUtil::UpdateUrl(ctx_.config.mo_base_url, battletag, region);
    auto body = fetcher_.Fetch(url, std::chrono::seconds(ctx_.config.default_cache_ttl_seconds));
    if (!body) {
        throw UpdateError("Failed to fetch update endpoint for " + battletag + " in " + region + ": " + url);
    }

    nlohmann::json data = nlohmann::json::parse(*body);

    if (data.is_object() && StringField(data, "status") == "error") {
        const std::string message = StringField(data, "message");
        if (message == kPlayerNotFoundMessage) {
            Logger::Log(LogLevel::Debug, "Update reports no player `" + battletag + "` in " + region);
            return UpdateResult::NotFound;
        }
        Logger::Log(LogLevel::Warn, "Update for `" + battletag + "` in " + region +
                    " returned unrecognized error `" + message + "`, continuing as updated");
    }

    Logger::Log(LogLevel::Info, "Updated user `" + battletag + "` => `" + *body + "`");
    return UpdateResult::Updated;
}

}
