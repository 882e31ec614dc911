#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "FetchContext.hpp"
#include "DocumentLoader.hpp"
#include "UpdateTrigger.hpp"

namespace OwStats {

struct PlayerIdentity {
    std::string battletag;
    std::optional<std::string> region; // nullopt: try the default regions
};

struct RegionResolution {
    std::unique_ptr<HtmlDocument> document;
    std::optional<std::string> region;

    // True when some region passed the probe and update steps.
    bool Found() const { return region.has_value(); }
};

class RegionResolver {
public:
    static const std::vector<std::string>& DefaultRegions();

    explicit RegionResolver(FetchContext& ctx);

    // Walks the candidate regions in order: existence probe on the career site,
    // remote update, then the full profile page. The first region passing the
    // first two steps is returned with its profile document, which is null if
    // that last fetch failed. Later regions are not tried in that case.
    // Returns an empty resolution when every candidate was skipped.
    // UpdateError and json parse errors propagate.
    RegionResolution Resolve(const std::string& battletag, const std::optional<std::string>& region = std::nullopt,
                             const std::string& extra = "");
    RegionResolution Resolve(const PlayerIdentity& player, const std::string& extra = "");

private:
    FetchContext& ctx_;
    DocumentLoader loader_;
    UpdateTrigger updater_;
};

}
