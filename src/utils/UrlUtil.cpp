#include "UrlUtil.hpp"
#include <algorithm>

namespace OwStats {
namespace UrlUtil {

std::string NormalizeBattletag(const std::string& battletag) {
    std::string out = battletag;
    std::replace(out.begin(), out.end(), '#', '-');
    return out;
}

static inline std::string RegionPath(const std::string& region, const std::string& battletag) {
    return region + "/" + NormalizeBattletag(battletag);
}

std::string CareerPageUrl(const std::string& blizzard_base, const std::string& battletag, const std::string& region) {
    return blizzard_base + "career/pc/" + RegionPath(region, battletag);
}

std::string ProfilePageUrl(const std::string& mo_base, const std::string& battletag, const std::string& region,
                           const std::string& extra) {
    return mo_base + "profile/pc/" + RegionPath(region, battletag) + extra;
}

std::string UpdateUrl(const std::string& mo_base, const std::string& battletag, const std::string& region) {
    return ProfilePageUrl(mo_base, battletag, region) + "/update";
}

}
}
