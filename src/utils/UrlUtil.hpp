#pragma once
#include <string>

namespace OwStats {
namespace UrlUtil {

// Replace every '#' in a battletag with '-' ("Foo#1234" -> "Foo-1234").
std::string NormalizeBattletag(const std::string& battletag);

// <blizzard_base>career/pc/{region}/{btag}
std::string CareerPageUrl(const std::string& blizzard_base, const std::string& battletag, const std::string& region);

// <mo_base>profile/pc/{region}/{btag}{extra}
// extra is appended verbatim (path or query fragment).
std::string ProfilePageUrl(const std::string& mo_base, const std::string& battletag, const std::string& region,
                           const std::string& extra = "");

// <mo_base>profile/pc/{region}/{btag}/update
std::string UpdateUrl(const std::string& mo_base, const std::string& battletag, const std::string& region);

}
}
