#include "netsleuth/discovery/iot_hints.h"

#include <algorithm>
#include <cctype>

namespace netsleuth::discovery {

static std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool any_keyword(const std::string& value, const std::vector<std::string>& keywords)
{
    if (value.empty()) return false;
    const std::string v = lower(value);
    for (const auto& k : keywords) {
        if (!k.empty() && v.find(lower(k)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool is_likely_iot_device(const DeviceProfile& profile, const IotHints& hints)
{
    if (profile.overallConfidence >= hints.minConfidence) {
        return true;
    }
    return any_keyword(profile.value_of(AttributeKind::Manufacturer), hints.manufacturerKeywords)
        || any_keyword(profile.value_of(AttributeKind::ProtocolCapability), hints.protocolKeywords)
        || any_keyword(profile.value_of(AttributeKind::DeviceClass), hints.deviceClassKeywords);
}

} // namespace netsleuth::discovery
