#pragma once

#include <string>
#include <vector>

#include "netsleuth/discovery/device_profile.h"

namespace netsleuth::discovery {

// Heuristics for flagging profiles that look like IoT/smart-home devices.
struct IotHints {
    std::vector<std::string> manufacturerKeywords{
        "samsung", "philips", "sonos", "nest", "google", "amazon", "apple"};
    std::vector<std::string> protocolKeywords{
        "smartthings", "hue", "hap", "matter", "airplay", "googlecast", "mqtt", "modbus"};
    std::vector<std::string> deviceClassKeywords{
        "thermostat", "washing_machine", "smart_speaker", "SmartThings Hub", "hue_bridge"};

    // Any profile at or above this overall confidence qualifies.
    double minConfidence{0.6};
};

// Case-insensitive keyword match on manufacturer / protocol-capability /
// device-class, or overall confidence >= hints.minConfidence.
bool is_likely_iot_device(const DeviceProfile& profile, const IotHints& hints);

} // namespace netsleuth::discovery
