#include "netsleuth/discovery/attribute.h"

namespace netsleuth::discovery {

std::string_view to_string(AttributeKind kind) noexcept
{
    switch (kind) {
    case AttributeKind::Manufacturer:       return "manufacturer";
    case AttributeKind::DeviceClass:        return "device-class";
    case AttributeKind::ModelIdentifier:    return "model-identifier";
    case AttributeKind::ProtocolCapability: return "protocol-capability";
    case AttributeKind::OpenServicePort:    return "open-service-port";
    case AttributeKind::HardwareAddress:    return "hardware-address";
    }
    return "unknown";
}

std::optional<AttributeKind> parse_attribute_kind(std::string_view text)
{
    for (AttributeKind k : kAllAttributeKinds) {
        if (to_string(k) == text) {
            return k;
        }
    }
    // Accept the underscore spelling used by some probe outputs.
    if (text == "device_class" || text == "device_type") return AttributeKind::DeviceClass;
    if (text == "model_identifier" || text == "model") return AttributeKind::ModelIdentifier;
    if (text == "protocol_capability" || text == "protocol") return AttributeKind::ProtocolCapability;
    if (text == "open_service_port" || text == "port") return AttributeKind::OpenServicePort;
    if (text == "hardware_address" || text == "mac") return AttributeKind::HardwareAddress;
    return std::nullopt;
}

ImportanceTable default_importance()
{
    return ImportanceTable{
        {AttributeKind::DeviceClass,        3.0},
        {AttributeKind::Manufacturer,       3.0},
        {AttributeKind::ModelIdentifier,    2.0},
        {AttributeKind::ProtocolCapability, 2.0},
        {AttributeKind::HardwareAddress,    1.0},
        {AttributeKind::OpenServicePort,    1.0},
    };
}

double importance_of(const ImportanceTable& table, AttributeKind kind)
{
    auto it = table.find(kind);
    if (it == table.end() || !(it->second > 0.0)) {
        return 1.0;
    }
    return it->second;
}

} // namespace netsleuth::discovery
