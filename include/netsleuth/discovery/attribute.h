#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace netsleuth::discovery {

// Common attribute vocabulary every probe output is mapped onto.
enum class AttributeKind : std::uint8_t {
    Manufacturer = 0,
    DeviceClass,
    ModelIdentifier,
    ProtocolCapability,
    OpenServicePort,
    HardwareAddress,
};

inline constexpr AttributeKind kAllAttributeKinds[] = {
    AttributeKind::Manufacturer,
    AttributeKind::DeviceClass,
    AttributeKind::ModelIdentifier,
    AttributeKind::ProtocolCapability,
    AttributeKind::OpenServicePort,
    AttributeKind::HardwareAddress,
};

// "manufacturer", "device-class", ...
std::string_view to_string(AttributeKind kind) noexcept;

std::optional<AttributeKind> parse_attribute_kind(std::string_view text);

// Relative importance of each attribute when averaging per-attribute confidence
// into an overall device confidence. Weights are strictly positive.
using ImportanceTable = std::map<AttributeKind, double>;

// device-class and manufacturer drive downstream protocol selection, so they
// outweigh the port list.
ImportanceTable default_importance();

// Importance for `kind`, falling back to 1.0 when the table has no entry.
double importance_of(const ImportanceTable& table, AttributeKind kind);

} // namespace netsleuth::discovery
