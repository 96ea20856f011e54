#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace netsleuth::discovery {

// Parse dotted-quad IPv4. Returns false on anything else.
bool parse_ipv4(std::string_view text, std::uint32_t& out);

std::string format_ipv4(std::uint32_t addr);

// Orders addresses numerically when both are IPv4, lexically otherwise.
// Returns <0, 0, >0 like strcmp.
int compare_addresses(std::string_view a, std::string_view b);

// Target of one discovery call: a single address or an IPv4 CIDR range.
class Scope {
public:
    // Smallest range accepted; anything wider is a configuration error.
    static constexpr int kMinPrefix = 16;

    Scope() = default;

    // Accepts "a.b.c.d" or "a.b.c.d/n" with kMinPrefix <= n <= 32.
    // Host bits in a CIDR are cleared ("10.0.0.7/24" -> "10.0.0.0/24").
    static bool parse(std::string_view text, Scope& out);

    bool is_single() const noexcept { return _prefix == 32; }
    std::uint32_t network() const noexcept { return _network; }
    int prefix() const noexcept { return _prefix; }

    bool contains(std::string_view address) const;

    // Usable host addresses, ascending. Network and broadcast addresses are
    // excluded for prefixes shorter than /31.
    std::vector<std::string> hosts() const;

    std::size_t host_count() const noexcept;

    // Canonical text form ("192.168.1.0/24" or "192.168.1.7").
    std::string to_string() const;

private:
    std::uint32_t _network{0};
    int           _prefix{32};
};

} // namespace netsleuth::discovery
