#include "netsleuth/discovery/scope.h"

#include <cstdio>

namespace netsleuth::discovery {

static bool parse_uint(std::string_view v, unsigned max, unsigned& out)
{
    if (v.empty() || v.size() > 3) return false;
    unsigned n = 0;
    for (char c : v) {
        if (c < '0' || c > '9') return false;
        n = n * 10 + static_cast<unsigned>(c - '0');
    }
    if (n > max) return false;
    out = n;
    return true;
}

bool parse_ipv4(std::string_view text, std::uint32_t& out)
{
    std::uint32_t addr = 0;
    int parts = 0;

    while (parts < 4) {
        const std::size_t dot = text.find('.');
        const std::string_view part = (dot == std::string_view::npos) ? text : text.substr(0, dot);

        unsigned octet = 0;
        if (!parse_uint(part, 255, octet)) return false;
        // No leading zeros ("010" is ambiguous).
        if (part.size() > 1 && part[0] == '0') return false;

        addr = (addr << 8) | octet;
        ++parts;

        if (dot == std::string_view::npos) {
            text = {};
            break;
        }
        // A dot after the fourth octet leaves trailing junk.
        if (parts == 4) return false;
        text.remove_prefix(dot + 1);
    }

    if (parts != 4 || !text.empty()) return false;
    out = addr;
    return true;
}

std::string format_ipv4(std::uint32_t addr)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%u.%u.%u.%u",
                  (addr >> 24) & 0xFFu, (addr >> 16) & 0xFFu,
                  (addr >> 8) & 0xFFu, addr & 0xFFu);
    return buf;
}

int compare_addresses(std::string_view a, std::string_view b)
{
    std::uint32_t ia = 0, ib = 0;
    if (parse_ipv4(a, ia) && parse_ipv4(b, ib)) {
        if (ia < ib) return -1;
        if (ia > ib) return 1;
        return 0;
    }
    return a.compare(b);
}

static std::uint32_t mask_for(int prefix)
{
    if (prefix <= 0) return 0;
    return prefix >= 32 ? 0xFFFFFFFFu : ~((1u << (32 - prefix)) - 1u);
}

bool Scope::parse(std::string_view text, Scope& out)
{
    if (text.empty()) return false;

    std::string_view addrPart = text;
    int prefix = 32;

    const std::size_t slash = text.find('/');
    if (slash != std::string_view::npos) {
        addrPart = text.substr(0, slash);
        unsigned p = 0;
        if (!parse_uint(text.substr(slash + 1), 32, p)) return false;
        prefix = static_cast<int>(p);
    }

    if (prefix < kMinPrefix) return false;

    std::uint32_t addr = 0;
    if (!parse_ipv4(addrPart, addr)) return false;

    out._network = addr & mask_for(prefix);
    out._prefix  = prefix;
    return true;
}

bool Scope::contains(std::string_view address) const
{
    std::uint32_t addr = 0;
    if (!parse_ipv4(address, addr)) return false;
    return (addr & mask_for(_prefix)) == _network;
}

std::size_t Scope::host_count() const noexcept
{
    if (_prefix >= 31) {
        return _prefix == 32 ? 1u : 2u;
    }
    return (std::size_t{1} << (32 - _prefix)) - 2u;
}

std::vector<std::string> Scope::hosts() const
{
    std::vector<std::string> out;
    out.reserve(host_count());

    if (_prefix >= 31) {
        const std::uint32_t span = (_prefix == 32) ? 1u : 2u;
        for (std::uint32_t i = 0; i < span; ++i) {
            out.push_back(format_ipv4(_network + i));
        }
        return out;
    }

    const std::uint32_t size = 1u << (32 - _prefix);
    for (std::uint32_t i = 1; i + 1 < size; ++i) {
        out.push_back(format_ipv4(_network + i));
    }
    return out;
}

std::string Scope::to_string() const
{
    if (_prefix == 32) {
        return format_ipv4(_network);
    }
    return format_ipv4(_network) + "/" + std::to_string(_prefix);
}

} // namespace netsleuth::discovery
