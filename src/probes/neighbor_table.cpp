#include "netsleuth/probes/neighbor_table.h"

#include <sstream>
#include <stdexcept>

#include "netsleuth/discovery/normalizer.h"
#include "netsleuth/discovery/scope.h"

namespace netsleuth::probes {

// ATF_COM in <net/if_arp.h>
static constexpr unsigned long kFlagComplete = 0x2;

std::vector<NeighborEntry> parse_neighbor_table(std::string_view text)
{
    std::vector<NeighborEntry> out;

    std::istringstream in{std::string(text)};
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) {
            header = false;
            if (line.find("IP address") != std::string::npos) {
                continue;
            }
        }

        std::istringstream row(line);
        std::string ip, hwType, flags, hw, mask, dev;
        if (!(row >> ip >> hwType >> flags >> hw)) {
            continue;
        }
        row >> mask >> dev;

        std::uint32_t unused = 0;
        if (!discovery::parse_ipv4(ip, unused)) {
            continue;
        }

        unsigned long f = 0;
        try {
            f = std::stoul(flags, nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }
        if ((f & kFlagComplete) == 0) {
            continue;
        }

        const std::string mac = discovery::canonical_mac(hw);
        if (mac.empty() || mac == "00:00:00:00:00:00") {
            continue;
        }

        out.push_back(NeighborEntry{ip, mac, dev});
    }

    return out;
}

std::vector<NeighborEntry> read_neighbor_table(fs::IFileSystem& fs, const std::string& path)
{
    auto f = fs.open(path, "rb");
    if (!f) {
        throw std::runtime_error("cannot open neighbour table " + path);
    }
    return parse_neighbor_table(fs::read_all(*f));
}

} // namespace netsleuth::probes
