#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "netsleuth/fs/filesystem.h"

namespace netsleuth::probes {

// One resolved row of the kernel neighbour (ARP) table.
struct NeighborEntry {
    std::string address;
    std::string hwAddress;   // canonical lower-case "aa:bb:cc:dd:ee:ff"
    std::string device;      // interface name, may be empty
};

// Parses /proc/net/arp text:
//   IP address  HW type  Flags  HW address  Mask  Device
// Incomplete rows (flags 0x0) and all-zero hardware addresses are skipped.
std::vector<NeighborEntry> parse_neighbor_table(std::string_view text);

// Reads and parses the table at `path`. Throws std::runtime_error if it cannot be opened.
std::vector<NeighborEntry> read_neighbor_table(fs::IFileSystem& fs, const std::string& path);

} // namespace netsleuth::probes
