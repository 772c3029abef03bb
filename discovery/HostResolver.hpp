#pragma once

#include <optional>
#include <string>
#include <vector>

namespace lanwatch::discovery
{
    struct ArpEntry
    {
        std::string ip;
        std::string mac;
        std::string device;
    };

    // Complete entries of the kernel neighbour table (/proc/net/arp).
    std::vector<ArpEntry> ReadArpCache(const std::string &path = "/proc/net/arp");

    std::optional<std::string> LookupArpCache(const std::string &ip, const std::string &path = "/proc/net/arp");

    // Reverse DNS; nullopt when the address has no name.
    std::optional<std::string> ReverseLookup(const std::string &ip);
}
