#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lanwatch::common
{
    inline constexpr int MIN_PREFIX_LENGTH = 16;

    struct Subnet
    {
        uint32_t network;
        int prefix_length;
    };

    // Throws std::invalid_argument on malformed input or a prefix below MIN_PREFIX_LENGTH.
    Subnet ParseCidr(const std::string &cidr);

    // Host addresses of the subnet. Network and broadcast addresses are skipped
    // unless the prefix is /31 or /32.
    std::vector<std::string> ExpandCidr(const std::string &cidr);

    bool IsValidIPv4(const std::string &address);

    uint32_t IpToInt(const std::string &address);
    std::string IntToIp(uint32_t ip);
}
