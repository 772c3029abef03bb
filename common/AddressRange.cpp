#include "AddressRange.hpp"
#include <arpa/inet.h>
#include <stdexcept>

namespace lanwatch::common
{
    bool IsValidIPv4(const std::string &address)
    {
        struct in_addr addr;
        return inet_pton(AF_INET, address.c_str(), &addr) == 1;
    }

    uint32_t IpToInt(const std::string &address)
    {
        struct in_addr addr;
        if (inet_pton(AF_INET, address.c_str(), &addr) != 1)
            throw std::invalid_argument("invalid IPv4 address: " + address);
        return ntohl(addr.s_addr);
    }

    std::string IntToIp(uint32_t ip)
    {
        struct in_addr addr;
        addr.s_addr = htonl(ip);
        char buf[INET_ADDRSTRLEN];
        if (!inet_ntop(AF_INET, &addr, buf, sizeof(buf)))
            return "";
        return buf;
    }

    Subnet ParseCidr(const std::string &cidr)
    {
        auto slash = cidr.find('/');
        std::string base = cidr.substr(0, slash);
        int prefix = 32;

        if (slash != std::string::npos)
        {
            std::string prefix_text = cidr.substr(slash + 1);
            if (prefix_text.empty() || prefix_text.size() > 2 ||
                prefix_text.find_first_not_of("0123456789") != std::string::npos)
                throw std::invalid_argument("invalid prefix length in " + cidr);
            prefix = std::stoi(prefix_text);
        }

        if (prefix > 32)
            throw std::invalid_argument("invalid prefix length in " + cidr);
        if (prefix < MIN_PREFIX_LENGTH)
            throw std::invalid_argument("subnet too large to sweep: " + cidr);

        uint32_t mask = ~uint32_t{0} << (32 - prefix);
        return Subnet{IpToInt(base) & mask, prefix};
    }

    std::vector<std::string> ExpandCidr(const std::string &cidr)
    {
        Subnet subnet = ParseCidr(cidr);

        uint32_t mask = ~uint32_t{0} << (32 - subnet.prefix_length);
        uint32_t broadcast = subnet.network | ~mask;

        uint32_t first = subnet.network;
        uint32_t last = broadcast;
        if (subnet.prefix_length <= 30)
        {
            ++first;
            --last;
        }

        std::vector<std::string> hosts;
        hosts.reserve(static_cast<size_t>(last - first) + 1);
        for (uint32_t ip = first;; ++ip)
        {
            hosts.push_back(IntToIp(ip));
            if (ip == last)
                break;
        }
        return hosts;
    }
}
