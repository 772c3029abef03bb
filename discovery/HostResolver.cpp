#include "HostResolver.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

namespace lanwatch::discovery
{
    // ATF_COM in the flags column marks a resolved entry.
    static constexpr unsigned long ARP_FLAG_COMPLETE = 0x2;

    std::vector<ArpEntry> ReadArpCache(const std::string &path)
    {
        std::vector<ArpEntry> results;
        std::ifstream arpFile(path);
        if (!arpFile.is_open())
            return results;

        std::string line;
        std::getline(arpFile, line);
        while (std::getline(arpFile, line))
        {
            std::stringstream ss(line);
            std::string ip, hw_type, flags, mac, mask, dev;
            if (!(ss >> ip >> hw_type >> flags >> mac >> mask >> dev))
                continue;

            unsigned long flag_bits = std::strtoul(flags.c_str(), nullptr, 16);
            if (!(flag_bits & ARP_FLAG_COMPLETE) || mac == "00:00:00:00:00:00")
                continue;

            std::transform(mac.begin(), mac.end(), mac.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            results.push_back({ip, mac, dev});
        }
        return results;
    }

    std::optional<std::string> LookupArpCache(const std::string &ip, const std::string &path)
    {
        for (const auto &entry : ReadArpCache(path))
        {
            if (entry.ip == ip)
                return entry.mac;
        }
        return std::nullopt;
    }

    std::optional<std::string> ReverseLookup(const std::string &ip)
    {
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
            return std::nullopt;

        char host[NI_MAXHOST];
        int rc = getnameinfo(reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr),
                             host, sizeof(host), nullptr, 0, NI_NAMEREQD);
        if (rc != 0)
            return std::nullopt;
        return std::string(host);
    }
}
