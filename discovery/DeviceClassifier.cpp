#include "DeviceClassifier.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace lanwatch::discovery
{
    namespace
    {
        bool HasAny(const std::set<int> &ports, std::initializer_list<int> candidates)
        {
            return std::any_of(candidates.begin(), candidates.end(),
                               [&ports](int port)
                               { return ports.count(port) > 0; });
        }

        bool ContainsNoCase(const std::string &haystack, const std::string &needle)
        {
            auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                                  [](char a, char b)
                                  {
                                      return std::tolower(static_cast<unsigned char>(a)) ==
                                             std::tolower(static_cast<unsigned char>(b));
                                  });
            return it != haystack.end();
        }

        bool AnyServiceMentions(const std::map<int, common::ServiceInfo> &services, const std::string &word)
        {
            for (const auto &[port, info] : services)
            {
                if (ContainsNoCase(info.name, word) ||
                    ContainsNoCase(info.product, word) ||
                    ContainsNoCase(info.version, word))
                    return true;
            }
            return false;
        }
    }

    common::DeviceType ClassifyDevice(const std::set<int> &ports,
                                      const std::map<int, common::ServiceInfo> &services)
    {
        if (HasAny(ports, {80, 443, 8080}) &&
            (AnyServiceMentions(services, "router") || AnyServiceMentions(services, "gateway")))
            return common::DeviceType::Router;

        if (HasAny(ports, {22, 3389}))
            return common::DeviceType::Server;

        if (HasAny(ports, {631, 9100}))
            return common::DeviceType::Printer;

        if (ports.size() <= 3 && HasAny(ports, {80, 443}))
            return common::DeviceType::IotDevice;

        return common::DeviceType::Computer;
    }

    std::string GuessOs(int ttl,
                        const std::set<int> &ports,
                        const std::map<int, common::ServiceInfo> &services)
    {
        static const std::pair<const char *, const char *> banner_hints[] = {
            {"ubuntu", "Linux (Ubuntu)"},
            {"debian", "Linux (Debian)"},
            {"raspbian", "Linux (Raspbian)"},
            {"freebsd", "FreeBSD"},
            {"microsoft", "Windows"},
            {"windows", "Windows"},
            {"routeros", "MikroTik RouterOS"},
            {"cisco", "Cisco IOS"}};

        for (const auto &[needle, os] : banner_hints)
        {
            if (AnyServiceMentions(services, needle))
                return os;
        }

        if (ports.count(3389) > 0)
            return "Windows";
        if (ttl <= 0)
            return "";
        if (ttl <= 64)
            return "Linux/Unix";
        if (ttl <= 128)
            return "Windows";
        return "Network device";
    }
}
