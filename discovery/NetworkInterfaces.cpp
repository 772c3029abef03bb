#include "NetworkInterfaces.hpp"
#include <tins/tins.h>
#include <algorithm>
#include <iostream>

namespace lanwatch::discovery
{
    namespace
    {
        std::string AddressOrEmpty(const Tins::IPv4Address &address)
        {
            return address == Tins::IPv4Address() ? "" : address.to_string();
        }
    }

    std::vector<InterfaceInfo> ListInterfaces()
    {
        std::vector<InterfaceInfo> result;

        std::vector<Tins::NetworkInterface> interfaces;
        try
        {
            interfaces = Tins::NetworkInterface::all();
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Interfaces] Cannot enumerate interfaces: " << e.what() << "\n";
            return result;
        }

        for (const auto &iface : interfaces)
        {
            InterfaceInfo entry;
            try
            {
                entry.name = iface.name();
                Tins::NetworkInterface::Info info = iface.info();
                entry.ipv4 = AddressOrEmpty(info.ip_addr);
                entry.netmask = AddressOrEmpty(info.netmask);
                entry.broadcast = AddressOrEmpty(info.bcast_addr);
                entry.mac = info.hw_addr.to_string();
                entry.is_up = info.is_up;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Interfaces] Skipping details of " << entry.name << ": " << e.what() << "\n";
                if (entry.name.empty())
                    continue;
            }
            result.push_back(entry);
        }

        std::sort(result.begin(), result.end(),
                  [](const InterfaceInfo &a, const InterfaceInfo &b)
                  { return a.name < b.name; });
        return result;
    }

    nlohmann::json ToJson(const std::vector<InterfaceInfo> &interfaces)
    {
        nlohmann::json json = nlohmann::json::object();
        for (const auto &iface : interfaces)
        {
            json[iface.name] = {
                {"ipv4", iface.ipv4},
                {"netmask", iface.netmask},
                {"broadcast", iface.broadcast},
                {"mac", iface.mac},
                {"is_up", iface.is_up}};
        }
        return json;
    }
}
