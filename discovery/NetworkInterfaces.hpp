#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lanwatch::discovery
{
    struct InterfaceInfo
    {
        std::string name;
        std::string ipv4;
        std::string netmask;
        std::string broadcast;
        std::string mac;
        bool is_up = false;
    };

    // Every local interface the kernel reports, sorted by name. Interfaces
    // without an IPv4 address are listed with empty address fields.
    std::vector<InterfaceInfo> ListInterfaces();

    nlohmann::json ToJson(const std::vector<InterfaceInfo> &interfaces);
}
