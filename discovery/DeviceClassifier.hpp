#pragma once

#include <map>
#include <set>
#include <string>
#include "../common/DeviceRecord.hpp"

namespace lanwatch::discovery
{
    // First matching rule wins:
    //   web port + "router"/"gateway" in any service string -> Router
    //   22 or 3389                                           -> Server
    //   631 or 9100                                          -> Printer
    //   at most 3 open ports including 80 or 443             -> IotDevice
    //   anything else                                        -> Computer
    common::DeviceType ClassifyDevice(const std::set<int> &ports,
                                      const std::map<int, common::ServiceInfo> &services);

    // TTL bucket refined by service banners. Empty when nothing is known.
    std::string GuessOs(int ttl,
                        const std::set<int> &ports,
                        const std::map<int, common::ServiceInfo> &services);
}
