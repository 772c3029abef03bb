#pragma once

#include <string>
#include "../common/DeviceRecord.hpp"

namespace lanwatch::discovery
{
    // IANA-style name for common ports, empty when unknown.
    std::string WellKnownServiceName(int port);

    // Payload to send after connecting so the service answers with something
    // identifiable. Empty means just listen.
    std::string BannerRequestFor(int port);

    // Parses SSH identification strings, HTTP response headers and
    // "220 ..." style greetings into name/product/version.
    common::ServiceInfo IdentifyService(int port, const std::string &banner);
}
