#pragma once

#include <memory>
#include "NotificationSink.hpp"
#include "../common/Config.hpp"
#include "../discovery/PortScanner.hpp"
#include "../discovery/Prober.hpp"
#include "../registry/Registry.hpp"

namespace lanwatch::monitor
{
    // Everything a running instance shares, built once at startup and handed
    // to the components by reference.
    struct Context
    {
        common::Config config;
        std::unique_ptr<discovery::Prober> prober;
        std::unique_ptr<discovery::PortScanner> scanner;
        std::unique_ptr<NotificationSink> notifier;
        registry::Registry registry;
    };

    // Picks the raw-socket prober when the process may open raw sockets and
    // the connect-based one otherwise; port scanning follows the config.
    std::unique_ptr<Context> MakeContext(const common::Config &config);
}
