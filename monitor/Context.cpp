#include "Context.hpp"
#include "../discovery/ConnectProber.hpp"
#include "../discovery/TcpPortScanner.hpp"
#include "../discovery/TinsProber.hpp"
#include <iostream>
#include <unistd.h>

namespace lanwatch::monitor
{
    namespace
    {
        bool IsRoot()
        {
            return geteuid() == 0;
        }
    }

    std::unique_ptr<Context> MakeContext(const common::Config &config)
    {
        auto context = std::make_unique<Context>();
        context->config = config;

        if (IsRoot())
        {
            context->prober = std::make_unique<discovery::TinsProber>(config.probe_timeout);
        }
        else
        {
            std::cerr << "[Context] Not running as root, falling back to TCP connect probing "
                         "(no ICMP, MAC addresses from the ARP cache only).\n";
            context->prober = std::make_unique<discovery::ConnectProber>(config.probe_timeout);
        }

        if (config.port_scan.enabled)
            context->scanner = std::make_unique<discovery::TcpPortScanner>(config.probe_timeout, config.scan_timeout);
        else
            context->scanner = std::make_unique<discovery::NullPortScanner>();

        context->notifier = std::make_unique<LogNotificationSink>();
        return context;
    }
}
