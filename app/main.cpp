#include "../common/Config.hpp"
#include "../common/ThreadSafeQueue.hpp"
#include "../discovery/Connectivity.hpp"
#include "../discovery/NetworkInterfaces.hpp"
#include "../monitor/Context.hpp"
#include "../monitor/Monitor.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>

namespace
{
    std::atomic<bool> g_stop_requested(false);

    void HandleSignal(int)
    {
        g_stop_requested = true;
    }

    void PrintUsage(const char *program)
    {
        std::cout << "Usage: " << program << " [--once] [--ping <address>] [--interfaces] [config.json]\n"
                  << "  --once            run one discovery pass, save the snapshot and exit\n"
                  << "  --ping <address>  test connectivity to an address and exit\n"
                  << "  --interfaces      list local network interfaces and exit\n";
    }

    void PrintEvent(const lanwatch::registry::RegistryEvent &event)
    {
        nlohmann::json line = {
            {"event", lanwatch::registry::ToString(event.kind)},
            {"ip", event.address},
            {"old_status", lanwatch::common::ToString(event.old_status)},
            {"new_status", lanwatch::common::ToString(event.new_status)},
            {"device", lanwatch::common::ToJson(event.record)}};
        std::cout << line.dump() << std::endl;
    }

    void PrintDevices(const lanwatch::registry::Registry &registry)
    {
        std::vector<lanwatch::common::DeviceRecord> devices = registry.List();
        std::cout << "\nFound " << devices.size() << " devices:\n";
        for (const auto &device : devices)
        {
            std::cout << "  " << device.address << " - "
                      << (device.hostname.empty() ? "?" : device.hostname)
                      << " (" << lanwatch::common::ToString(device.device_type) << ", "
                      << lanwatch::common::ToString(device.status) << ")\n";
        }
        std::cout << lanwatch::registry::ToJson(registry.Stats()).dump() << "\n"
                  << std::endl;
    }

    void DrainEvents(lanwatch::common::ThreadSafeQueue<lanwatch::registry::RegistryEvent> &events)
    {
        while (auto event = events.TryPop())
            PrintEvent(*event);
    }
}

int main(int argc, char **argv)
{
    std::string config_path = lanwatch::common::DEFAULT_CONFIG_PATH;
    std::string ping_target;
    bool once = false;
    bool list_interfaces = false;

    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--once") == 0)
        {
            once = true;
        }
        else if (std::strcmp(argv[i], "--interfaces") == 0)
        {
            list_interfaces = true;
        }
        else if (std::strcmp(argv[i], "--ping") == 0 && i + 1 < argc)
        {
            ping_target = argv[++i];
        }
        else if (std::strcmp(argv[i], "--help") == 0 || argv[i][0] == '-')
        {
            PrintUsage(argv[0]);
            return std::strcmp(argv[i], "--help") == 0 ? 0 : 1;
        }
        else
        {
            config_path = argv[i];
        }
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (list_interfaces)
    {
        std::cout << lanwatch::discovery::ToJson(lanwatch::discovery::ListInterfaces()).dump(4) << std::endl;
        return 0;
    }

    try
    {
        lanwatch::common::Config config = lanwatch::common::LoadConfig(config_path);
        auto context = lanwatch::monitor::MakeContext(config);

        if (!ping_target.empty())
        {
            auto report = lanwatch::discovery::TestConnectivity(*context->prober, ping_target);
            std::cout << lanwatch::discovery::ToJson(report).dump(4) << std::endl;
            return report.reachable ? 0 : 2;
        }

        if (!context->registry.LoadSnapshot(config.snapshot_path))
            std::cerr << "[Main] Ignoring unreadable snapshot " << config.snapshot_path << "\n";

        lanwatch::common::ThreadSafeQueue<lanwatch::registry::RegistryEvent> events;
        lanwatch::monitor::Monitor monitor(*context);
        monitor.Subscribe([&events](const lanwatch::registry::RegistryEvent &event)
                          { events.Push(event); });

        monitor.DiscoverNetwork();
        DrainEvents(events);
        PrintDevices(context->registry);

        if (!once)
        {
            monitor.Start();
            while (!g_stop_requested)
            {
                DrainEvents(events);
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            std::cout << "\n[Main] Stopping...\n";
            monitor.Stop();
            DrainEvents(events);
        }

        if (!context->registry.SaveSnapshot(config.snapshot_path))
        {
            std::cerr << "[Main] Failed to save snapshot to " << config.snapshot_path << "\n";
            return 1;
        }
    }
    catch (const lanwatch::common::ConfigError &e)
    {
        std::cerr << "Fatal configuration error: " << e.what() << '\n';
        return -1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Error: " << e.what() << '\n';
        return -1;
    }

    return 0;
}
