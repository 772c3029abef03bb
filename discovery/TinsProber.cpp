#include "TinsProber.hpp"
#include "HostResolver.hpp"
#include "../common/AddressRange.hpp"
#include <tins/tins.h>
#include <memory>

namespace lanwatch::discovery
{
    namespace
    {
        Tins::PacketSender MakeSender(const Tins::NetworkInterface &iface, std::chrono::milliseconds timeout)
        {
            auto seconds = static_cast<uint32_t>(timeout.count() / 1000);
            auto usec = static_cast<uint32_t>((timeout.count() % 1000) * 1000);
            return Tins::PacketSender(iface, seconds, usec);
        }

        double ElapsedMs(std::chrono::steady_clock::time_point start)
        {
            std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
            return elapsed.count();
        }

        bool SameSegment(const std::string &target, const Tins::NetworkInterface::Info &info)
        {
            uint32_t mask = common::IpToInt(info.netmask.to_string());
            uint32_t local = common::IpToInt(info.ip_addr.to_string());
            return (common::IpToInt(target) & mask) == (local & mask);
        }
    }

    TinsProber::TinsProber(std::chrono::milliseconds timeout)
        : m_timeout(timeout), m_echo_id(0x1337)
    {
    }

    ProbeResult TinsProber::Probe(const std::string &address)
    {
        if (!common::IsValidIPv4(address))
            return ProbeResult::Unreachable(ProbeError::InvalidAddress);

        ProbeResult echo = EchoProbe(address);
        if (echo.reachable)
            return echo;

        ProbeResult arp = ArpProbe(address);
        if (arp.reachable)
            return arp;

        // Report the more specific failure of the two.
        return echo.error != ProbeError::Timeout ? echo : arp;
    }

    ProbeResult TinsProber::EchoProbe(const std::string &address)
    {
        try
        {
            Tins::NetworkInterface iface{Tins::IPv4Address(address)};
            Tins::PacketSender sender = MakeSender(iface, m_timeout);

            Tins::IP ip = Tins::IP(address) / Tins::ICMP();
            Tins::ICMP &icmp = ip.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(m_echo_id.fetch_add(1));
            icmp.sequence(1);

            auto start = std::chrono::steady_clock::now();
            std::unique_ptr<Tins::PDU> reply(sender.send_recv(ip));
            if (!reply)
                return ProbeResult::Unreachable(ProbeError::Timeout);

            int ttl = 0;
            if (const Tins::IP *reply_ip = reply->find_pdu<Tins::IP>())
                ttl = reply_ip->ttl();
            return ProbeResult::Reachable(ElapsedMs(start), ttl);
        }
        catch (const Tins::socket_open_error &)
        {
            return ProbeResult::Unreachable(ProbeError::PermissionDenied);
        }
        catch (const std::exception &)
        {
            return ProbeResult::Unreachable(ProbeError::Transport);
        }
    }

    std::optional<TinsProber::ArpReply> TinsProber::ArpRequest(const std::string &address, ProbeError &error)
    {
        try
        {
            Tins::IPv4Address target(address);
            Tins::NetworkInterface iface(target);
            Tins::NetworkInterface::Info info = iface.info();

            if (target == info.ip_addr)
                return ArpReply{info.hw_addr.to_string(), 0.0};

            // ARP only reaches the directly attached segment.
            if (!SameSegment(address, info))
            {
                error = ProbeError::Timeout;
                return std::nullopt;
            }

            Tins::PacketSender sender = MakeSender(iface, m_timeout);
            Tins::EthernetII request = Tins::ARP::make_arp_request(target, info.ip_addr, info.hw_addr);

            auto start = std::chrono::steady_clock::now();
            std::unique_ptr<Tins::PDU> reply(sender.send_recv(request, iface));
            if (!reply)
            {
                error = ProbeError::Timeout;
                return std::nullopt;
            }

            const Tins::ARP *arp = reply->find_pdu<Tins::ARP>();
            if (!arp || arp->opcode() != Tins::ARP::REPLY)
            {
                error = ProbeError::Transport;
                return std::nullopt;
            }
            return ArpReply{arp->sender_hw_addr().to_string(), ElapsedMs(start)};
        }
        catch (const Tins::socket_open_error &)
        {
            error = ProbeError::PermissionDenied;
        }
        catch (const std::exception &)
        {
            error = ProbeError::Transport;
        }
        return std::nullopt;
    }

    ProbeResult TinsProber::ArpProbe(const std::string &address)
    {
        ProbeError error = ProbeError::Timeout;
        auto reply = ArpRequest(address, error);
        if (!reply)
            return ProbeResult::Unreachable(error);
        return ProbeResult::Reachable(reply->latency_ms);
    }

    Resolution TinsProber::Resolve(const std::string &address)
    {
        Resolution resolution;
        if (!common::IsValidIPv4(address))
            return resolution;

        resolution.hostname = ReverseLookup(address);
        resolution.mac = LookupArpCache(address);

        if (!resolution.mac)
        {
            ProbeError error = ProbeError::None;
            if (auto reply = ArpRequest(address, error))
                resolution.mac = reply->mac;
        }
        return resolution;
    }
}
