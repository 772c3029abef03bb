#include "../discovery/Fingerprinter.hpp"
#include "FakeProbers.hpp"
#include <gtest/gtest.h>

using namespace lanwatch;
using fakes::FakePortScanner;
using fakes::FakeProber;

TEST(FingerprinterTest, CollectsIdentityAndServices)
{
    FakeProber prober({"192.168.1.10"});
    prober.SetHostname("192.168.1.10", "nas.local");
    prober.SetMac("192.168.1.10", "aa:bb:cc:dd:ee:ff");
    prober.SetTtl(64);

    FakePortScanner scanner;
    scanner.SetOpenPorts("192.168.1.10", {22, 80}, {{22, {"ssh", "OpenSSH", "9.2p1"}}});

    discovery::Fingerprinter fingerprinter(prober, scanner, {22, 80, 443, 3389});
    auto before = common::Clock::now();
    common::DeviceRecord record = fingerprinter.Fingerprint("192.168.1.10");

    EXPECT_EQ(record.address, "192.168.1.10");
    EXPECT_EQ(record.hostname, "nas.local");
    EXPECT_EQ(record.mac_address, "aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(record.open_ports, (std::set<int>{22, 80}));
    EXPECT_EQ(record.services.at(22).product, "OpenSSH");
    EXPECT_EQ(record.os_guess, "Linux/Unix");
    EXPECT_EQ(record.device_type, common::DeviceType::Server);
    EXPECT_EQ(record.status, common::DeviceStatus::Online);
    EXPECT_GE(record.last_seen, before);
    EXPECT_EQ(scanner.RequestedPorts(), (std::vector<int>{22, 80, 443, 3389}));
}

TEST(FingerprinterTest, MissingNamesStayEmpty)
{
    FakeProber prober({"192.168.1.11"});
    FakePortScanner scanner;
    scanner.SetOpenPorts("192.168.1.11", {80});

    discovery::Fingerprinter fingerprinter(prober, scanner, {22, 80, 443, 3389});
    auto record = fingerprinter.Fingerprint("192.168.1.11");

    EXPECT_TRUE(record.hostname.empty());
    EXPECT_TRUE(record.mac_address.empty());
    EXPECT_TRUE(record.os_guess.empty());
    EXPECT_EQ(record.device_type, common::DeviceType::IotDevice);
}

TEST(FingerprinterTest, ScanFailureKeepsPartialRecord)
{
    FakeProber prober({"192.168.1.12"});
    prober.SetHostname("192.168.1.12", "printer.lan");
    FakePortScanner scanner;
    scanner.FailFor("192.168.1.12");

    discovery::Fingerprinter fingerprinter(prober, scanner, {22, 80, 443, 3389});
    auto record = fingerprinter.Fingerprint("192.168.1.12");

    EXPECT_EQ(record.hostname, "printer.lan");
    EXPECT_TRUE(record.open_ports.empty());
    EXPECT_TRUE(record.services.empty());
    EXPECT_EQ(record.device_type, common::DeviceType::Computer);
    EXPECT_EQ(record.status, common::DeviceStatus::Online);
}

TEST(FingerprinterTest, RouterDetectedFromServiceString)
{
    FakeProber prober({"192.168.1.1"});
    FakePortScanner scanner;
    scanner.SetOpenPorts("192.168.1.1", {22, 80, 443}, {{80, {"http", "ASUS Router", ""}}});

    discovery::Fingerprinter fingerprinter(prober, scanner, {22, 80, 443, 3389});
    EXPECT_EQ(fingerprinter.Fingerprint("192.168.1.1").device_type, common::DeviceType::Router);
}
