#include "../discovery/HostResolver.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace lanwatch::discovery;

namespace
{
    std::string WriteArpTable()
    {
        std::string path = (std::filesystem::temp_directory_path() /
                            ("lanwatch_arp_" + std::to_string(getpid())))
                               .string();
        std::ofstream out(path);
        out << "IP address       HW type     Flags       HW address            Mask     Device\n"
            << "192.168.1.1      0x1         0x2         AA:BB:CC:00:11:22     *        eth0\n"
            << "192.168.1.7      0x1         0x0         00:00:00:00:00:00     *        eth0\n"
            << "192.168.1.9      0x1         0x6         de:ad:be:ef:00:01     *        wlan0\n";
        return path;
    }
}

TEST(HostResolverTest, ReadsCompleteEntriesOnly)
{
    std::string path = WriteArpTable();
    auto entries = ReadArpCache(path);
    std::filesystem::remove(path);

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].ip, "192.168.1.1");
    EXPECT_EQ(entries[0].mac, "aa:bb:cc:00:11:22");
    EXPECT_EQ(entries[0].device, "eth0");
    EXPECT_EQ(entries[1].device, "wlan0");
}

TEST(HostResolverTest, LookupFindsMac)
{
    std::string path = WriteArpTable();
    auto mac = LookupArpCache("192.168.1.9", path);
    auto incomplete = LookupArpCache("192.168.1.7", path);
    auto absent = LookupArpCache("192.168.1.200", path);
    std::filesystem::remove(path);

    ASSERT_TRUE(mac.has_value());
    EXPECT_EQ(*mac, "de:ad:be:ef:00:01");
    EXPECT_FALSE(incomplete.has_value());
    EXPECT_FALSE(absent.has_value());
}

TEST(HostResolverTest, MissingTableIsEmpty)
{
    EXPECT_TRUE(ReadArpCache("/nonexistent/lanwatch/arp").empty());
}
