#include "../discovery/ServiceIdentifier.hpp"
#include <gtest/gtest.h>

using namespace lanwatch::discovery;

TEST(ServiceIdentifierTest, ParsesOpenSshBanner)
{
    auto info = IdentifyService(22, "SSH-2.0-OpenSSH_8.9p1 Ubuntu-3ubuntu0.1\r\n");
    EXPECT_EQ(info.name, "ssh");
    EXPECT_EQ(info.product, "OpenSSH");
    EXPECT_EQ(info.version, "8.9p1 Ubuntu-3ubuntu0.1");
}

TEST(ServiceIdentifierTest, SshOnOddPortStillNamedSsh)
{
    auto info = IdentifyService(2222, "SSH-2.0-dropbear_2020.81\r\n");
    EXPECT_EQ(info.name, "ssh");
    EXPECT_EQ(info.product, "dropbear");
    EXPECT_EQ(info.version, "2020.81");
}

TEST(ServiceIdentifierTest, ParsesHttpServerHeader)
{
    std::string response =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/html\r\n"
        "server: nginx/1.18.0 (Ubuntu)\r\n"
        "\r\n";
    auto info = IdentifyService(80, response);
    EXPECT_EQ(info.name, "http");
    EXPECT_EQ(info.product, "nginx");
    EXPECT_EQ(info.version, "1.18.0");
}

TEST(ServiceIdentifierTest, BasicRealmEndsUpInProduct)
{
    std::string response =
        "HTTP/1.0 401 Unauthorized\r\n"
        "Server: micro_httpd\r\n"
        "WWW-Authenticate: Basic realm=\"TP-LINK Wireless Router\"\r\n"
        "\r\n";
    auto info = IdentifyService(8080, response);
    EXPECT_EQ(info.name, "http-proxy");
    EXPECT_EQ(info.product, "micro_httpd (TP-LINK Wireless Router)");
    EXPECT_EQ(info.version, "");
}

TEST(ServiceIdentifierTest, NumericGreeting)
{
    auto info = IdentifyService(21, "220 ProFTPD Server ready.\r\n");
    EXPECT_EQ(info.name, "ftp");
    EXPECT_EQ(info.product, "ProFTPD Server ready.");
}

TEST(ServiceIdentifierTest, SilentPortKeepsOnlyWellKnownName)
{
    auto info = IdentifyService(443, "");
    EXPECT_EQ(info.name, "https");
    EXPECT_TRUE(info.product.empty());
    EXPECT_TRUE(info.version.empty());

    auto unknown = IdentifyService(40000, "");
    EXPECT_TRUE(unknown.name.empty());
}

TEST(ServiceIdentifierTest, NeverWritesToRawPrinterPort)
{
    EXPECT_TRUE(BannerRequestFor(9100).empty());
    EXPECT_FALSE(BannerRequestFor(80).empty());
}
