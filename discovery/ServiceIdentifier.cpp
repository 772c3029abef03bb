#include "ServiceIdentifier.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

namespace lanwatch::discovery
{
    namespace
    {
        std::string Trim(const std::string &text)
        {
            auto begin = text.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            auto end = text.find_last_not_of(" \t\r\n");
            return text.substr(begin, end - begin + 1);
        }

        std::string ToLower(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        std::string FirstLine(const std::string &text)
        {
            return Trim(text.substr(0, text.find('\n')));
        }

        // Value of an HTTP header, matched case-insensitively. Empty if absent.
        std::string HeaderValue(const std::string &response, const std::string &header)
        {
            std::istringstream lines(response);
            std::string line;
            std::string wanted = ToLower(header) + ":";
            while (std::getline(lines, line))
            {
                if (ToLower(line).rfind(wanted, 0) == 0)
                    return Trim(line.substr(wanted.size()));
            }
            return "";
        }

        common::ServiceInfo ParseSsh(const std::string &banner)
        {
            common::ServiceInfo info;
            info.name = "ssh";

            // SSH-protoversion-softwareversion SP comments
            std::string line = FirstLine(banner);
            auto software_start = line.find('-', 4);
            if (software_start == std::string::npos)
                return info;

            std::string rest = line.substr(software_start + 1);
            auto space = rest.find(' ');
            std::string software = rest.substr(0, space);
            std::string comment = space == std::string::npos ? "" : Trim(rest.substr(space + 1));

            auto underscore = software.find('_');
            if (underscore == std::string::npos)
            {
                info.product = software;
            }
            else
            {
                info.product = software.substr(0, underscore);
                info.version = software.substr(underscore + 1);
            }

            if (!comment.empty())
                info.version = info.version.empty() ? comment : info.version + " " + comment;
            return info;
        }

        common::ServiceInfo ParseHttp(const std::string &response)
        {
            common::ServiceInfo info;

            std::string server = HeaderValue(response, "Server");
            if (!server.empty())
            {
                auto slash = server.find('/');
                if (slash == std::string::npos)
                {
                    info.product = server;
                }
                else
                {
                    info.product = server.substr(0, slash);
                    std::string version = server.substr(slash + 1);
                    info.version = version.substr(0, version.find(' '));
                }
            }

            std::string auth = HeaderValue(response, "WWW-Authenticate");
            auto realm_pos = ToLower(auth).find("realm=\"");
            if (realm_pos != std::string::npos)
            {
                auto start = realm_pos + 7;
                auto end = auth.find('"', start);
                std::string realm = auth.substr(start, end == std::string::npos ? std::string::npos : end - start);
                if (!realm.empty())
                    info.product = info.product.empty() ? realm : info.product + " (" + realm + ")";
            }
            return info;
        }

        bool IsNumericGreeting(const std::string &line)
        {
            return line.size() > 4 &&
                   std::isdigit(static_cast<unsigned char>(line[0])) &&
                   std::isdigit(static_cast<unsigned char>(line[1])) &&
                   std::isdigit(static_cast<unsigned char>(line[2])) &&
                   (line[3] == ' ' || line[3] == '-');
        }
    }

    std::string WellKnownServiceName(int port)
    {
        static const std::map<int, std::string> names = {
            {21, "ftp"},
            {22, "ssh"},
            {23, "telnet"},
            {25, "smtp"},
            {53, "domain"},
            {80, "http"},
            {110, "pop3"},
            {139, "netbios-ssn"},
            {143, "imap"},
            {443, "https"},
            {445, "microsoft-ds"},
            {515, "printer"},
            {554, "rtsp"},
            {631, "ipp"},
            {1883, "mqtt"},
            {3306, "mysql"},
            {3389, "ms-wbt-server"},
            {5000, "upnp"},
            {5900, "vnc"},
            {8080, "http-proxy"},
            {8443, "https-alt"},
            {9100, "jetdirect"}};

        auto it = names.find(port);
        return it == names.end() ? "" : it->second;
    }

    std::string BannerRequestFor(int port)
    {
        switch (port)
        {
        case 80:
        case 631:
        case 5000:
        case 8000:
        case 8008:
        case 8080:
            return "HEAD / HTTP/1.0\r\n\r\n";
        default:
            // Never write to 9100: the printer would print it.
            return "";
        }
    }

    common::ServiceInfo IdentifyService(int port, const std::string &banner)
    {
        common::ServiceInfo info;
        std::string line = FirstLine(banner);

        if (line.rfind("SSH-", 0) == 0)
        {
            info = ParseSsh(banner);
        }
        else if (line.rfind("HTTP/", 0) == 0)
        {
            info = ParseHttp(banner);
            info.name = "http";
        }
        else if (IsNumericGreeting(line))
        {
            info.product = Trim(line.substr(4));
        }

        std::string well_known = WellKnownServiceName(port);
        if (!well_known.empty() && (info.name.empty() || info.name == "http"))
            info.name = well_known;
        return info;
    }
}
