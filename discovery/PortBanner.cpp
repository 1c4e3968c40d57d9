#include "PortBanner.hpp"
#include "HttpClient.hpp"
#include "../common/Socket.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace lan_sweep::discovery
{
    namespace
    {
        constexpr int MIN_PRINTER_PORTS = 2;

        std::string Lowercase(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        bool Contains(const std::string &haystack, const char *needle)
        {
            return haystack.find(needle) != std::string::npos;
        }
    }

    const PortBanner::PortTable &PortBanner::Ports()
    {
        static const PortTable ports = {
            {22, "SSH"},
            {80, "HTTP"},
            {443, "HTTPS"},
            {445, "SMB"},
            {548, "AFP"},
            {631, "IPP"},
            {5353, "mDNS"},
            {8080, "HTTP-Alt"},
            {9100, "Printer"}};
        return ports;
    }

    std::optional<std::string> ParseSshHostname(const std::string &banner)
    {
        std::istringstream stream(banner);
        std::vector<std::string> parts;
        std::string token;
        while (stream >> token)
            parts.push_back(token);

        if (parts.size() < 2)
            return std::nullopt;

        const std::string &candidate = parts.back();
        if (candidate.rfind("OpenSSH", 0) == 0)
            return std::nullopt;
        return candidate;
    }

    bool IsPrinterServer(const std::string &server_header)
    {
        std::string lower = Lowercase(server_header);
        if (Contains(lower, "lexmark") || Contains(lower, "printer"))
            return true;
        if (Contains(lower, "hp") && Contains(lower, "jet"))
            return true;
        return Contains(lower, "brother") || Contains(lower, "epson") ||
               Contains(lower, "canon") || Contains(lower, "xerox");
    }

    bool IsPrinterPort(uint16_t port)
    {
        return port == 631 || port == 9100;
    }

    BannerScan PortBanner::Scan(const std::string &ip, int timeout_ms)
    {
        return Scan(ip, timeout_ms, Ports());
    }

    BannerScan PortBanner::Scan(const std::string &ip, int timeout_ms, const PortTable &ports)
    {
        BannerScan result;
        int printer_ports = 0;

        for (const auto &[port, service] : ports)
        {
            auto socket = lan_sweep::common::ConnectTcp(ip, port, timeout_ms);
            if (!socket)
                continue;

            result.openPorts.push_back(port);

            if (service == "SSH")
            {
                auto banner = lan_sweep::common::ReceiveLine(socket->Get(), MAX_BANNER_BYTES);
                if (banner)
                {
                    std::cout << "[PortBanner] " << ip << " SSH banner: " << *banner << "\n";
                    if (auto hostname = ParseSshHostname(*banner))
                        result.sshHostname = hostname;
                }
            }
            else if (service == "HTTP" || service == "HTTP-Alt")
            {
                std::string request = "HEAD / HTTP/1.0\r\nHost: " + ip + "\r\n\r\n";
                if (!lan_sweep::common::SendAll(socket->Get(), request))
                    continue;

                std::string raw = lan_sweep::common::ReceiveAll(socket->Get(), MAX_BANNER_BYTES * 8);
                auto server = FindHeader(raw, "Server");
                if (server && !server->empty())
                {
                    std::cout << "[PortBanner] " << ip << " HTTP Server: " << *server << "\n";
                    result.httpServer = server;
                    if (IsPrinterServer(*server))
                        result.deviceType = "Printer";
                }
            }
            else if (IsPrinterPort(port))
            {
                printer_ports++;
                std::cout << "[PortBanner] " << ip << " " << service << " port " << port << " open\n";
            }
        }

        if (!result.deviceType && printer_ports >= MIN_PRINTER_PORTS)
        {
            std::cout << "[PortBanner] " << ip << " has " << printer_ports << " printer ports open, treating as printer\n";
            result.deviceType = "Printer";
        }
        return result;
    }
}
