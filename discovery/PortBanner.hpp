#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lan_sweep::discovery
{
    struct BannerScan
    {
        std::optional<std::string> sshHostname;
        std::optional<std::string> httpServer;
        std::optional<std::string> deviceType;
        std::vector<uint16_t> openPorts;
    };

    class PortBanner
    {
    public:
        static constexpr std::size_t MAX_BANNER_BYTES = 512;

        using PortTable = std::vector<std::pair<uint16_t, std::string>>;

        static const PortTable &Ports();

        static BannerScan Scan(const std::string &ip, int timeout_ms);

        // Timed connect to every port in the table. "SSH" entries are read for a banner
        // and "HTTP"/"HTTP-Alt" entries are asked for their Server header.
        static BannerScan Scan(const std::string &ip, int timeout_ms, const PortTable &ports);
    };

    // "SSH-2.0-dropbear myhost" -> "myhost"; banners ending in an OpenSSH version yield nothing.
    std::optional<std::string> ParseSshHostname(const std::string &banner);

    bool IsPrinterServer(const std::string &server_header);

    bool IsPrinterPort(uint16_t port);
}
