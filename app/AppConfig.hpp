#pragma once

#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lan_sweep::app
{
    enum class Command
    {
        Scan,
        List,
        Rename,
        Forget,
        Clear,
        Listen,
        Ping,
        Ports
    };

    struct AppConfig
    {
        Command command = Command::Scan;
        std::vector<std::string> arguments;

        std::string dbPath = "lansweep.db";
        int concurrency = 80;
        int timeoutMs = 500;
        int cutoffDays = 7;
        bool passive = true;
        int listenSeconds = 10;
        std::optional<std::string> ssid;

        // --all: whole history for list, the whole port table for ports.
        bool all = false;
        std::vector<uint16_t> extraPorts;
        int portTimeoutMs = 3000;
    };

    inline constexpr int ALL_HISTORY_DAYS = INT_MAX;

    // nullopt on unknown commands, unknown options, malformed numbers, wrong argument
    // counts or a non-IPv4 target for ping and ports.
    std::optional<AppConfig> ParseArguments(const std::vector<std::string> &args);

    std::string Usage(const std::string &program);
}
