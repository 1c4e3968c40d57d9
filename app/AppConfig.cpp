#include "AppConfig.hpp"
#include "../common/AddressRange.hpp"
#include <map>
#include <sstream>

namespace lan_sweep::app
{
    namespace
    {
        std::optional<int> ParsePositive(const std::string &text)
        {
            try
            {
                std::size_t used = 0;
                int value = std::stoi(text, &used);
                if (used != text.size() || value <= 0)
                    return std::nullopt;
                return value;
            }
            catch (const std::exception &)
            {
                return std::nullopt;
            }
        }

        std::optional<Command> ParseCommand(const std::string &name)
        {
            static const std::map<std::string, Command> commands = {
                {"scan", Command::Scan},
                {"list", Command::List},
                {"rename", Command::Rename},
                {"forget", Command::Forget},
                {"clear", Command::Clear},
                {"listen", Command::Listen},
                {"ping", Command::Ping},
                {"ports", Command::Ports}};

            auto it = commands.find(name);
            if (it == commands.end())
                return std::nullopt;
            return it->second;
        }
    }

    std::optional<AppConfig> ParseArguments(const std::vector<std::string> &args)
    {
        AppConfig config;
        if (args.empty())
            return config;

        auto command = ParseCommand(args[0]);
        if (!command)
            return std::nullopt;
        config.command = *command;

        for (std::size_t i = 1; i < args.size(); ++i)
        {
            const std::string &arg = args[i];

            if (arg == "--all")
            {
                config.all = true;
                config.cutoffDays = ALL_HISTORY_DAYS;
                continue;
            }
            if (arg == "--no-passive")
            {
                config.passive = false;
                continue;
            }
            if (arg.rfind("--", 0) != 0)
            {
                config.arguments.push_back(arg);
                continue;
            }

            if (i + 1 >= args.size())
                return std::nullopt;
            const std::string &value = args[++i];

            if (arg == "--db")
            {
                config.dbPath = value;
            }
            else if (arg == "--ssid")
            {
                config.ssid = value;
            }
            else
            {
                auto number = ParsePositive(value);
                if (!number)
                    return std::nullopt;

                if (arg == "--concurrency")
                    config.concurrency = *number;
                else if (arg == "--timeout")
                    config.timeoutMs = *number;
                else if (arg == "--cutoff-days")
                    config.cutoffDays = *number;
                else if (arg == "--listen-seconds")
                    config.listenSeconds = *number;
                else if (arg == "--port-timeout")
                    config.portTimeoutMs = *number;
                else if (arg == "--port" && *number <= 65535)
                    config.extraPorts.push_back(static_cast<uint16_t>(*number));
                else
                    return std::nullopt;
            }
        }

        switch (config.command)
        {
        case Command::Rename:
            if (config.arguments.empty() || config.arguments.size() > 2)
                return std::nullopt;
            break;
        case Command::Forget:
            if (config.arguments.size() != 1)
                return std::nullopt;
            break;
        case Command::Ping:
        case Command::Ports:
            if (config.arguments.size() != 1 || !lan_sweep::common::IpToInt(config.arguments[0]))
                return std::nullopt;
            break;
        case Command::Scan:
            if (config.arguments.size() > 1)
                return std::nullopt;
            break;
        case Command::List:
        case Command::Clear:
        case Command::Listen:
            if (!config.arguments.empty())
                return std::nullopt;
            break;
        }
        return config;
    }

    std::string Usage(const std::string &program)
    {
        std::ostringstream out;
        out << "Usage: " << program << " <command> [options]\n"
            << "Commands:\n"
            << "  scan [CIDR]          Sweep a network (default: the local interface's network)\n"
            << "  list [--all]         Show known devices grouped by state\n"
            << "  rename <ip> [name]   Set or clear a device's custom name\n"
            << "  forget <ip>          Remove a device from history\n"
            << "  clear                Remove every device and the last scanned network\n"
            << "  listen               Run the mDNS and SSDP listeners and print what they hear\n"
            << "  ping <ip>            Check whether one host answers (ICMP, then TCP)\n"
            << "  ports <ip> [--all]   Check a host for common and risky open services\n"
            << "Options:\n"
            << "  --db <path>             Database file (default lansweep.db)\n"
            << "  --concurrency <n>       Simultaneous hosts in flight (default 80)\n"
            << "  --timeout <ms>          Per-probe timeout (default 500)\n"
            << "  --cutoff-days <n>       Offline devices older than this are Historical (default 7)\n"
            << "  --all                   list: keep every offline device in Went Offline; ports: check every known port\n"
            << "  --no-passive            Do not start the mDNS and SSDP listeners during a scan\n"
            << "  --listen-seconds <n>    Duration of the listen command (default 10)\n"
            << "  --ssid <name>           Name of the current network, used to detect network changes\n"
            << "  --port <n>              Extra port for the ports command (repeatable)\n"
            << "  --port-timeout <ms>     Connect timeout for the ports command (default 3000)\n";
        return out.str();
    }
}
