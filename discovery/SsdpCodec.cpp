#include "SsdpCodec.hpp"
#include "HttpClient.hpp"

namespace lan_sweep::discovery::ssdp
{
    const std::vector<std::string> &SearchTargets()
    {
        static const std::vector<std::string> targets = {
            "roku:ecp",
            "urn:schemas-upnp-org:device:InternetGatewayDevice:1",
            "ssdp:all"};
        return targets;
    }

    std::string BuildMSearch(const std::string &search_target, int mx_seconds)
    {
        return std::string("M-SEARCH * HTTP/1.1\r\n") +
               "HOST: " + MULTICAST_GROUP + ":" + std::to_string(PORT) + "\r\n" +
               "MAN: \"ssdp:discover\"\r\n" +
               "MX: " + std::to_string(mx_seconds) + "\r\n" +
               "ST: " + search_target + "\r\n" +
               "\r\n";
    }

    std::optional<std::string> ParseLocation(const std::string &response)
    {
        auto location = FindHeader(response, "LOCATION");
        if (!location || location->empty())
            return std::nullopt;
        return location;
    }

    std::optional<std::string> ParseDeviceDescription(const std::string &xml)
    {
        auto friendly = ExtractXmlTag(xml, "friendlyName");
        if (friendly)
            return friendly;

        auto manufacturer = ExtractXmlTag(xml, "manufacturer");
        auto model = ExtractXmlTag(xml, "modelName");
        if (manufacturer && model)
            return *manufacturer + " " + *model;
        if (manufacturer)
            return manufacturer;
        return model;
    }

    std::optional<std::string> ParseRokuDeviceInfo(const std::string &xml, bool allow_model_name)
    {
        auto user_name = ExtractXmlTag(xml, "user-device-name");
        if (user_name)
            return user_name;

        auto friendly = ExtractXmlTag(xml, "friendly-device-name");
        if (friendly)
            return friendly;

        if (allow_model_name)
            return ExtractXmlTag(xml, "model-name");
        return std::nullopt;
    }
}
