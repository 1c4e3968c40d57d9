#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lan_sweep::discovery
{
    struct HttpUrl
    {
        std::string host;
        uint16_t port = 80;
        std::string path = "/";
    };

    struct HttpResponse
    {
        int status = 0;
        std::string headers;
        std::string body;
    };

    std::optional<HttpUrl> ParseHttpUrl(const std::string &url);

    std::optional<HttpResponse> ParseHttpResponse(const std::string &raw);

    // Case-insensitive header lookup over the raw header block.
    std::optional<std::string> FindHeader(const std::string &headers, const std::string &name);

    // Text between <tag> and </tag>, case-insensitive, trimmed.
    std::optional<std::string> ExtractXmlTag(const std::string &xml, const std::string &tag);

    std::string Trim(const std::string &text);

    class HttpClient
    {
    public:
        static constexpr std::size_t MAX_RESPONSE_BYTES = 256 * 1024;

        static std::optional<HttpResponse> Get(const HttpUrl &url, int timeout_ms);
        static std::optional<HttpResponse> Get(const std::string &url, int timeout_ms);

    private:
        static std::optional<HttpResponse> Execute(const HttpUrl &url, int timeout_ms);
    };
}
