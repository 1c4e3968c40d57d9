#include "HttpClient.hpp"
#include "../common/AddressRange.hpp"
#include "../common/Socket.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cstring>
#include <netdb.h>
#include <sstream>
#include <sys/socket.h>

namespace lan_sweep::discovery
{
    using lan_sweep::common::ConnectTcp;

    static std::string ToLower(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::string Trim(const std::string &text)
    {
        auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c)
                                      { return std::isspace(c); });
        auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c)
                                    { return std::isspace(c); })
                       .base();
        if (begin >= end)
            return "";
        return std::string(begin, end);
    }

    std::optional<HttpUrl> ParseHttpUrl(const std::string &url)
    {
        const std::string scheme = "http://";
        if (ToLower(url.substr(0, scheme.size())) != scheme)
            return std::nullopt;

        std::string rest = url.substr(scheme.size());
        HttpUrl parsed;

        auto slash = rest.find('/');
        std::string authority = rest.substr(0, slash);
        if (slash != std::string::npos)
            parsed.path = rest.substr(slash);

        auto colon = authority.rfind(':');
        if (colon != std::string::npos)
        {
            std::string port_text = authority.substr(colon + 1);
            if (port_text.empty() || port_text.size() > 5 ||
                !std::all_of(port_text.begin(), port_text.end(), [](unsigned char c)
                             { return std::isdigit(c); }))
                return std::nullopt;
            int port = std::stoi(port_text);
            if (port <= 0 || port > 65535)
                return std::nullopt;
            parsed.port = static_cast<uint16_t>(port);
            authority = authority.substr(0, colon);
        }

        if (authority.empty())
            return std::nullopt;
        parsed.host = authority;
        return parsed;
    }

    std::optional<HttpResponse> ParseHttpResponse(const std::string &raw)
    {
        auto line_end = raw.find("\r\n");
        if (line_end == std::string::npos || raw.compare(0, 5, "HTTP/") != 0)
            return std::nullopt;

        std::stringstream status_line(raw.substr(0, line_end));
        std::string version;
        int status = 0;
        if (!(status_line >> version >> status))
            return std::nullopt;

        HttpResponse response;
        response.status = status;

        auto header_end = raw.find("\r\n\r\n");
        if (header_end == std::string::npos)
        {
            response.headers = raw.substr(line_end + 2);
            return response;
        }

        response.headers = raw.substr(line_end + 2, header_end - line_end - 2);
        response.body = raw.substr(header_end + 4);
        return response;
    }

    std::optional<std::string> FindHeader(const std::string &headers, const std::string &name)
    {
        const std::string wanted = ToLower(name) + ":";
        std::stringstream ss(headers);
        std::string line;
        while (std::getline(ss, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (ToLower(line.substr(0, wanted.size())) == wanted)
                return Trim(line.substr(wanted.size()));
        }
        return std::nullopt;
    }

    std::optional<std::string> ExtractXmlTag(const std::string &xml, const std::string &tag)
    {
        const std::string lower = ToLower(xml);
        const std::string open = "<" + ToLower(tag) + ">";
        const std::string close = "</" + ToLower(tag) + ">";

        auto start = lower.find(open);
        if (start == std::string::npos)
            return std::nullopt;
        start += open.size();

        auto end = lower.find(close, start);
        if (end == std::string::npos || end == start)
            return std::nullopt;

        std::string value = Trim(xml.substr(start, end - start));
        if (value.empty())
            return std::nullopt;
        return value;
    }

    static std::optional<std::string> ResolveHost(const std::string &host)
    {
        if (lan_sweep::common::IpToInt(host))
            return host;

        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo *res = nullptr;
        if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || res == nullptr)
            return std::nullopt;

        char ip_str[INET_ADDRSTRLEN];
        auto *addr = reinterpret_cast<struct sockaddr_in *>(res->ai_addr);
        const char *ok = inet_ntop(AF_INET, &addr->sin_addr, ip_str, INET_ADDRSTRLEN);
        freeaddrinfo(res);

        if (ok == nullptr)
            return std::nullopt;
        return std::string(ip_str);
    }

    std::optional<HttpResponse> HttpClient::Execute(const HttpUrl &url, int timeout_ms)
    {
        auto ip = ResolveHost(url.host);
        if (!ip)
            return std::nullopt;

        auto sock = ConnectTcp(*ip, url.port, timeout_ms);
        if (!sock)
            return std::nullopt;

        std::string request = "GET " + url.path + " HTTP/1.0\r\n" +
                              "Host: " + url.host + "\r\n" +
                              "Connection: close\r\n\r\n";
        if (!lan_sweep::common::SendAll(sock->Get(), request))
            return std::nullopt;

        std::string raw = lan_sweep::common::ReceiveAll(sock->Get(), MAX_RESPONSE_BYTES);
        return ParseHttpResponse(raw);
    }

    std::optional<HttpResponse> HttpClient::Get(const HttpUrl &url, int timeout_ms)
    {
        return Execute(url, timeout_ms);
    }

    std::optional<HttpResponse> HttpClient::Get(const std::string &url, int timeout_ms)
    {
        auto parsed = ParseHttpUrl(url);
        if (!parsed)
            return std::nullopt;
        return Execute(*parsed, timeout_ms);
    }
}
