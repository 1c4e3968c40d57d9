#include "Socket.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lan_sweep::common
{
    Socket::~Socket()
    {
        Reset();
    }

    Socket::Socket(Socket &&other) noexcept : m_fd(other.m_fd)
    {
        other.m_fd = -1;
    }

    Socket &Socket::operator=(Socket &&other) noexcept
    {
        if (this != &other)
        {
            Reset();
            m_fd = other.m_fd;
            other.m_fd = -1;
        }
        return *this;
    }

    void Socket::Reset()
    {
        if (m_fd >= 0)
        {
            close(m_fd);
            m_fd = -1;
        }
    }

    Socket OpenUdpSocket()
    {
        return Socket(socket(AF_INET, SOCK_DGRAM, 0));
    }

    static bool SetTimeoutOption(int fd, int option, int timeout_ms)
    {
        struct timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;
        return setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) == 0;
    }

    bool SetReceiveTimeout(int fd, int timeout_ms)
    {
        return SetTimeoutOption(fd, SO_RCVTIMEO, timeout_ms);
    }

    bool SetSendTimeout(int fd, int timeout_ms)
    {
        return SetTimeoutOption(fd, SO_SNDTIMEO, timeout_ms);
    }

    std::optional<Socket> ConnectTcp(const std::string &host, uint16_t port, int timeout_ms)
    {
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1)
            return std::nullopt;

        Socket sock(socket(AF_INET, SOCK_STREAM, 0));
        if (!sock.Valid())
            return std::nullopt;

        int flags = fcntl(sock.Get(), F_GETFL, 0);
        if (flags == -1 || fcntl(sock.Get(), F_SETFL, flags | O_NONBLOCK) == -1)
            return std::nullopt;

        int ret = connect(sock.Get(), reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr));
        if (ret != 0)
        {
            if (errno != EINPROGRESS)
                return std::nullopt;

            struct pollfd pfd;
            pfd.fd = sock.Get();
            pfd.events = POLLOUT;
            pfd.revents = 0;

            if (poll(&pfd, 1, timeout_ms) <= 0)
                return std::nullopt;

            int err = 0;
            socklen_t len = sizeof(err);
            if (getsockopt(sock.Get(), SOL_SOCKET, SO_ERROR, &err, &len) != 0 || err != 0)
                return std::nullopt;
        }

        if (fcntl(sock.Get(), F_SETFL, flags) == -1)
            return std::nullopt;

        if (!SetReceiveTimeout(sock.Get(), timeout_ms) || !SetSendTimeout(sock.Get(), timeout_ms))
            return std::nullopt;
        return sock;
    }

    bool SendAll(int fd, const std::string &data)
    {
        std::size_t sent = 0;
        while (sent < data.size())
        {
            ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0)
                return false;
            sent += static_cast<std::size_t>(n);
        }
        return true;
    }

    std::string ReceiveAll(int fd, std::size_t max_bytes)
    {
        std::string out;
        char buffer[2048];
        while (out.size() < max_bytes)
        {
            ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0)
                break;
            out.append(buffer, static_cast<std::size_t>(n));
        }
        if (out.size() > max_bytes)
            out.resize(max_bytes);
        return out;
    }

    std::optional<std::string> ReceiveLine(int fd, std::size_t max_bytes)
    {
        std::string line;
        char c;
        while (line.size() < max_bytes)
        {
            ssize_t n = recv(fd, &c, 1, 0);
            if (n <= 0)
                break;
            if (c == '\n')
                break;
            if (c != '\r')
                line += c;
        }
        if (line.empty())
            return std::nullopt;
        return line;
    }

    bool SendDatagram(int fd, const std::string &ip, uint16_t port, const std::vector<uint8_t> &payload)
    {
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
            return false;

        ssize_t n = sendto(fd, payload.data(), payload.size(), 0,
                           reinterpret_cast<const struct sockaddr *>(&addr), sizeof(addr));
        return n == static_cast<ssize_t>(payload.size());
    }

    std::optional<Datagram> ReceiveDatagram(int fd, std::size_t max_size)
    {
        std::vector<uint8_t> buffer(max_size);
        struct sockaddr_in from;
        socklen_t from_len = sizeof(from);

        ssize_t n = recvfrom(fd, buffer.data(), buffer.size(), 0,
                             reinterpret_cast<struct sockaddr *>(&from), &from_len);
        if (n <= 0)
            return std::nullopt;

        buffer.resize(static_cast<std::size_t>(n));

        char ip_str[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &from.sin_addr, ip_str, INET_ADDRSTRLEN) == nullptr)
            return std::nullopt;

        return Datagram{std::move(buffer), std::string(ip_str)};
    }
}
