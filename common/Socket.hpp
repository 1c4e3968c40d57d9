#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lan_sweep::common
{
    // Owns a file descriptor and closes it on destruction.
    class Socket
    {
    public:
        explicit Socket(int fd = -1) : m_fd(fd) {}
        ~Socket();

        Socket(const Socket &) = delete;
        Socket &operator=(const Socket &) = delete;
        Socket(Socket &&other) noexcept;
        Socket &operator=(Socket &&other) noexcept;

        int Get() const { return m_fd; }
        bool Valid() const { return m_fd >= 0; }
        void Reset();

    private:
        int m_fd;
    };

    struct Datagram
    {
        std::vector<uint8_t> data;
        std::string source_ip;
    };

    Socket OpenUdpSocket();

    bool SetReceiveTimeout(int fd, int timeout_ms);
    bool SetSendTimeout(int fd, int timeout_ms);

    // Non-blocking connect bounded by timeout_ms; the returned socket is blocking
    // with send/receive timeouts of timeout_ms.
    std::optional<Socket> ConnectTcp(const std::string &host, uint16_t port, int timeout_ms);

    bool SendAll(int fd, const std::string &data);

    // Reads until the peer closes, the receive timeout expires or max_bytes is reached.
    std::string ReceiveAll(int fd, std::size_t max_bytes);

    std::optional<std::string> ReceiveLine(int fd, std::size_t max_bytes);

    bool SendDatagram(int fd, const std::string &ip, uint16_t port, const std::vector<uint8_t> &payload);

    // nullopt on timeout or error.
    std::optional<Datagram> ReceiveDatagram(int fd, std::size_t max_size);
}
