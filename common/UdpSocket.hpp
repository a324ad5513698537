#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::common
{
    struct Datagram
    {
        std::vector<std::uint8_t> data;
        std::string from_ip;
        std::uint16_t from_port = 0;
    };

    // IPv4 UDP socket, closed on destruction.
    class UdpSocket
    {
    private:
        int m_fd;

    public:
        // Throws std::runtime_error when the socket cannot be created.
        UdpSocket();
        ~UdpSocket();

        UdpSocket(const UdpSocket &) = delete;
        UdpSocket &operator=(const UdpSocket &) = delete;

        int Fd() const { return m_fd; }

        // Throws std::runtime_error on failure.
        void Bind(std::uint16_t port, bool reuse_address = false);
        void JoinMulticast(const std::string &group);
        void SetMulticastTtl(int ttl);

        bool SendTo(const std::string &ip, std::uint16_t port, const std::vector<std::uint8_t> &data);

        // Waits until the deadline for one datagram.
        std::optional<Datagram> ReceiveUntil(std::chrono::steady_clock::time_point deadline);
    };
}
