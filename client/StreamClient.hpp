#pragma once

#include <string>
#include <vector>
#include <optional>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include "../common/protocol.hpp"
#include "../common/FrameReader.hpp"

namespace lanwatch::client
{
    // TLS connection to an lanwatchd event stream.
    class StreamClient
    {
    private:
        std::string m_host;
        int m_port;
        int m_socket_fd;

        SSL_CTX *m_ssl_ctx;
        SSL *m_ssl_handle;

        lanwatch::common::FrameReader m_reader;

        void InitSSL(const std::string &ca_path);
        void CleanupSSL();

    public:
        // Empty ca_path disables certificate verification. Throws std::runtime_error when TLS cannot be set up.
        StreamClient(std::string host, int port, const std::string &ca_path = "");
        ~StreamClient();

        StreamClient(const StreamClient &) = delete;
        StreamClient &operator=(const StreamClient &) = delete;

        bool Connect();
        void Disconnect();
        bool IsConnected() const { return m_socket_fd != -1 && m_ssl_handle != nullptr; }

        bool SendFrame(lanwatch::protocol::MessageType type, const std::vector<uint8_t> &payload);

        // Blocks up to timeout_ms for the next frame. False on timeout or when the connection closed;
        // check IsConnected() to tell them apart.
        bool ReadNextFrame(lanwatch::common::Frame &out, int timeout_ms);
    };
}
