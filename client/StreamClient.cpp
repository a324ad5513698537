#include "StreamClient.hpp"
#include <iostream>
#include <stdexcept>
#include <unistd.h>
#include <arpa/inet.h>
#include <cstring>
#include <vector>
#include <poll.h>
#include <fcntl.h>

namespace lanwatch::client
{

    static bool wait_fd(int fd, short events, int timeout_ms)
    {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;

        int r = poll(&pfd, 1, timeout_ms);
        return r > 0;
    }

    static bool ssl_write_all(SSL *ssl, int fd, const uint8_t *data, size_t len)
    {
        size_t off = 0;
        while (off < len)
        {
            int n = SSL_write(ssl, data + off, static_cast<int>(len - off));
            if (n > 0)
            {
                off += static_cast<size_t>(n);
                continue;
            }

            int err = SSL_get_error(ssl, n);
            if (err == SSL_ERROR_WANT_READ)
            {
                if (!wait_fd(fd, POLLIN, 5000))
                    return false;
                continue;
            }
            if (err == SSL_ERROR_WANT_WRITE)
            {
                if (!wait_fd(fd, POLLOUT, 5000))
                    return false;
                continue;
            }

            return false;
        }
        return true;
    }

    StreamClient::StreamClient(std::string host, int port, const std::string &ca_path)
        : m_host(std::move(host)), m_port(port), m_socket_fd(-1), m_ssl_ctx(nullptr), m_ssl_handle(nullptr)
    {
        InitSSL(ca_path);
    }

    StreamClient::~StreamClient()
    {
        Disconnect();
        CleanupSSL();
    }

    void StreamClient::InitSSL(const std::string &ca_path)
    {
        m_ssl_ctx = SSL_CTX_new(TLS_client_method());
        if (!m_ssl_ctx)
        {
            ERR_print_errors_fp(stderr);
            throw std::runtime_error("Unable to create SSL context");
        }

        if (ca_path.empty())
        {
            SSL_CTX_set_verify(m_ssl_ctx, SSL_VERIFY_NONE, nullptr);
            return;
        }

        if (SSL_CTX_load_verify_locations(m_ssl_ctx, ca_path.c_str(), nullptr) <= 0)
        {
            ERR_print_errors_fp(stderr);
            throw std::runtime_error("Failed to load CA certificate '" + ca_path + "'");
        }
        SSL_CTX_set_verify(m_ssl_ctx, SSL_VERIFY_PEER, nullptr);
    }

    void StreamClient::CleanupSSL()
    {
        if (m_ssl_ctx)
        {
            SSL_CTX_free(m_ssl_ctx);
            m_ssl_ctx = nullptr;
        }
    }

    bool StreamClient::Connect()
    {
        m_socket_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_socket_fd < 0)
        {
            perror("Socket creation failed");
            return false;
        }

        struct sockaddr_in serv_addr;
        std::memset(&serv_addr, 0, sizeof(serv_addr));
        serv_addr.sin_family = AF_INET;
        serv_addr.sin_port = htons(m_port);

        if (inet_pton(AF_INET, m_host.c_str(), &serv_addr.sin_addr) <= 0)
        {
            std::cerr << "[Tail] Invalid address " << m_host << std::endl;
            Disconnect();
            return false;
        }

        if (connect(m_socket_fd, (struct sockaddr *)&serv_addr, sizeof(serv_addr)) < 0)
        {
            perror("Connection failed");
            Disconnect();
            return false;
        }

        m_ssl_handle = SSL_new(m_ssl_ctx);
        SSL_set_fd(m_ssl_handle, m_socket_fd);

        if (SSL_connect(m_ssl_handle) <= 0)
        {
            ERR_print_errors_fp(stderr);
            Disconnect();
            return false;
        }

        // Reads below wait with poll, so the socket must not block.
        fcntl(m_socket_fd, F_SETFL, fcntl(m_socket_fd, F_GETFL, 0) | O_NONBLOCK);

        std::cout << "[Tail] Connected to " << m_host << ":" << m_port << " (" << SSL_get_cipher(m_ssl_handle) << ")" << std::endl;
        return true;
    }

    void StreamClient::Disconnect()
    {
        if (m_ssl_handle)
        {
            SSL_shutdown(m_ssl_handle);
            SSL_free(m_ssl_handle);
            m_ssl_handle = nullptr;
        }
        if (m_socket_fd != -1)
        {
            close(m_socket_fd);
            m_socket_fd = -1;
        }
        m_reader.Reset();
    }

    bool StreamClient::SendFrame(lanwatch::protocol::MessageType type, const std::vector<uint8_t> &payload)
    {
        if (!IsConnected())
            return false;

        std::vector<uint8_t> frame = lanwatch::protocol::BuildFrame(type, payload);
        return ssl_write_all(m_ssl_handle, m_socket_fd, frame.data(), frame.size());
    }

    bool StreamClient::ReadNextFrame(lanwatch::common::Frame &out, int timeout_ms)
    {
        if (!m_ssl_handle)
            return false;

        uint8_t tmp[4096];

        while (true)
        {
            auto status = m_reader.Next(out);
            if (status == lanwatch::common::FrameStatus::Ready)
                return true;
            if (status == lanwatch::common::FrameStatus::Malformed)
            {
                std::cerr << "[Tail] Invalid frame header from server.\n";
                Disconnect();
                return false;
            }

            int n = SSL_read(m_ssl_handle, tmp, sizeof(tmp));
            if (n > 0)
            {
                m_reader.Feed(tmp, static_cast<size_t>(n));
                continue;
            }

            int err = SSL_get_error(m_ssl_handle, n);
            if (err == SSL_ERROR_ZERO_RETURN || n == 0)
            {
                std::cerr << "[Tail] Server closed connection.\n";
                Disconnect();
                return false;
            }
            if (err == SSL_ERROR_WANT_READ)
            {
                if (!wait_fd(m_socket_fd, POLLIN, timeout_ms))
                    return false;
                continue;
            }
            if (err == SSL_ERROR_WANT_WRITE)
            {
                if (!wait_fd(m_socket_fd, POLLOUT, timeout_ms))
                    return false;
                continue;
            }

            std::cerr << "[Tail] SSL_read fatal error: " << err << "\n";
            Disconnect();
            return false;
        }
    }
}
