#include <fcntl.h>
#include <sys/epoll.h>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <stdexcept>
#include <sys/socket.h>
#include <iostream>

#include "EventStreamServer.hpp"
#include <netinet/in.h>

namespace lanwatch::server
{
    using namespace lanwatch::protocol;

    namespace
    {
        constexpr int EPOLL_WAIT_MS = 50;
        constexpr int MAX_EVENTS_PER_PUMP = 256;
    }

    void EventStreamServer::LogOpenSSLErrors()
    {
        unsigned long err;
        while ((err = ERR_get_error()) != 0)
        {
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            std::cerr << "[StreamServer] OpenSSL: " << buf << "\n";
        }
    }

    void EventStreamServer::NonBlockingMode(int fd)
    {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    void EventStreamServer::EpollControlAdd(int fd)
    {
        struct epoll_event event;

        std::memset(&event, 0, sizeof(event));

        event.events = EPOLLIN;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1)
        {
            throw std::runtime_error("Failed to add FD to epoll");
        }
    }

    void EventStreamServer::EpollControlRemove(int fd)
    {
        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == -1)
        {
            std::cerr << "[StreamServer] Warning: Failed to remove FD " << fd << " from epoll" << std::endl;
        }
    }

    void EventStreamServer::DisconnectClient(int fd)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;

        ClientContext &ctx = it->second;
        if (ctx.subscription)
            m_hub.Unsubscribe(ctx.subscription);

        EpollControlRemove(fd);
        if (ctx.ssl_handle)
        {
            SSL_shutdown(ctx.ssl_handle);
            SSL_free(ctx.ssl_handle);
        }
        close(fd);
        registry.erase(it);

        std::cout << "[StreamServer] Client " << fd << " disconnected. Clients: " << registry.size() << std::endl;
    }

    void EventStreamServer::HandleNewConnection()
    {
        struct sockaddr clientAddress;
        socklen_t clientAddressLength = sizeof(clientAddress);
        int client_fd = accept(m_server_fd, &clientAddress, &clientAddressLength);
        if (client_fd == -1)
        {
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                std::cerr << "[StreamServer] accept failed: " << std::strerror(errno) << std::endl;
            return;
        }

        NonBlockingMode(client_fd);

        SSL *ssl_handle = SSL_new(m_ssl_ctx);
        if (!ssl_handle)
        {
            close(client_fd);
            LogOpenSSLErrors();
            return;
        }

        SSL_set_fd(ssl_handle, client_fd);
        SSL_set_mode(ssl_handle, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

        ClientContext &ctx = registry[client_fd];
        ctx.socketfd = client_fd;
        ctx.ssl_handle = ssl_handle;
        try
        {
            EpollControlAdd(client_fd);
        }
        catch (const std::runtime_error &e)
        {
            std::cerr << "[StreamServer] " << e.what() << " for client " << client_fd << std::endl;
            DisconnectClient(client_fd);
            return;
        }

        int ret = SSL_accept(ssl_handle);
        if (ret == 1)
        {
            OnHandshakeComplete(client_fd);
            return;
        }

        int ssl_error = SSL_get_error(ssl_handle, ret);
        if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE)
        {
            std::cout << "[StreamServer] New connection " << client_fd << ", handshake pending" << std::endl;
        }
        else
        {
            std::cerr << "[StreamServer] Fatal TLS handshake error on " << client_fd << ". Disconnecting." << std::endl;
            LogOpenSSLErrors();
            DisconnectClient(client_fd);
        }
    }

    void EventStreamServer::OnHandshakeComplete(int fd)
    {
        ClientContext &ctx = registry[fd];
        ctx.is_handshake_complete = true;
        ctx.subscription = m_hub.Subscribe();

        Hello hello;
        hello.server = "lanwatchd";
        hello.subscriber_id = static_cast<uint32_t>(ctx.subscription->Id());
        Enqueue(ctx, MessageType::Hello, EncodeHello(hello));

        std::cout << "[StreamServer] TLS handshake complete for client " << fd << std::endl;
        Flush(fd);
    }

    void EventStreamServer::HandleClientData(int fd)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;
        ClientContext &ctx = it->second;

        if (!ctx.is_handshake_complete)
        {
            int ret = SSL_accept(ctx.ssl_handle);
            if (ret == 1)
            {
                OnHandshakeComplete(fd);
                return;
            }

            int err = SSL_get_error(ctx.ssl_handle, ret);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                return;

            std::cerr << "[StreamServer] TLS handshake failed on " << fd << ". Error: " << err << std::endl;
            DisconnectClient(fd);
            return;
        }

        uint8_t temp_buffer[4096];

        while (true)
        {
            int count = SSL_read(ctx.ssl_handle, temp_buffer, sizeof(temp_buffer));

            if (count > 0)
            {
                ctx.reader.Feed(temp_buffer, count);
                continue;
            }

            int err = SSL_get_error(ctx.ssl_handle, count);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                break;

            DisconnectClient(fd);
            return;
        }

        lanwatch::common::Frame frame;
        while (true)
        {
            auto status = ctx.reader.Next(frame);
            if (status == lanwatch::common::FrameStatus::Incomplete)
                break;
            if (status == lanwatch::common::FrameStatus::Malformed)
            {
                std::cerr << "[StreamServer] Bad frame from client " << fd << ". Disconnecting." << std::endl;
                DisconnectClient(fd);
                return;
            }

            ProcessMessage(fd, frame.type, frame.payload);
            if (registry.find(fd) == registry.end())
                return;
        }
    }

    void EventStreamServer::ProcessMessage(int fd, MessageType type, const std::vector<uint8_t> &payload)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;

        switch (type)
        {
        case MessageType::Heartbeat:
            Enqueue(it->second, MessageType::Heartbeat, payload);
            Flush(fd);
            break;

        default:
            std::cout << "[StreamServer] Client " << fd << " sent unhandled message type "
                      << static_cast<int>(type) << std::endl;
            break;
        }
    }

    void EventStreamServer::Enqueue(ClientContext &ctx, MessageType type, const std::vector<uint8_t> &payload)
    {
        std::vector<uint8_t> frame = BuildFrame(type, payload);
        ctx.outbox.insert(ctx.outbox.end(), frame.begin(), frame.end());
    }

    bool EventStreamServer::Flush(int fd)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return false;
        ClientContext &ctx = it->second;

        size_t offset = 0;
        while (offset < ctx.outbox.size())
        {
            int n = SSL_write(ctx.ssl_handle, ctx.outbox.data() + offset, static_cast<int>(ctx.outbox.size() - offset));
            if (n > 0)
            {
                offset += static_cast<size_t>(n);
                continue;
            }

            int err = SSL_get_error(ctx.ssl_handle, n);
            if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                break;

            std::cerr << "[StreamServer] Write to client " << fd << " failed. Disconnecting." << std::endl;
            DisconnectClient(fd);
            return false;
        }

        ctx.outbox.erase(ctx.outbox.begin(), ctx.outbox.begin() + offset);
        return true;
    }

    void EventStreamServer::PumpEvents()
    {
        std::vector<int> fds;
        for (const auto &kv : registry)
            fds.push_back(kv.first);

        for (int fd : fds)
        {
            auto it = registry.find(fd);
            if (it == registry.end() || !it->second.is_handshake_complete || !it->second.subscription)
                continue;

            ClientContext &ctx = it->second;

            // A client that stops reading keeps its backlog in the hub queue, which drops oldest.
            for (int i = 0; i < MAX_EVENTS_PER_PUMP && ctx.outbox.size() < MAX_OUTBOX_BYTES; ++i)
            {
                auto event = ctx.subscription->TryNext();
                if (!event)
                    break;
                Enqueue(ctx, MessageTypeFor(*event), EncodeEvent(*event));
            }

            if (!ctx.outbox.empty())
                Flush(fd);
        }
    }

    EventStreamServer::EventStreamServer(int port, hub::EventHub &hub, std::string cert_path, std::string key_path)
        : m_server_fd(-1), m_epoll_fd(-1), m_port(port), m_running(false), m_ssl_ctx(nullptr),
          m_hub(hub), m_cert_path(std::move(cert_path)), m_key_path(std::move(key_path))
    {
    }

    EventStreamServer::~EventStreamServer()
    {
        std::vector<int> fds;
        for (const auto &kv : registry)
            fds.push_back(kv.first);
        for (int fd : fds)
            DisconnectClient(fd);

        if (m_server_fd != -1)
            close(m_server_fd);
        if (m_epoll_fd != -1)
            close(m_epoll_fd);
        if (m_ssl_ctx)
            SSL_CTX_free(m_ssl_ctx);
    }

    void EventStreamServer::Init()
    {
        m_ssl_ctx = SSL_CTX_new(TLS_server_method());
        if (m_ssl_ctx == nullptr)
        {
            LogOpenSSLErrors();
            throw std::runtime_error("Failed to create SSL context");
        }

        if (SSL_CTX_use_certificate_file(m_ssl_ctx, m_cert_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            LogOpenSSLErrors();
            throw std::runtime_error("Failed to load certificate '" + m_cert_path + "'");
        }

        if (SSL_CTX_use_PrivateKey_file(m_ssl_ctx, m_key_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            LogOpenSSLErrors();
            throw std::runtime_error("Failed to load private key '" + m_key_path + "'");
        }

        if (!SSL_CTX_check_private_key(m_ssl_ctx))
        {
            throw std::runtime_error("Private key does not match the certificate");
        }

        m_server_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_server_fd == -1)
        {
            throw std::runtime_error("Failed to create socket.");
        }

        int opt = 1;
        if (setsockopt(m_server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
        {
            throw std::runtime_error("Failed to set SO_REUSEADDR.");
        }

        NonBlockingMode(m_server_fd);

        struct sockaddr_in serverAddress;
        std::memset(&serverAddress, 0, sizeof(serverAddress));
        serverAddress.sin_family = AF_INET;
        serverAddress.sin_port = htons(m_port);
        serverAddress.sin_addr.s_addr = INADDR_ANY;

        if (bind(m_server_fd, (struct sockaddr *)&serverAddress, sizeof(serverAddress)) != 0)
        {
            throw std::runtime_error("Failed to bind stream port " + std::to_string(m_port) + ". Is the port taken?");
        }

        if ((listen(m_server_fd, SOMAXCONN)) != 0)
        {
            throw std::runtime_error("Failed to listen on stream socket.");
        }

        m_epoll_fd = epoll_create1(0);
        if (m_epoll_fd == -1)
        {
            throw std::runtime_error("Failed to create epoll file descriptor.");
        }

        EpollControlAdd(m_server_fd);
    }

    void EventStreamServer::Run()
    {
        m_running = true;

        std::cout << "[StreamServer] Listening on port " << m_port << std::endl;

        struct epoll_event ev[128];
        int count = 0;
        while (m_running)
        {
            if ((count = epoll_wait(m_epoll_fd, ev, 128, EPOLL_WAIT_MS)) == -1)
            {
                if (errno == EINTR)
                    continue;
                std::cerr << "[StreamServer] epoll_wait failed: " << std::strerror(errno) << std::endl;
                break;
            }

            for (int i = 0; i < count; i++)
            {
                int current_fd = ev[i].data.fd;
                try
                {
                    if (current_fd == m_server_fd)
                        HandleNewConnection();
                    else
                        HandleClientData(current_fd);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[StreamServer] Error on fd " << current_fd << ": " << e.what() << std::endl;
                    if (current_fd != m_server_fd)
                        DisconnectClient(current_fd);
                }
            }

            PumpEvents();
        }

        std::cout << "[StreamServer] Stopped" << std::endl;
    }
}
