#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <sys/epoll.h>
#include <vector>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include "../common/FrameReader.hpp"
#include "../common/protocol.hpp"
#include "../hub/EventHub.hpp"

namespace lanwatch::server
{
    struct ClientContext
    {
        int socketfd = -1;
        SSL *ssl_handle = nullptr;
        lanwatch::common::FrameReader reader;
        bool is_handshake_complete = false;
        hub::SubscriptionPtr subscription;
        std::vector<uint8_t> outbox;
    };

    // TLS event stream. Every connection is a hub subscriber and receives a hello frame followed
    // by one frame per event, in publish order.
    class EventStreamServer
    {
    private:
        int m_server_fd;
        int m_epoll_fd;
        int m_port;
        std::atomic<bool> m_running;
        std::map<int, ClientContext> registry;

        SSL_CTX *m_ssl_ctx;
        hub::EventHub &m_hub;
        std::string m_cert_path;
        std::string m_key_path;

        void LogOpenSSLErrors();

        void NonBlockingMode(int fd);
        void EpollControlAdd(int fd);
        void EpollControlRemove(int fd);
        void DisconnectClient(int fd);

        void HandleNewConnection();
        void HandleClientData(int fd);
        void OnHandshakeComplete(int fd);

        void ProcessMessage(int fd, lanwatch::protocol::MessageType type, const std::vector<uint8_t> &payload);

        void Enqueue(ClientContext &ctx, lanwatch::protocol::MessageType type, const std::vector<uint8_t> &payload);
        // False when the connection failed and was closed.
        bool Flush(int fd);
        void PumpEvents();

    public:
        static constexpr size_t MAX_OUTBOX_BYTES = 4 * 1024 * 1024;

        EventStreamServer(int port, hub::EventHub &hub, std::string cert_path, std::string key_path);

        ~EventStreamServer();

        EventStreamServer(const EventStreamServer &) = delete;
        EventStreamServer &operator=(const EventStreamServer &) = delete;

        // Throws std::runtime_error when TLS or the listening socket cannot be set up.
        void Init();
        // Blocks until Stop().
        void Run();
        void Stop() { m_running = false; }

        size_t ClientCount() const { return registry.size(); }
    };
}
