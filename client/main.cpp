#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>

#include "../common/Event.hpp"
#include "../common/protocol.hpp"
#include "StreamClient.hpp"

namespace
{
    std::atomic<bool> g_stop{false};

    void HandleSignal(int)
    {
        g_stop = true;
    }

    bool ParseOption(const std::string &arg, const std::string &key, std::string &value)
    {
        std::string prefix = "--" + key + "=";
        if (arg.compare(0, prefix.size(), prefix) != 0)
            return false;
        value = arg.substr(prefix.size());
        return true;
    }
}

int main(int argc, char *argv[])
{
    using namespace lanwatch;

    std::string host = "127.0.0.1";
    std::string port_text = "8443";
    std::string ca_path;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (ParseOption(arg, "host", host) || ParseOption(arg, "port", port_text) || ParseOption(arg, "ca", ca_path))
            continue;

        std::cerr << "Usage: lanwatch-tail [--host=127.0.0.1] [--port=8443] [--ca=certs/ca.crt]\n";
        return 2;
    }

    int port = 0;
    try
    {
        port = std::stoi(port_text);
    }
    catch (const std::exception &)
    {
        std::cerr << "Invalid port: " << port_text << "\n";
        return 2;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    try
    {
        client::StreamClient stream(host, port, ca_path);
        if (!stream.Connect())
            return 1;

        auto last_heartbeat = std::chrono::steady_clock::now();

        while (!g_stop && stream.IsConnected())
        {
            common::Frame frame;
            if (!stream.ReadNextFrame(frame, 500))
            {
                if (std::chrono::steady_clock::now() - last_heartbeat > std::chrono::seconds(30))
                {
                    stream.SendFrame(protocol::MessageType::Heartbeat, {});
                    last_heartbeat = std::chrono::steady_clock::now();
                }
                continue;
            }

            if (frame.type == protocol::MessageType::Hello)
            {
                auto hello = protocol::DecodeHello(frame.payload);
                if (hello)
                    std::cout << "[Tail] " << hello->server << " protocol v" << hello->version
                              << ", subscriber " << hello->subscriber_id << std::endl;
                continue;
            }
            if (frame.type == protocol::MessageType::Heartbeat)
                continue;

            auto event = protocol::DecodeEvent(frame.type, frame.payload);
            if (!event)
            {
                std::cerr << "[Tail] Undecodable frame type " << static_cast<int>(frame.type) << "\n";
                continue;
            }
            std::cout << common::ToUnixMillis(std::chrono::system_clock::now()) << " " << common::DescribeEvent(*event) << std::endl;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal: " << e.what() << '\n';
        return -1;
    }

    return 0;
}
