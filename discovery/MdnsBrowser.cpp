#include "MdnsBrowser.hpp"

#include "../common/UdpSocket.hpp"

#include <iostream>
#include <map>
#include <stdexcept>

namespace lanwatch::discovery
{
    namespace
    {
        const char *MDNS_GROUP = "224.0.0.251";
        constexpr std::uint16_t MDNS_PORT = 5353;
        const char *SERVICES_META = "_services._dns-sd._udp.local";

        std::string StripLocal(std::string name)
        {
            while (!name.empty() && name.back() == '.')
                name.pop_back();
            const std::string suffix = ".local";
            if (name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0)
                name.erase(name.size() - suffix.size());
            return name;
        }

        std::vector<common::dns::ResourceRecord> AllRecords(const common::dns::Message &msg)
        {
            std::vector<common::dns::ResourceRecord> all = msg.answers;
            all.insert(all.end(), msg.additionals.begin(), msg.additionals.end());
            return all;
        }

        // Sends one query and gathers every response until the deadline.
        std::vector<common::Datagram> Query(const std::vector<common::dns::Question> &questions,
                                            std::chrono::steady_clock::time_point deadline)
        {
            std::vector<common::Datagram> replies;
            common::UdpSocket socket;
            socket.SetMulticastTtl(255);

            if (!socket.SendTo(MDNS_GROUP, MDNS_PORT, common::dns::EncodeQuery(0, questions, false)))
                throw std::runtime_error("failed to send mDNS query");

            while (auto dgram = socket.ReceiveUntil(deadline))
                replies.push_back(std::move(*dgram));
            return replies;
        }
    }

    std::vector<std::string> MdnsBrowser::FallbackServiceTypes()
    {
        return {"_http._tcp.local", "_workstation._tcp.local", "_ssh._tcp.local"};
    }

    std::set<std::string> CollectServiceTypes(const common::dns::Message &msg)
    {
        std::set<std::string> types;
        for (const auto &rr : AllRecords(msg))
        {
            if (rr.type == common::dns::PTR && rr.name == SERVICES_META && !rr.target.empty())
                types.insert(rr.target);
        }
        return types;
    }

    void CollectHosts(const common::dns::Message &msg, const std::string &responder_ip, std::vector<ProbeResult> &out)
    {
        auto records = AllRecords(msg);

        std::map<std::string, std::string> addresses;
        for (const auto &rr : records)
        {
            if (rr.type == common::dns::A && !rr.target.empty())
                addresses[rr.name] = rr.target;
        }

        std::set<std::string> reported;
        for (const auto &rr : records)
        {
            if (rr.type != common::dns::SRV || rr.target.empty() || reported.count(rr.target))
                continue;

            auto it = addresses.find(rr.target);
            ProbeResult result;
            result.ip = it != addresses.end() ? it->second : responder_ip;
            result.name = StripLocal(rr.target);
            result.source = ProbeMethod::Mdns;
            out.push_back(result);
            reported.insert(rr.target);
        }

        // Address records without a service still name a host.
        for (const auto &kv : addresses)
        {
            if (reported.count(kv.first))
                continue;
            ProbeResult result;
            result.ip = kv.second;
            result.name = StripLocal(kv.first);
            result.source = ProbeMethod::Mdns;
            out.push_back(result);
        }
    }

    std::vector<ProbeResult> MdnsBrowser::Probe(const ProbeRequest &request)
    {
        auto start = std::chrono::steady_clock::now();
        auto half = request.timeout / 2;

        std::set<std::string> service_types;
        for (const auto &dgram : Query({{SERVICES_META, common::dns::PTR, common::dns::CLASS_IN}}, start + half))
        {
            auto msg = common::dns::Decode(dgram.data);
            if (!msg || !msg->IsResponse())
                continue;
            auto types = CollectServiceTypes(*msg);
            service_types.insert(types.begin(), types.end());
        }

        if (service_types.empty())
        {
            auto fallback = FallbackServiceTypes();
            service_types.insert(fallback.begin(), fallback.end());
        }

        std::vector<common::dns::Question> questions;
        for (const auto &type : service_types)
        {
            if (questions.size() >= MAX_SERVICE_TYPES)
                break;
            questions.push_back({type, common::dns::PTR, common::dns::CLASS_IN});
        }

        std::vector<ProbeResult> raw;
        for (const auto &dgram : Query(questions, start + request.timeout))
        {
            auto msg = common::dns::Decode(dgram.data);
            if (!msg || !msg->IsResponse())
                continue;
            CollectHosts(*msg, dgram.from_ip, raw);
        }

        // One result per address, first name wins.
        std::map<std::string, ProbeResult> by_ip;
        for (const auto &result : raw)
        {
            try
            {
                if (!request.range.Contains(common::Ipv4FromString(result.ip)))
                    continue;
            }
            catch (const std::invalid_argument &)
            {
                continue;
            }
            by_ip.emplace(result.ip, result);
        }

        std::vector<ProbeResult> results;
        for (auto &kv : by_ip)
            results.push_back(kv.second);

        std::cout << "[mDNS] Browsed " << questions.size() << " service types, " << results.size() << " hosts\n";
        return results;
    }
}
