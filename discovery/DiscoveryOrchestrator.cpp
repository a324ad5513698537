#include "DiscoveryOrchestrator.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <map>
#include <thread>

namespace lanwatch::discovery
{
    const char *MethodName(ProbeMethod method)
    {
        switch (method)
        {
        case ProbeMethod::Arp:
            return "arp";
        case ProbeMethod::Mdns:
            return "mdns";
        case ProbeMethod::Echo:
            return "echo";
        }
        return "unknown";
    }

    const char *MethodTag(ProbeMethod method)
    {
        return method == ProbeMethod::Echo ? "icmp" : MethodName(method);
    }

    std::vector<MergedSighting> MergeProbeResults(const std::vector<ProbeResult> &results)
    {
        std::vector<ProbeResult> ordered = results;
        std::stable_sort(ordered.begin(), ordered.end(), [](const ProbeResult &a, const ProbeResult &b)
                         { return static_cast<int>(a.source) < static_cast<int>(b.source); });

        std::vector<MergedSighting> groups;
        std::map<std::string, size_t> by_mac;
        std::map<std::string, size_t> mac_group_by_ip;
        std::map<std::string, size_t> ip_only;

        auto merge_into = [](MergedSighting &group, const ProbeResult &r)
        {
            if (group.ip.empty())
                group.ip = r.ip;
            if (!group.name && r.name && !r.name->empty())
                group.name = r.name;
            group.tags.insert(MethodTag(r.source));
        };

        for (const auto &r : ordered)
        {
            if (r.ip.empty())
                continue;

            std::optional<std::string> mac;
            if (r.mac)
                mac = common::NormalizeMac(*r.mac);

            if (mac)
            {
                auto it = by_mac.find(*mac);
                if (it == by_mac.end())
                {
                    auto orphan = ip_only.find(r.ip);
                    size_t index;
                    if (orphan != ip_only.end())
                    {
                        // Address-only candidate gains its hardware address.
                        index = orphan->second;
                        ip_only.erase(orphan);
                    }
                    else
                    {
                        index = groups.size();
                        groups.emplace_back();
                    }
                    groups[index].mac = mac;
                    it = by_mac.emplace(*mac, index).first;
                    mac_group_by_ip.emplace(r.ip, index);
                }
                merge_into(groups[it->second], r);
                continue;
            }

            auto owner = mac_group_by_ip.find(r.ip);
            if (owner != mac_group_by_ip.end())
            {
                merge_into(groups[owner->second], r);
                continue;
            }

            auto it = ip_only.find(r.ip);
            if (it == ip_only.end())
            {
                it = ip_only.emplace(r.ip, groups.size()).first;
                groups.emplace_back();
            }
            merge_into(groups[it->second], r);
        }

        return groups;
    }

    size_t DiscoveryBatch::NewCount() const
    {
        return static_cast<size_t>(std::count_if(devices.begin(), devices.end(), [](const DiscoveredDevice &d)
                                                 { return d.is_new; }));
    }

    DiscoveryBatch ClassifySightings(const std::vector<MergedSighting> &sightings,
                                     const std::vector<common::Device> &snapshot,
                                     common::Timestamp now)
    {
        DiscoveryBatch batch;
        std::map<std::string, size_t> batch_index; // device id -> position in batch

        auto find_known = [&snapshot](const MergedSighting &s) -> const common::Device *
        {
            if (s.mac)
            {
                for (const auto &d : snapshot)
                {
                    if ((d.mac && *d.mac == *s.mac) || d.id == *s.mac)
                        return &d;
                }
                // An address-keyed record that now has a hardware address.
                for (const auto &d : snapshot)
                {
                    if (!d.mac && d.ip == s.ip)
                        return &d;
                }
                return nullptr;
            }

            for (const auto &d : snapshot)
            {
                if (d.id == s.ip)
                    return &d;
            }
            for (const auto &d : snapshot)
            {
                if (d.ip == s.ip)
                    return &d;
            }
            return nullptr;
        };

        for (const auto &s : sightings)
        {
            const common::Device *known = find_known(s);
            std::string id = known ? known->id : (s.mac ? *s.mac : s.ip);

            auto existing = batch_index.find(id);
            DiscoveredDevice *entry = nullptr;

            if (existing != batch_index.end())
            {
                entry = &batch.devices[existing->second];
            }
            else
            {
                DiscoveredDevice fresh;
                if (known)
                {
                    fresh.device = *known;
                }
                else
                {
                    fresh.device.id = id;
                    fresh.device.ip = s.ip;
                    fresh.device.mac = s.mac;
                    fresh.device.hostname = s.name;
                    fresh.device.first_seen = now;
                    fresh.is_new = true;
                }
                batch_index.emplace(id, batch.devices.size());
                batch.devices.push_back(fresh);
                entry = &batch.devices.back();
            }

            common::Device &device = entry->device;
            if (!entry->is_new)
            {
                // Hardware-address sightings own the network address.
                if (device.ip != s.ip && (s.mac || !device.mac))
                {
                    device.ip = s.ip;
                    entry->changed = true;
                }
                if (!device.mac && s.mac)
                {
                    device.mac = s.mac;
                    entry->changed = true;
                }
                if (!device.hostname && s.name)
                {
                    device.hostname = s.name;
                    entry->changed = true;
                }
            }
            else if (!device.hostname && s.name)
            {
                device.hostname = s.name;
            }

            device.last_seen = now;
            device.tags.insert(s.tags.begin(), s.tags.end());
        }

        return batch;
    }

    DiscoveryOrchestrator::DiscoveryOrchestrator(std::shared_ptr<Prober> arp,
                                                 std::shared_ptr<Prober> mdns,
                                                 std::shared_ptr<Prober> echo,
                                                 std::chrono::milliseconds grace)
        : m_slots{std::move(arp), std::move(mdns), std::move(echo)}, m_grace(grace)
    {
    }

    DiscoveryBatch DiscoveryOrchestrator::Discover(const common::AddressRange &range,
                                                   const std::string &interface_name,
                                                   std::chrono::milliseconds per_method_timeout,
                                                   const std::vector<common::Device> &snapshot,
                                                   size_t max_hosts)
    {
        const ProbeMethod methods[3] = {ProbeMethod::Arp, ProbeMethod::Mdns, ProbeMethod::Echo};
        ProbeRequest request{range, interface_name, per_method_timeout, max_hosts};

        std::vector<std::future<std::vector<ProbeResult>>> pending(3);
        for (int i = 0; i < 3; ++i)
        {
            if (!m_slots[i])
                continue;

            // Detached so a prober that overruns its deadline cannot hold the cycle.
            auto promise = std::make_shared<std::promise<std::vector<ProbeResult>>>();
            pending[i] = promise->get_future();
            std::shared_ptr<Prober> prober = m_slots[i];

            std::thread([prober, request, promise]()
                        {
                try
                {
                    promise->set_value(prober->Probe(request));
                }
                catch (...)
                {
                    promise->set_exception(std::current_exception());
                } })
                .detach();
        }

        auto deadline = std::chrono::steady_clock::now() + per_method_timeout + m_grace;

        std::vector<std::string> failed;
        std::vector<ProbeResult> collected;

        for (int i = 0; i < 3; ++i)
        {
            const char *name = MethodName(methods[i]);
            if (!pending[i].valid())
            {
                failed.push_back(name);
                continue;
            }

            if (pending[i].wait_until(deadline) != std::future_status::ready)
            {
                std::cerr << "[Discovery] " << name << " timed out\n";
                failed.push_back(name);
                continue;
            }

            try
            {
                auto results = pending[i].get();
                collected.insert(collected.end(), results.begin(), results.end());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Discovery] " << name << " failed: " << e.what() << "\n";
                failed.push_back(name);
            }
            catch (...)
            {
                std::cerr << "[Discovery] " << name << " failed with a non-standard exception\n";
                failed.push_back(name);
            }
        }

        DiscoveryBatch batch = ClassifySightings(MergeProbeResults(collected), snapshot, common::Clock::now());
        batch.failed_methods = failed;
        batch.degraded = !batch.failed_methods.empty();

        std::cout << "[Discovery] " << range.ToString() << ": " << batch.devices.size() << " devices ("
                  << batch.NewCount() << " new)" << (batch.degraded ? ", degraded" : "") << "\n";
        return batch;
    }
}
