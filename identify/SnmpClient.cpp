#include "SnmpClient.hpp"

#include "../common/UdpSocket.hpp"

#include <atomic>
#include <iostream>
#include <map>
#include <random>

namespace lanwatch::identify
{
    namespace
    {
        const ber::Oid OID_SYS_DESCR = {1, 3, 6, 1, 2, 1, 1, 1, 0};
        const ber::Oid OID_SYS_OBJECTID = {1, 3, 6, 1, 2, 1, 1, 2, 0};
        const ber::Oid OID_SYS_UPTIME = {1, 3, 6, 1, 2, 1, 1, 3, 0};
        const ber::Oid OID_SYS_CONTACT = {1, 3, 6, 1, 2, 1, 1, 4, 0};
        const ber::Oid OID_SYS_NAME = {1, 3, 6, 1, 2, 1, 1, 5, 0};
        const ber::Oid OID_SYS_LOCATION = {1, 3, 6, 1, 2, 1, 1, 6, 0};

        // ifTable columns
        const ber::Oid OID_IF_DESCR = {1, 3, 6, 1, 2, 1, 2, 2, 1, 2};
        const ber::Oid OID_IF_SPEED = {1, 3, 6, 1, 2, 1, 2, 2, 1, 5};
        const ber::Oid OID_IF_IN_OCTETS = {1, 3, 6, 1, 2, 1, 2, 2, 1, 10};
        const ber::Oid OID_IF_OUT_OCTETS = {1, 3, 6, 1, 2, 1, 2, 2, 1, 16};
        // ifXTable high-capacity counters
        const ber::Oid OID_IF_HC_IN_OCTETS = {1, 3, 6, 1, 2, 1, 31, 1, 1, 1, 6};
        const ber::Oid OID_IF_HC_OUT_OCTETS = {1, 3, 6, 1, 2, 1, 31, 1, 1, 1, 10};

        std::int32_t NextRequestId()
        {
            static std::atomic<std::int32_t> counter{[]
                                                     {
                                                         std::random_device rd;
                                                         return static_cast<std::int32_t>(rd() & 0x3FFFFFFF);
                                                     }()};
            return (counter++ & 0x7FFFFFFF);
        }

        bool IsException(std::uint8_t type)
        {
            return type == ber::NoSuchObject || type == ber::NoSuchInstance || type == ber::EndOfMibView;
        }

        // Column values keyed by the row index (last arc).
        std::map<std::uint32_t, VarBind> ByIndex(const std::vector<VarBind> &column)
        {
            std::map<std::uint32_t, VarBind> out;
            for (const auto &vb : column)
            {
                if (!vb.oid.empty())
                    out[vb.oid.back()] = vb;
            }
            return out;
        }
    }

    std::vector<std::uint8_t> EncodeSnmpMessage(const std::string &community, const SnmpPdu &pdu)
    {
        std::vector<std::uint8_t> varbind_list;
        for (const auto &vb : pdu.varbinds)
        {
            std::vector<std::uint8_t> entry;
            ber::AppendTlv(entry, ber::ObjectId, ber::EncodeOid(vb.oid));
            ber::AppendTlv(entry, ber::Null, {});
            ber::AppendTlv(varbind_list, ber::Sequence, entry);
        }

        std::vector<std::uint8_t> pdu_body;
        ber::AppendTlv(pdu_body, ber::Integer, ber::EncodeInteger(pdu.request_id));
        ber::AppendTlv(pdu_body, ber::Integer, ber::EncodeInteger(pdu.error_status));
        ber::AppendTlv(pdu_body, ber::Integer, ber::EncodeInteger(pdu.error_index));
        ber::AppendTlv(pdu_body, ber::Sequence, varbind_list);

        std::vector<std::uint8_t> message;
        ber::AppendTlv(message, ber::Integer, ber::EncodeInteger(1)); // v2c
        ber::AppendTlv(message, ber::OctetString, std::vector<std::uint8_t>(community.begin(), community.end()));
        ber::AppendTlv(message, pdu.type, pdu_body);

        std::vector<std::uint8_t> packet;
        ber::AppendTlv(packet, ber::Sequence, message);
        return packet;
    }

    std::optional<SnmpPdu> DecodeSnmpMessage(const std::vector<std::uint8_t> &data)
    {
        ber::Reader outer(data);
        auto message = outer.Next();
        if (!message || message->tag != ber::Sequence)
            return std::nullopt;

        ber::Reader fields(message->value);
        auto version = fields.Next();
        auto community = fields.Next();
        auto pdu_tlv = fields.Next();
        if (!version || version->tag != ber::Integer || !community || community->tag != ber::OctetString || !pdu_tlv)
            return std::nullopt;

        SnmpPdu pdu;
        pdu.type = pdu_tlv->tag;

        ber::Reader body(pdu_tlv->value);
        auto request_id = body.Next();
        auto error_status = body.Next();
        auto error_index = body.Next();
        auto list = body.Next();
        if (!request_id || !error_status || !error_index || !list || list->tag != ber::Sequence)
            return std::nullopt;

        auto rid = ber::DecodeInteger(*request_id);
        auto status = ber::DecodeInteger(*error_status);
        auto index = ber::DecodeInteger(*error_index);
        if (!rid || !status || !index)
            return std::nullopt;

        pdu.request_id = static_cast<std::int32_t>(*rid);
        pdu.error_status = static_cast<std::int32_t>(*status);
        pdu.error_index = static_cast<std::int32_t>(*index);

        ber::Reader bindings(list->value);
        while (!bindings.AtEnd())
        {
            auto entry = bindings.Next();
            if (!entry || entry->tag != ber::Sequence)
                return std::nullopt;

            ber::Reader parts(entry->value);
            auto name = parts.Next();
            auto value = parts.Next();
            if (!name || name->tag != ber::ObjectId || !value)
                return std::nullopt;

            auto oid = ber::DecodeOid(*name);
            if (!oid)
                return std::nullopt;

            VarBind vb;
            vb.oid = *oid;
            vb.type = value->tag;
            vb.value = *value;
            pdu.varbinds.push_back(std::move(vb));
        }

        return pdu;
    }

    std::optional<std::string> VarBindText(const VarBind &vb)
    {
        if (vb.type == ber::OctetString)
        {
            std::string text(vb.value.value.begin(), vb.value.value.end());
            while (!text.empty() && (text.back() == '\0' || text.back() == '\n' || text.back() == '\r'))
                text.pop_back();
            return text;
        }
        if (vb.type == ber::ObjectId)
        {
            auto oid = ber::DecodeOid(vb.value);
            if (oid)
                return ber::OidToString(*oid);
        }
        return std::nullopt;
    }

    std::optional<std::uint64_t> VarBindNumber(const VarBind &vb)
    {
        switch (vb.type)
        {
        case ber::Integer:
        {
            auto value = ber::DecodeInteger(vb.value);
            if (!value || *value < 0)
                return std::nullopt;
            return static_cast<std::uint64_t>(*value);
        }
        case ber::Counter32:
        case ber::Gauge32:
        case ber::TimeTicks:
        case ber::Counter64:
            return ber::DecodeUnsigned(vb.value);
        default:
            return std::nullopt;
        }
    }

    SnmpClient::SnmpClient(SnmpOptions options) : m_options(std::move(options))
    {
    }

    std::optional<SnmpPdu> SnmpClient::Request(const std::string &ip, std::uint8_t pdu_type, const std::vector<ber::Oid> &oids)
    {
        SnmpPdu request;
        request.type = pdu_type;
        request.request_id = NextRequestId();
        for (const auto &oid : oids)
        {
            VarBind vb;
            vb.oid = oid;
            request.varbinds.push_back(vb);
        }

        common::UdpSocket socket;
        if (!socket.SendTo(ip, m_options.port, EncodeSnmpMessage(m_options.community, request)))
            return std::nullopt;

        auto deadline = std::chrono::steady_clock::now() + m_options.timeout;
        while (auto dgram = socket.ReceiveUntil(deadline))
        {
            if (dgram->from_ip != ip)
                continue;

            auto response = DecodeSnmpMessage(dgram->data);
            if (response && response->type == ber::GetResponse && response->request_id == request.request_id)
                return response;
        }
        return std::nullopt;
    }

    std::vector<VarBind> SnmpClient::Walk(const std::string &ip, const ber::Oid &root)
    {
        std::vector<VarBind> results;
        ber::Oid current = root;

        while (results.size() < m_options.max_walk)
        {
            auto response = Request(ip, ber::GetNextRequest, {current});
            if (!response || response->error_status != 0 || response->varbinds.empty())
                break;

            const VarBind &vb = response->varbinds.front();
            if (IsException(vb.type) || !ber::OidStartsWith(vb.oid, root) || vb.oid <= current)
                break;

            results.push_back(vb);
            current = vb.oid;
        }
        return results;
    }

    std::optional<SystemInfo> SnmpClient::Identify(const std::string &ip)
    {
        std::optional<SnmpPdu> response;
        try
        {
            response = Request(ip, ber::GetRequest,
                               {OID_SYS_NAME, OID_SYS_DESCR, OID_SYS_UPTIME, OID_SYS_CONTACT, OID_SYS_LOCATION, OID_SYS_OBJECTID});
        }
        catch (const std::exception &e)
        {
            std::cerr << "[SNMP] Query to " << ip << " failed: " << e.what() << "\n";
            return std::nullopt;
        }

        if (!response || response->error_status != 0)
            return std::nullopt;

        SystemInfo info;
        for (const auto &vb : response->varbinds)
        {
            if (IsException(vb.type))
                continue;

            auto text = VarBindText(vb);
            if (vb.oid == OID_SYS_NAME && text && !text->empty())
                info.system_name = text;
            else if (vb.oid == OID_SYS_DESCR && text && !text->empty())
                info.system_description = text;
            else if (vb.oid == OID_SYS_CONTACT && text && !text->empty())
                info.contact = text;
            else if (vb.oid == OID_SYS_LOCATION && text && !text->empty())
                info.location = text;
            else if (vb.oid == OID_SYS_OBJECTID && text)
                info.object_id = text;
            else if (vb.oid == OID_SYS_UPTIME)
                info.uptime_ticks = VarBindNumber(vb);
        }
        return info;
    }

    std::vector<InterfaceEntry> SnmpClient::InterfaceTable(const std::string &ip)
    {
        std::vector<InterfaceEntry> table;
        try
        {
            auto in_octets = ByIndex(Walk(ip, OID_IF_IN_OCTETS));
            if (in_octets.empty())
                return table;

            auto descr = ByIndex(Walk(ip, OID_IF_DESCR));
            auto speed = ByIndex(Walk(ip, OID_IF_SPEED));
            auto out_octets = ByIndex(Walk(ip, OID_IF_OUT_OCTETS));
            auto hc_in = ByIndex(Walk(ip, OID_IF_HC_IN_OCTETS));
            auto hc_out = ByIndex(Walk(ip, OID_IF_HC_OUT_OCTETS));

            for (const auto &kv : in_octets)
            {
                InterfaceEntry entry;
                entry.if_index = kv.first;

                auto d = descr.find(kv.first);
                if (d != descr.end())
                    entry.if_descr = VarBindText(d->second).value_or("");
                auto s = speed.find(kv.first);
                if (s != speed.end())
                    entry.if_speed = VarBindNumber(s->second).value_or(0);

                auto hin = hc_in.find(kv.first);
                auto hout = hc_out.find(kv.first);
                if (hin != hc_in.end() && hout != hc_out.end())
                {
                    auto in_value = VarBindNumber(hin->second);
                    auto out_value = VarBindNumber(hout->second);
                    if (!in_value || !out_value)
                        continue;
                    entry.in_octets = *in_value;
                    entry.out_octets = *out_value;
                    entry.counter_width = 64;
                }
                else
                {
                    auto o = out_octets.find(kv.first);
                    auto in_value = VarBindNumber(kv.second);
                    if (o == out_octets.end() || !in_value)
                        continue;
                    auto out_value = VarBindNumber(o->second);
                    if (!out_value)
                        continue;
                    entry.in_octets = *in_value;
                    entry.out_octets = *out_value;
                    entry.counter_width = 32;
                }

                table.push_back(entry);
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[SNMP] Interface walk on " << ip << " failed: " << e.what() << "\n";
        }
        return table;
    }
}
