#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Ber.hpp"
#include "ManagementClient.hpp"

namespace lanwatch::identify
{
    struct VarBind
    {
        ber::Oid oid;
        std::uint8_t type = ber::Null;
        ber::Tlv value;
    };

    struct SnmpPdu
    {
        std::uint8_t type = ber::GetRequest;
        std::int32_t request_id = 0;
        std::int32_t error_status = 0;
        std::int32_t error_index = 0;
        std::vector<VarBind> varbinds;
    };

    // SNMPv2c message: SEQUENCE { version 1, community, PDU }. Request varbinds carry NULL values.
    std::vector<std::uint8_t> EncodeSnmpMessage(const std::string &community, const SnmpPdu &pdu);
    std::optional<SnmpPdu> DecodeSnmpMessage(const std::vector<std::uint8_t> &data);

    // Value helpers; nullopt when the type does not carry that kind of value.
    std::optional<std::string> VarBindText(const VarBind &vb);
    std::optional<std::uint64_t> VarBindNumber(const VarBind &vb);

    struct SnmpOptions
    {
        std::string community = "public";
        std::uint16_t port = 161;
        std::chrono::milliseconds timeout{1000};
        size_t max_walk = 1024;
    };

    class SnmpClient : public ManagementClient
    {
    public:
        explicit SnmpClient(SnmpOptions options);

        std::optional<SystemInfo> Identify(const std::string &ip) override;
        std::vector<InterfaceEntry> InterfaceTable(const std::string &ip) override;

        // One request/response exchange. nullopt on timeout or an undecodable reply.
        std::optional<SnmpPdu> Request(const std::string &ip, std::uint8_t pdu_type, const std::vector<ber::Oid> &oids);

        // GETNEXT walk of a subtree.
        std::vector<VarBind> Walk(const std::string &ip, const ber::Oid &root);

    private:
        SnmpOptions m_options;
    };
}
