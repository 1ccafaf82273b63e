#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace net_discovery::common::snmp
{
    inline constexpr int VERSION_1 = 0;
    inline constexpr int VERSION_2C = 1;

    inline constexpr int ERROR_NONE = 0;
    inline constexpr int ERROR_NO_SUCH_NAME = 2;

    enum class PduType : std::uint8_t
    {
        GetRequest = 0xA0,
        GetNextRequest = 0xA1,
        Response = 0xA2
    };

    enum class ValueType : std::uint8_t
    {
        Integer = 0x02,
        OctetString = 0x04,
        Null = 0x05,
        ObjectId = 0x06,
        IpAddress = 0x40,
        Counter32 = 0x41,
        Gauge32 = 0x42,
        TimeTicks = 0x43,
        Opaque = 0x44,
        Counter64 = 0x46,
        NoSuchObject = 0x80,
        NoSuchInstance = 0x81,
        EndOfMibView = 0x82
    };

    struct VarBind
    {
        std::string oid;
        ValueType type = ValueType::Null;
        std::string value;

        // noSuchObject, noSuchInstance, endOfMibView
        bool IsException() const;
    };

    struct Message
    {
        int version = VERSION_2C;
        std::string community;
        PduType pdu_type = PduType::GetRequest;
        std::int32_t request_id = 0;
        int error_status = ERROR_NONE;
        int error_index = 0;
        std::vector<VarBind> varbinds;
    };

    std::vector<std::uint8_t> EncodeMessage(const Message &message);
    std::vector<std::uint8_t> EncodeRequest(int version, const std::string &community, PduType type,
                                            std::int32_t request_id, const std::string &oid);

    // Returns nullopt for anything that is not a well-formed SNMPv1/v2c message.
    std::optional<Message> DecodeMessage(const std::uint8_t *data, std::size_t size);

    std::vector<std::uint8_t> EncodeOid(const std::string &oid);
    std::optional<std::string> DecodeOid(const std::uint8_t *data, std::size_t size);

    // Numeric arc-by-arc ordering; -1, 0 or 1.
    int CompareOids(std::string_view lhs, std::string_view rhs);
    bool OidInSubtree(std::string_view oid, std::string_view root);
}
