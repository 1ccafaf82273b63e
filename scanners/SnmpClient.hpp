#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "../common/ScanConfig.hpp"
#include "../common/SnmpCodec.hpp"
#include "../common/Types.hpp"

namespace net_discovery::scanners
{
    struct SnmpReply
    {
        int error_status = common::snmp::ERROR_NONE;
        common::snmp::VarBind varbind;
    };

    class SnmpTransport
    {
    public:
        virtual ~SnmpTransport() = default;

        // nullopt when nothing answered in time (silent host or rejected community).
        // Throws NetworkError when the request could not be sent at all.
        virtual std::optional<SnmpReply> Get(const std::string &ip, const common::SnmpCredential &credential,
                                             const std::string &oid, std::chrono::milliseconds timeout) = 0;

        virtual std::optional<SnmpReply> GetNext(const std::string &ip, const common::SnmpCredential &credential,
                                                 const std::string &oid, std::chrono::milliseconds timeout) = 0;
    };

    // SNMPv1/v2c over UDP, one socket per request so workers can share an instance.
    class SnmpClient : public SnmpTransport
    {
    public:
        explicit SnmpClient(int port = common::SNMP_PORT);

        std::optional<SnmpReply> Get(const std::string &ip, const common::SnmpCredential &credential,
                                     const std::string &oid, std::chrono::milliseconds timeout) override;

        std::optional<SnmpReply> GetNext(const std::string &ip, const common::SnmpCredential &credential,
                                         const std::string &oid, std::chrono::milliseconds timeout) override;

    private:
        std::optional<SnmpReply> Request(const std::string &ip, const common::SnmpCredential &credential,
                                         common::snmp::PduType type, const std::string &oid,
                                         std::chrono::milliseconds timeout);

        int m_port;
        std::atomic<std::int32_t> m_next_request_id;
    };
}
