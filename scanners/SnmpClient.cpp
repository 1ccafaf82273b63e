#include "SnmpClient.hpp"
#include "../common/ScanErrors.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <openssl/rand.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace net_discovery::scanners
{
    namespace
    {
        constexpr std::size_t MAX_DATAGRAM = 65535;

        class UdpSocket
        {
        public:
            UdpSocket() : m_fd(socket(AF_INET, SOCK_DGRAM, 0)) {}
            ~UdpSocket()
            {
                if (m_fd >= 0)
                    close(m_fd);
            }

            UdpSocket(const UdpSocket &) = delete;
            UdpSocket &operator=(const UdpSocket &) = delete;

            int Fd() const { return m_fd; }

        private:
            int m_fd;
        };

        std::int32_t InitialRequestId()
        {
            std::uint32_t seed = 0;
            if (RAND_bytes(reinterpret_cast<unsigned char *>(&seed), sizeof(seed)) != 1)
            {
                std::cerr << "[SNMP] OpenSSL RNG failed, seeding request ids from the clock.\n";
                seed = static_cast<std::uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count());
            }
            return static_cast<std::int32_t>(seed & 0x3FFFFFFF) + 1;
        }

        int WireVersion(common::SnmpVersion version)
        {
            return version == common::SnmpVersion::V1 ? common::snmp::VERSION_1 : common::snmp::VERSION_2C;
        }
    }

    SnmpClient::SnmpClient(int port) : m_port(port), m_next_request_id(InitialRequestId()) {}

    std::optional<SnmpReply> SnmpClient::Get(const std::string &ip, const common::SnmpCredential &credential,
                                             const std::string &oid, std::chrono::milliseconds timeout)
    {
        return Request(ip, credential, common::snmp::PduType::GetRequest, oid, timeout);
    }

    std::optional<SnmpReply> SnmpClient::GetNext(const std::string &ip, const common::SnmpCredential &credential,
                                                 const std::string &oid, std::chrono::milliseconds timeout)
    {
        return Request(ip, credential, common::snmp::PduType::GetNextRequest, oid, timeout);
    }

    std::optional<SnmpReply> SnmpClient::Request(const std::string &ip, const common::SnmpCredential &credential,
                                                 common::snmp::PduType type, const std::string &oid,
                                                 std::chrono::milliseconds timeout)
    {
        struct sockaddr_in servaddr;
        std::memset(&servaddr, 0, sizeof(servaddr));
        servaddr.sin_family = AF_INET;
        servaddr.sin_port = htons(static_cast<uint16_t>(m_port));
        if (inet_pton(AF_INET, ip.c_str(), &servaddr.sin_addr) != 1)
            throw common::NetworkError("invalid SNMP target '" + ip + "'");

        UdpSocket sock;
        if (sock.Fd() < 0)
            throw common::NetworkError(std::string("socket: ") + std::strerror(errno));

        std::int32_t request_id = m_next_request_id.fetch_add(1) & 0x7FFFFFFF;
        std::vector<std::uint8_t> packet = common::snmp::EncodeRequest(WireVersion(credential.version),
                                                                       credential.community, type, request_id, oid);

        ssize_t sent = sendto(sock.Fd(), packet.data(), packet.size(), 0,
                              reinterpret_cast<const struct sockaddr *>(&servaddr), sizeof(servaddr));
        if (sent < 0)
            throw common::NetworkError("sendto " + ip + ": " + std::strerror(errno));

        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::vector<std::uint8_t> buffer(MAX_DATAGRAM);

        while (true)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0)
                return std::nullopt;

            struct pollfd pfd = {sock.Fd(), POLLIN, 0};
            int ready = poll(&pfd, 1, static_cast<int>(left.count()));
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                throw common::NetworkError(std::string("poll: ") + std::strerror(errno));
            }
            if (ready == 0)
                return std::nullopt;

            struct sockaddr_in from;
            socklen_t len = sizeof(from);
            ssize_t n = recvfrom(sock.Fd(), buffer.data(), buffer.size(), 0,
                                 reinterpret_cast<struct sockaddr *>(&from), &len);
            if (n < 0)
            {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                // ICMP port unreachable surfaces here; the agent is simply not listening.
                if (errno == ECONNREFUSED)
                    return std::nullopt;
                throw common::NetworkError("recvfrom " + ip + ": " + std::strerror(errno));
            }

            if (from.sin_addr.s_addr != servaddr.sin_addr.s_addr)
                continue;

            auto message = common::snmp::DecodeMessage(buffer.data(), static_cast<std::size_t>(n));
            if (!message || message->pdu_type != common::snmp::PduType::Response ||
                message->request_id != request_id || message->community != credential.community)
                continue;

            SnmpReply reply;
            reply.error_status = message->error_status;
            if (!message->varbinds.empty())
                reply.varbind = message->varbinds.front();
            else
                reply.varbind.oid = oid;
            return reply;
        }
    }
}
