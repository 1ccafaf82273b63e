#include "SnmpCodec.hpp"

#include <iomanip>
#include <sstream>

namespace net_discovery::common::snmp
{
    namespace
    {
        constexpr std::uint8_t TAG_SEQUENCE = 0x30;

        void AppendLength(std::vector<std::uint8_t> &buf, std::size_t length)
        {
            if (length < 0x80)
            {
                buf.push_back(static_cast<std::uint8_t>(length));
                return;
            }

            std::vector<std::uint8_t> bytes;
            while (length > 0)
            {
                bytes.insert(bytes.begin(), static_cast<std::uint8_t>(length & 0xFF));
                length >>= 8;
            }
            buf.push_back(static_cast<std::uint8_t>(0x80 | bytes.size()));
            buf.insert(buf.end(), bytes.begin(), bytes.end());
        }

        void AppendTLV(std::vector<std::uint8_t> &buf, std::uint8_t type, const std::vector<std::uint8_t> &value)
        {
            buf.push_back(type);
            AppendLength(buf, value.size());
            buf.insert(buf.end(), value.begin(), value.end());
        }

        void AppendInteger(std::vector<std::uint8_t> &buf, std::int64_t value)
        {
            std::vector<std::uint8_t> bytes;
            do
            {
                bytes.insert(bytes.begin(), static_cast<std::uint8_t>(value & 0xFF));
                value >>= 8;
            } while (!((value == 0 && !(bytes.front() & 0x80)) || (value == -1 && (bytes.front() & 0x80))));
            AppendTLV(buf, static_cast<std::uint8_t>(ValueType::Integer), bytes);
        }

        void AppendUnsigned(std::vector<std::uint8_t> &buf, std::uint8_t type, std::uint64_t value)
        {
            std::vector<std::uint8_t> bytes;
            do
            {
                bytes.insert(bytes.begin(), static_cast<std::uint8_t>(value & 0xFF));
                value >>= 8;
            } while (value > 0);
            if (bytes.front() & 0x80)
                bytes.insert(bytes.begin(), 0x00);
            AppendTLV(buf, type, bytes);
        }

        void AppendString(std::vector<std::uint8_t> &buf, const std::string &str)
        {
            std::vector<std::uint8_t> bytes(str.begin(), str.end());
            AppendTLV(buf, static_cast<std::uint8_t>(ValueType::OctetString), bytes);
        }

        void AppendValue(std::vector<std::uint8_t> &buf, const VarBind &vb)
        {
            switch (vb.type)
            {
            case ValueType::Integer:
                AppendInteger(buf, std::stoll(vb.value));
                break;
            case ValueType::OctetString:
            case ValueType::Opaque:
                AppendTLV(buf, static_cast<std::uint8_t>(vb.type),
                          std::vector<std::uint8_t>(vb.value.begin(), vb.value.end()));
                break;
            case ValueType::ObjectId:
                AppendTLV(buf, static_cast<std::uint8_t>(ValueType::ObjectId), EncodeOid(vb.value));
                break;
            case ValueType::IpAddress:
            {
                std::vector<std::uint8_t> octets;
                std::stringstream ss(vb.value);
                std::string part;
                while (std::getline(ss, part, '.'))
                    octets.push_back(static_cast<std::uint8_t>(std::stoi(part)));
                AppendTLV(buf, static_cast<std::uint8_t>(ValueType::IpAddress), octets);
                break;
            }
            case ValueType::Counter32:
            case ValueType::Gauge32:
            case ValueType::TimeTicks:
            case ValueType::Counter64:
                AppendUnsigned(buf, static_cast<std::uint8_t>(vb.type), std::stoull(vb.value));
                break;
            case ValueType::Null:
            case ValueType::NoSuchObject:
            case ValueType::NoSuchInstance:
            case ValueType::EndOfMibView:
                buf.push_back(static_cast<std::uint8_t>(vb.type));
                buf.push_back(0x00);
                break;
            }
        }

        class Reader
        {
        public:
            Reader(const std::uint8_t *data, std::size_t size) : m_data(data), m_size(size), m_pos(0) {}

            bool AtEnd() const { return m_pos >= m_size; }

            // Reads one TLV header; value bytes are left in place.
            bool ReadHeader(std::uint8_t &tag, std::size_t &length)
            {
                if (m_pos + 2 > m_size)
                    return false;
                tag = m_data[m_pos++];

                std::uint8_t first = m_data[m_pos++];
                if (first < 0x80)
                {
                    length = first;
                }
                else
                {
                    std::size_t count = first & 0x7F;
                    if (count == 0 || count > 4 || m_pos + count > m_size)
                        return false;
                    length = 0;
                    for (std::size_t i = 0; i < count; ++i)
                        length = (length << 8) | m_data[m_pos++];
                }
                return m_pos + length <= m_size;
            }

            bool Expect(std::uint8_t expected, std::size_t &length)
            {
                std::uint8_t tag = 0;
                return ReadHeader(tag, length) && tag == expected;
            }

            const std::uint8_t *Take(std::size_t length)
            {
                const std::uint8_t *p = m_data + m_pos;
                m_pos += length;
                return p;
            }

            bool ReadInteger(std::int64_t &out)
            {
                std::size_t length = 0;
                if (!Expect(static_cast<std::uint8_t>(ValueType::Integer), length) || length == 0 || length > 8)
                    return false;
                out = ToSigned(Take(length), length);
                return true;
            }

            static std::int64_t ToSigned(const std::uint8_t *p, std::size_t length)
            {
                std::int64_t value = (p[0] & 0x80) ? -1 : 0;
                for (std::size_t i = 0; i < length; ++i)
                    value = static_cast<std::int64_t>((static_cast<std::uint64_t>(value) << 8) | p[i]);
                return value;
            }

            static std::uint64_t ToUnsigned(const std::uint8_t *p, std::size_t length)
            {
                std::uint64_t value = 0;
                for (std::size_t i = 0; i < length; ++i)
                    value = (value << 8) | p[i];
                return value;
            }

        private:
            const std::uint8_t *m_data;
            std::size_t m_size;
            std::size_t m_pos;
        };

        std::string RenderOctets(const std::uint8_t *p, std::size_t length)
        {
            bool printable = true;
            for (std::size_t i = 0; i < length; ++i)
            {
                std::uint8_t c = p[i];
                if ((c < 32 || c > 126) && c != '\r' && c != '\n' && c != '\t')
                {
                    // A trailing NUL is common on embedded agents.
                    if (!(c == 0 && i + 1 == length))
                        printable = false;
                }
            }

            if (printable)
            {
                std::string text(reinterpret_cast<const char *>(p), length);
                while (!text.empty() && text.back() == '\0')
                    text.pop_back();
                return text;
            }

            std::stringstream ss;
            ss << "0x" << std::hex << std::setfill('0');
            for (std::size_t i = 0; i < length; ++i)
                ss << std::setw(2) << static_cast<int>(p[i]);
            return ss.str();
        }

        bool DecodeValue(std::uint8_t tag, const std::uint8_t *p, std::size_t length, VarBind &vb)
        {
            vb.type = static_cast<ValueType>(tag);
            switch (vb.type)
            {
            case ValueType::Integer:
                if (length == 0 || length > 8)
                    return false;
                vb.value = std::to_string(Reader::ToSigned(p, length));
                return true;
            case ValueType::OctetString:
            case ValueType::Opaque:
                vb.value = RenderOctets(p, length);
                return true;
            case ValueType::Null:
            case ValueType::NoSuchObject:
            case ValueType::NoSuchInstance:
            case ValueType::EndOfMibView:
                vb.value.clear();
                return true;
            case ValueType::ObjectId:
            {
                auto oid = DecodeOid(p, length);
                if (!oid)
                    return false;
                vb.value = *oid;
                return true;
            }
            case ValueType::IpAddress:
                if (length != 4)
                    return false;
                vb.value = std::to_string(p[0]) + "." + std::to_string(p[1]) + "." +
                           std::to_string(p[2]) + "." + std::to_string(p[3]);
                return true;
            case ValueType::Counter32:
            case ValueType::Gauge32:
            case ValueType::TimeTicks:
            case ValueType::Counter64:
                if (length == 0 || length > 9)
                    return false;
                vb.value = std::to_string(Reader::ToUnsigned(p, length));
                return true;
            }
            return false;
        }

        std::vector<std::uint64_t> SplitOid(std::string_view oid)
        {
            std::vector<std::uint64_t> arcs;
            std::uint64_t current = 0;
            bool digits = false;
            for (char c : oid)
            {
                if (c == '.')
                {
                    if (digits)
                        arcs.push_back(current);
                    current = 0;
                    digits = false;
                }
                else
                {
                    current = current * 10 + static_cast<std::uint64_t>(c - '0');
                    digits = true;
                }
            }
            if (digits)
                arcs.push_back(current);
            return arcs;
        }
    }

    bool VarBind::IsException() const
    {
        return type == ValueType::NoSuchObject || type == ValueType::NoSuchInstance ||
               type == ValueType::EndOfMibView;
    }

    std::vector<std::uint8_t> EncodeOid(const std::string &oid)
    {
        auto arcs = SplitOid(oid);
        std::vector<std::uint8_t> out;
        if (arcs.size() < 2)
            return out;

        arcs[1] += arcs[0] * 40;
        for (std::size_t i = 1; i < arcs.size(); ++i)
        {
            std::uint64_t arc = arcs[i];
            std::vector<std::uint8_t> chunk;
            chunk.push_back(static_cast<std::uint8_t>(arc & 0x7F));
            arc >>= 7;
            while (arc > 0)
            {
                chunk.insert(chunk.begin(), static_cast<std::uint8_t>(0x80 | (arc & 0x7F)));
                arc >>= 7;
            }
            out.insert(out.end(), chunk.begin(), chunk.end());
        }
        return out;
    }

    std::optional<std::string> DecodeOid(const std::uint8_t *data, std::size_t size)
    {
        if (size == 0)
            return std::nullopt;

        std::vector<std::uint64_t> arcs;
        std::uint64_t current = 0;
        for (std::size_t i = 0; i < size; ++i)
        {
            current = (current << 7) | (data[i] & 0x7F);
            if (!(data[i] & 0x80))
            {
                arcs.push_back(current);
                current = 0;
            }
        }
        if (data[size - 1] & 0x80)
            return std::nullopt;

        std::uint64_t first = arcs.front();
        std::string out;
        if (first < 40)
            out = "0." + std::to_string(first);
        else if (first < 80)
            out = "1." + std::to_string(first - 40);
        else
            out = "2." + std::to_string(first - 80);

        for (std::size_t i = 1; i < arcs.size(); ++i)
            out += "." + std::to_string(arcs[i]);
        return out;
    }

    std::vector<std::uint8_t> EncodeMessage(const Message &message)
    {
        std::vector<std::uint8_t> varbind_list;
        for (const auto &vb : message.varbinds)
        {
            std::vector<std::uint8_t> seq_content;
            AppendTLV(seq_content, static_cast<std::uint8_t>(ValueType::ObjectId), EncodeOid(vb.oid));
            AppendValue(seq_content, vb);
            AppendTLV(varbind_list, TAG_SEQUENCE, seq_content);
        }

        std::vector<std::uint8_t> pdu_body;
        AppendInteger(pdu_body, message.request_id);
        AppendInteger(pdu_body, message.error_status);
        AppendInteger(pdu_body, message.error_index);
        AppendTLV(pdu_body, TAG_SEQUENCE, varbind_list);

        std::vector<std::uint8_t> whole_packet_content;
        AppendInteger(whole_packet_content, message.version);
        AppendString(whole_packet_content, message.community);
        AppendTLV(whole_packet_content, static_cast<std::uint8_t>(message.pdu_type), pdu_body);

        std::vector<std::uint8_t> final_packet;
        AppendTLV(final_packet, TAG_SEQUENCE, whole_packet_content);
        return final_packet;
    }

    std::vector<std::uint8_t> EncodeRequest(int version, const std::string &community, PduType type,
                                            std::int32_t request_id, const std::string &oid)
    {
        Message message;
        message.version = version;
        message.community = community;
        message.pdu_type = type;
        message.request_id = request_id;
        message.varbinds.push_back({oid, ValueType::Null, ""});
        return EncodeMessage(message);
    }

    std::optional<Message> DecodeMessage(const std::uint8_t *data, std::size_t size)
    {
        Reader outer(data, size);
        std::size_t length = 0;
        if (!outer.Expect(TAG_SEQUENCE, length))
            return std::nullopt;

        Reader msg(outer.Take(length), length);
        Message out;

        std::int64_t version = 0;
        if (!msg.ReadInteger(version) || (version != VERSION_1 && version != VERSION_2C))
            return std::nullopt;
        out.version = static_cast<int>(version);

        if (!msg.Expect(static_cast<std::uint8_t>(ValueType::OctetString), length))
            return std::nullopt;
        const std::uint8_t *community = msg.Take(length);
        out.community.assign(reinterpret_cast<const char *>(community), length);

        std::uint8_t pdu_tag = 0;
        if (!msg.ReadHeader(pdu_tag, length))
            return std::nullopt;
        if (pdu_tag != static_cast<std::uint8_t>(PduType::GetRequest) &&
            pdu_tag != static_cast<std::uint8_t>(PduType::GetNextRequest) &&
            pdu_tag != static_cast<std::uint8_t>(PduType::Response))
            return std::nullopt;
        out.pdu_type = static_cast<PduType>(pdu_tag);

        Reader pdu(msg.Take(length), length);
        std::int64_t request_id = 0, error_status = 0, error_index = 0;
        if (!pdu.ReadInteger(request_id) || !pdu.ReadInteger(error_status) || !pdu.ReadInteger(error_index))
            return std::nullopt;
        out.request_id = static_cast<std::int32_t>(request_id);
        out.error_status = static_cast<int>(error_status);
        out.error_index = static_cast<int>(error_index);

        if (!pdu.Expect(TAG_SEQUENCE, length))
            return std::nullopt;
        Reader list(pdu.Take(length), length);

        while (!list.AtEnd())
        {
            if (!list.Expect(TAG_SEQUENCE, length))
                return std::nullopt;
            Reader entry(list.Take(length), length);

            if (!entry.Expect(static_cast<std::uint8_t>(ValueType::ObjectId), length))
                return std::nullopt;
            auto oid = DecodeOid(entry.Take(length), length);
            if (!oid)
                return std::nullopt;

            std::uint8_t tag = 0;
            if (!entry.ReadHeader(tag, length))
                return std::nullopt;

            VarBind vb;
            vb.oid = *oid;
            if (!DecodeValue(tag, entry.Take(length), length, vb))
                return std::nullopt;
            out.varbinds.push_back(vb);
        }

        return out;
    }

    int CompareOids(std::string_view lhs, std::string_view rhs)
    {
        auto l = SplitOid(lhs);
        auto r = SplitOid(rhs);
        for (std::size_t i = 0; i < l.size() && i < r.size(); ++i)
        {
            if (l[i] != r[i])
                return l[i] < r[i] ? -1 : 1;
        }
        if (l.size() == r.size())
            return 0;
        return l.size() < r.size() ? -1 : 1;
    }

    bool OidInSubtree(std::string_view oid, std::string_view root)
    {
        auto o = SplitOid(oid);
        auto r = SplitOid(root);
        if (o.size() <= r.size())
            return false;
        for (std::size_t i = 0; i < r.size(); ++i)
        {
            if (o[i] != r[i])
                return false;
        }
        return true;
    }
}
