#include "DnsMessage.hpp"

#include "AddressRange.hpp"

#include <algorithm>

namespace lanwatch::common::dns
{
    namespace
    {
        void AppendU16(std::vector<std::uint8_t> &buf, std::uint16_t v)
        {
            buf.push_back(static_cast<std::uint8_t>(v >> 8));
            buf.push_back(static_cast<std::uint8_t>(v & 0xFF));
        }

        void AppendName(std::vector<std::uint8_t> &buf, const std::string &name)
        {
            size_t start = 0;
            while (start < name.size())
            {
                size_t dot = name.find('.', start);
                if (dot == std::string::npos)
                    dot = name.size();
                size_t len = std::min<size_t>(dot - start, 63);
                if (len > 0)
                {
                    buf.push_back(static_cast<std::uint8_t>(len));
                    buf.insert(buf.end(), name.begin() + start, name.begin() + start + len);
                }
                start = dot + 1;
            }
            buf.push_back(0);
        }

        class Cursor
        {
        public:
            explicit Cursor(const std::vector<std::uint8_t> &data) : m_data(data) {}

            bool ReadU16(std::uint16_t &out)
            {
                if (m_offset + 2 > m_data.size())
                    return false;
                out = static_cast<std::uint16_t>((m_data[m_offset] << 8) | m_data[m_offset + 1]);
                m_offset += 2;
                return true;
            }

            bool ReadU32(std::uint32_t &out)
            {
                std::uint16_t hi, lo;
                if (!ReadU16(hi) || !ReadU16(lo))
                    return false;
                out = (static_cast<std::uint32_t>(hi) << 16) | lo;
                return true;
            }

            // Follows compression pointers; the cursor advances past the in-place part only.
            bool ReadName(std::string &out)
            {
                return ReadNameAt(m_offset, out, true);
            }

            bool ReadNameAt(size_t &offset, std::string &out, bool advance)
            {
                out.clear();
                size_t pos = offset;
                bool jumped = false;
                int jumps = 0;

                while (true)
                {
                    if (pos >= m_data.size())
                        return false;

                    std::uint8_t len = m_data[pos];
                    if ((len & 0xC0) == 0xC0)
                    {
                        if (pos + 1 >= m_data.size() || ++jumps > 64)
                            return false;
                        size_t target = static_cast<size_t>(((len & 0x3F) << 8) | m_data[pos + 1]);
                        if (!jumped && advance)
                            offset = pos + 2;
                        jumped = true;
                        pos = target;
                        continue;
                    }

                    if (len == 0)
                    {
                        if (!jumped && advance)
                            offset = pos + 1;
                        return true;
                    }

                    if (pos + 1 + len > m_data.size())
                        return false;
                    if (!out.empty())
                        out += '.';
                    out.append(reinterpret_cast<const char *>(&m_data[pos + 1]), len);
                    pos += 1 + len;
                }
            }

            size_t Offset() const { return m_offset; }
            void Skip(size_t n) { m_offset += n; }
            size_t Remaining() const { return m_offset <= m_data.size() ? m_data.size() - m_offset : 0; }
            const std::vector<std::uint8_t> &Data() const { return m_data; }

        private:
            const std::vector<std::uint8_t> &m_data;
            size_t m_offset = 0;
        };

        bool ReadRecord(Cursor &cursor, ResourceRecord &rr)
        {
            std::uint16_t rdlength;
            if (!cursor.ReadName(rr.name) || !cursor.ReadU16(rr.type) || !cursor.ReadU16(rr.rclass) ||
                !cursor.ReadU32(rr.ttl) || !cursor.ReadU16(rdlength))
                return false;

            if (rdlength > cursor.Remaining())
                return false;

            size_t rdata = cursor.Offset();
            const auto &data = cursor.Data();

            switch (rr.type)
            {
            case A:
                if (rdlength == 4)
                {
                    std::uint32_t addr = (static_cast<std::uint32_t>(data[rdata]) << 24) |
                                         (static_cast<std::uint32_t>(data[rdata + 1]) << 16) |
                                         (static_cast<std::uint32_t>(data[rdata + 2]) << 8) |
                                         static_cast<std::uint32_t>(data[rdata + 3]);
                    rr.target = Ipv4ToString(addr);
                }
                break;
            case PTR:
            {
                size_t offset = rdata;
                if (!cursor.ReadNameAt(offset, rr.target, false))
                    return false;
                break;
            }
            case SRV:
            {
                if (rdlength < 7)
                    return false;
                rr.port = static_cast<std::uint16_t>((data[rdata + 4] << 8) | data[rdata + 5]);
                size_t offset = rdata + 6;
                if (!cursor.ReadNameAt(offset, rr.target, false))
                    return false;
                break;
            }
            default:
                break;
            }

            cursor.Skip(rdlength);
            return true;
        }
    }

    std::vector<std::uint8_t> EncodeQuery(std::uint16_t id, const std::vector<Question> &questions, bool recursion_desired)
    {
        std::vector<std::uint8_t> buf;
        AppendU16(buf, id);
        AppendU16(buf, recursion_desired ? FLAG_RECURSION_DESIRED : 0);
        AppendU16(buf, static_cast<std::uint16_t>(questions.size()));
        AppendU16(buf, 0);
        AppendU16(buf, 0);
        AppendU16(buf, 0);

        for (const auto &q : questions)
        {
            AppendName(buf, q.name);
            AppendU16(buf, q.type);
            AppendU16(buf, q.qclass);
        }
        return buf;
    }

    std::optional<Message> Decode(const std::vector<std::uint8_t> &data)
    {
        Cursor cursor(data);
        Message msg;
        std::uint16_t qdcount, ancount, nscount, arcount;

        if (!cursor.ReadU16(msg.id) || !cursor.ReadU16(msg.flags) || !cursor.ReadU16(qdcount) ||
            !cursor.ReadU16(ancount) || !cursor.ReadU16(nscount) || !cursor.ReadU16(arcount))
            return std::nullopt;

        msg.rcode = msg.flags & 0x000F;

        for (std::uint16_t i = 0; i < qdcount; ++i)
        {
            Question q;
            if (!cursor.ReadName(q.name) || !cursor.ReadU16(q.type) || !cursor.ReadU16(q.qclass))
                return std::nullopt;
            msg.questions.push_back(q);
        }

        auto read_section = [&cursor](std::uint16_t count, std::vector<ResourceRecord> &out)
        {
            for (std::uint16_t i = 0; i < count; ++i)
            {
                ResourceRecord rr;
                if (!ReadRecord(cursor, rr))
                    return false;
                out.push_back(rr);
            }
            return true;
        };

        if (!read_section(ancount, msg.answers) || !read_section(nscount, msg.authorities) ||
            !read_section(arcount, msg.additionals))
            return std::nullopt;

        return msg;
    }

    std::string ReversePointerName(const std::string &ipv4)
    {
        std::uint32_t addr = Ipv4FromString(ipv4);
        return std::to_string(addr & 0xFF) + "." +
               std::to_string((addr >> 8) & 0xFF) + "." +
               std::to_string((addr >> 16) & 0xFF) + "." +
               std::to_string((addr >> 24) & 0xFF) + ".in-addr.arpa";
    }
}
