#include "Header.hh"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace Meow
{
    namespace
    {
        void put_be32(byte* out, uint32_t value)
        {
            out[0] = static_cast<byte>(value >> 24);
            out[1] = static_cast<byte>(value >> 16);
            out[2] = static_cast<byte>(value >> 8);
            out[3] = static_cast<byte>(value);
        }

        uint32_t get_be32(const byte* in)
        {
            return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16) |
                   (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
        }
    }

    const char* to_string(HeaderSource source)
    {
        return source == HeaderSource::Primary ? "primary" : "secondary";
    }

    RedundantHeader::Record RedundantHeader::serialize(const Header& header)
    {
        Record record{};
        std::copy(kMagic.begin(), kMagic.end(), record.begin());
        record[4] = header.version;
        record[5] = header.ecc ? 1 : 0;
        put_be32(record.data() + 6, header.payload_length);
        put_be32(record.data() + 10, header.checksum);
        return record;
    }

    std::optional<Header> RedundantHeader::parse(const byte* record)
    {
        if (!std::equal(kMagic.begin(), kMagic.end(), record))
            return std::nullopt;
        if (record[4] != kFormatVersion)
            return std::nullopt;
        if (record[5] > 1)
            return std::nullopt;

        Header header;
        header.version = record[4];
        header.ecc = record[5] == 1;
        header.payload_length = get_be32(record + 6);
        header.checksum = get_be32(record + 10);
        return header;
    }

    std::vector<byte> RedundantHeader::write(const Header& header)
    {
        const Record record = serialize(header);
        std::vector<byte> out;
        out.reserve(kHeadersSize);
        for (std::size_t copy = 0; copy < kHeaderCopies; ++copy)
            out.insert(out.end(), record.begin(), record.end());
        return out;
    }

    std::optional<HeaderResolution> RedundantHeader::resolve(const std::vector<byte>& headers)
    {
        if (headers.size() < kHeadersSize)
            throw std::invalid_argument("RedundantHeader::resolve(): need both header copies");

        const std::optional<Header> primary = parse(headers.data());
        const std::optional<Header> secondary = parse(headers.data() + kHeaderSize);

        if (primary) {
            HeaderResolution resolution;
            resolution.header = *primary;
            resolution.source = HeaderSource::Primary;
            if (secondary && *secondary != *primary) {
                std::cerr << CLI_YELLOW << "RedundantHeader::resolve(): header copies disagree, keeping secondary as fallback"
                          << CLI_RESET << std::endl;
                resolution.alternate = secondary;
            }
            return resolution;
        }

        if (secondary) {
            std::cerr << CLI_YELLOW << "RedundantHeader::resolve(): primary header invalid, recovered from secondary copy"
                      << CLI_RESET << std::endl;
            HeaderResolution resolution;
            resolution.header = *secondary;
            resolution.source = HeaderSource::Secondary;
            return resolution;
        }

        return std::nullopt;
    }
} // Meow
