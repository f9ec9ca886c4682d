#ifndef MEOWHNS_HEADER_HH
#define MEOWHNS_HEADER_HH

#include <array>
#include <cstdint>
#include <optional>
#include <vector>
#include <defines.hh>
#include "Format.hh"

namespace Meow
{
    /**In-memory header. The magic is implied: a record without it never parses.*/
    struct Header
    {
        byte     version        = kFormatVersion;
        bool     ecc            = false;   // capability flag: payload is RS(255, 223) encoded
        uint32_t payload_length = 0;       // original, unpadded length in bytes
        uint32_t checksum       = 0;       // payload_checksum() of the original payload

        bool operator==(const Header& other) const
        {
            return version == other.version && ecc == other.ecc &&
                   payload_length == other.payload_length && checksum == other.checksum;
        }

        bool operator!=(const Header& other) const
        { return !(*this == other); }
    };

    enum class HeaderSource : uint8_t
    {
        Primary, Secondary
    };

    const char* to_string(HeaderSource source);

    struct HeaderResolution
    {
        Header                header;
        HeaderSource          source = HeaderSource::Primary;
        /* Set when both copies are structurally valid but differ: the secondary,
           to be used if the payload checksum rejects the primary */
        std::optional<Header> alternate;
    };

    /**Two-copy header writer/reader*/
    class RedundantHeader
    {
    public:
        using Record = std::array<byte, kHeaderSize>;

        /**
         * magic(4) | version(1) | flag(1) | length(4, BE) | checksum(4, BE)
         * @param header Header to serialize
         * @return 14-byte record
         */
        static Record serialize(const Header& header);

        /**
         * Parse one copy
         * @param record Pointer to 14 bytes
         * @return header if magic, version and flag are valid, std::nullopt otherwise
         */
        static std::optional<Header> parse(const byte* record);

        /**
         * @return primary copy followed by the identical secondary copy (28 bytes)
         */
        static std::vector<byte> write(const Header& header);

        /**
         * Resolve the header from both copies: valid primary first, then valid secondary.
         * @param headers At least 28 bytes read from the start of the bitstream
         * @return resolution, or std::nullopt if both copies are invalid (HeaderUnrecoverable)
         */
        static std::optional<HeaderResolution> resolve(const std::vector<byte>& headers);
    };
} // Meow

#endif //MEOWHNS_HEADER_HH
