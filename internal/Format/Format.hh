#ifndef MEOWHNS_FORMAT_HH
#define MEOWHNS_FORMAT_HH

#include <array>
#include <cstddef>
#include <cstdint>
#include <defines.hh>

namespace Meow
{
    /* On-carrier layout constants */
    constexpr std::array<byte, 4> kMagic = {'M', 'E', 'O', 'W'};
    constexpr byte kFormatVersion = 1;

    constexpr std::size_t kHeaderSize = 14;                 // magic(4) version(1) flag(1) length(4) checksum(4)
    constexpr std::size_t kHeaderCopies = 2;
    constexpr std::size_t kHeadersSize = kHeaderSize * kHeaderCopies;

    /* RS(255, 223) over GF(256) */
    constexpr std::size_t kCodewordSize = 255;
    constexpr std::size_t kDataSize = 223;
    constexpr std::size_t kParitySize = kCodewordSize - kDataSize;
    constexpr std::size_t kMaxCorrectable = kParitySize / 2;

    enum class MeowError : uint8_t
    {
        None,
        InsufficientCapacity,   // carrier too small for the bitstream, nothing written
        HeaderUnrecoverable,    // neither header copy is valid
        UncorrectableBlock,     // a codeword exceeded the correction capacity
        ChecksumMismatch,       // recovered payload disagrees with the header checksum
        CapabilityUnavailable,  // not an error: raw mode was recorded
        LengthMismatch,         // header describes more bits than the carrier holds
        PayloadTooLarge         // payload does not fit the 32-bit length field
    };

    const char* to_string(MeowError error);

    /**
     * Size of the encoded payload as stored after the two header copies
     * @param payload_length Original payload length in bytes
     * @param ecc true if the payload is Reed-Solomon encoded
     * @return encoded length in bytes
     */
    constexpr uint64_t encoded_payload_size(uint64_t payload_length, bool ecc)
    {
        return ecc ? ((payload_length + kDataSize - 1) / kDataSize) * kCodewordSize : payload_length;
    }

    /**
     * Number of LSB-plane bits a payload needs, both header copies included
     */
    constexpr uint64_t required_bits(uint64_t payload_length, bool ecc)
    {
        return (kHeadersSize + encoded_payload_size(payload_length, ecc)) * 8ULL;
    }

    /**
     * Largest payload a carrier can take
     * @param sample_count Usable carrier samples (LSB-plane bits)
     * @param ecc Reed-Solomon mode or raw mode
     * @return payload bytes, 0 if not even the headers fit
     */
    constexpr uint64_t max_payload_size(uint64_t sample_count, bool ecc)
    {
        const uint64_t bytes = sample_count / 8ULL;
        if (bytes <= kHeadersSize)
            return 0;
        return ecc ? ((bytes - kHeadersSize) / kCodewordSize) * kDataSize : bytes - kHeadersSize;
    }
} // Meow

#endif //MEOWHNS_FORMAT_HH
