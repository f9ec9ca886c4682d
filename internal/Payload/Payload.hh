#ifndef MEOWHNS_PAYLOAD_HH
#define MEOWHNS_PAYLOAD_HH

#include <cstdint>
#include <vector>
#include <defines.hh>
#include "BlockCodec.hh"
#include "Format.hh"

namespace Meow
{
    enum class BlockStatus : uint8_t
    {
        Recovered, Failed
    };

    struct BlockOutcome
    {
        BlockStatus status    = BlockStatus::Recovered;
        uint32_t    corrected = 0;
    };

    struct PayloadDecodeResult
    {
        MeowError                 error = MeowError::None;  // LengthMismatch if the slice is short
        std::vector<byte>         payload;                  // exactly the recorded length, failed chunks zeroed
        std::vector<BlockOutcome> blocks;                   // one per codeword, empty in raw mode
        std::vector<uint32_t>     failed_blocks;            // indices into blocks
        uint32_t                  corrected_symbols = 0;
    };

    /**Payload -> encoded byte stream placed after the headers*/
    class PayloadEncoder
    {
    private:
        const BlockCodec& codec_;

    public:
        explicit PayloadEncoder(const BlockCodec& codec) : codec_(codec) {}

        /**
         * @return capability flag to record in the header
         */
        bool ecc() const
        { return this->codec_.available(); }

        /**
         * Zero-pad to a multiple of 223, encode every chunk and concatenate the codewords.
         * Raw copy when the codec is unavailable.
         * @param payload Original payload
         * @return encoded bytes, encoded_payload_size(payload.size(), ecc()) long
         */
        std::vector<byte> encode(const std::vector<byte>& payload) const;
    };

    /**Encoded byte stream -> payload with a per-block report*/
    class PayloadDecoder
    {
    private:
        const BlockCodec& codec_;

    public:
        explicit PayloadDecoder(const BlockCodec& codec) : codec_(codec) {}

        /**
         * An uncorrectable codeword is recorded as Failed and decoding continues.
         * @param encoded Bytes following the two headers (may be longer than needed)
         * @param ecc Capability flag from the resolved header
         * @param original_length Recorded payload length
         * @return payload truncated to original_length plus block outcomes
         */
        PayloadDecodeResult decode(const std::vector<byte>& encoded, bool ecc, uint32_t original_length) const;
    };
} // Meow

#endif //MEOWHNS_PAYLOAD_HH
