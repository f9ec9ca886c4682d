#ifndef MEOWHNS_BLOCKCODEC_HH
#define MEOWHNS_BLOCKCODEC_HH

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <defines.hh>
#include "Format.hh"

namespace Meow
{
    using DataBlock = std::array<byte, kDataSize>;
    using Codeword = std::array<byte, kCodewordSize>;

    struct DecodedBlock
    {
        DataBlock data{};
        uint32_t corrected = 0;   // symbols repaired in this codeword
    };

    /**Interface for the systematic (255, 223) block code*/
    class BlockCodec
    {
    public:
        /**Correct delete for children*/
        virtual ~BlockCodec() = default;

        /**
         * @return true if this backend really corrects errors
         */
        virtual bool available() const = 0;

        /**
         * @return backend name for logs
         */
        virtual std::string name() const = 0;

        /**
         * Encode one data chunk. Deterministic, cannot fail.
         * @param data 223 data symbols
         * @return 255-symbol codeword, data first then parity
         */
        virtual Codeword encode_block(const DataBlock& data) const = 0;

        /**
         * Decode one (possibly corrupted) codeword
         * @param codeword 255 received symbols
         * @return data and number of corrected symbols, or std::nullopt if uncorrectable
         */
        virtual std::optional<DecodedBlock> decode_block(const Codeword& codeword) const = 0;
    };

    /**
     * Backend used when error correction is unavailable.
     * Encode leaves zero parity, decode strips parity without checking it.
     */
    class PassThroughCodec : public BlockCodec
    {
    public:
        bool available() const override
        { return false; }

        std::string name() const override
        { return "pass-through"; }

        Codeword encode_block(const DataBlock& data) const override;
        std::optional<DecodedBlock> decode_block(const Codeword& codeword) const override;
    };

    /**
     * @return true if this build links the Reed-Solomon backend (libcorrect)
     */
    bool block_codec_built();

    /**
     * Capability check. Selects the Reed-Solomon backend when it is built in and Settings does not disable it.
     * Resolved on first call and fixed for the process lifetime.
     * @return codec to pass into the payload encoder/decoder
     */
    const BlockCodec& detect_block_codec();
} // Meow

#endif //MEOWHNS_BLOCKCODEC_HH
