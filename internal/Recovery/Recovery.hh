#ifndef MEOWHNS_RECOVERY_HH
#define MEOWHNS_RECOVERY_HH

#include <optional>
#include <vector>
#include <defines.hh>
#include "BlockCodec.hh"
#include "EmbedData.hh"
#include "Header.hh"
#include "Payload.hh"

namespace Meow
{
    /**
     * Write side: headers + encoded payload into the LSB plane, all-or-nothing.
     * Read side: START -> HEADER_RESOLVED -> PAYLOAD_DECODED -> SUCCESS | PARTIAL_SUCCESS | FAILED.
     * Stateless between calls; the codec is chosen by the caller (see detect_block_codec()).
     */
    class RecoveryOrchestrator
    {
    private:
        const BlockCodec& codec_;
        PayloadEncoder    encoder_;
        PayloadDecoder    decoder_;

        /**
         * Decode the payload described by one header and classify the outcome
         * @param samples Carrier samples
         * @param sample_count Bounds
         * @param header Header to trust
         * @param source Copy the header came from
         * @return terminal report (Success, PartialSuccess or Failed)
         */
        ExtractReport decode_with(const byte* samples, uint64_t sample_count,
                                  const Header& header, HeaderSource source) const;

    public:
        explicit RecoveryOrchestrator(const BlockCodec& codec);

        const BlockCodec& codec() const
        { return this->codec_; }

        /**
         * Embed a payload. Nothing is written unless the whole bitstream fits.
         * @param payload Data to hide
         * @param samples Carrier samples, modified in-place on success
         * @param sample_count Number of samples
         * @return report with the written header, or InsufficientCapacity / PayloadTooLarge
         */
        EmbedReport embed(const std::vector<byte>& payload, byte* samples, uint64_t sample_count) const;

        /**
         * Recover a payload. Always returns a terminal state; no retries at other offsets.
         * @param samples Carrier samples
         * @param sample_count Number of samples
         * @return report with payload, failed blocks and checksum verdict
         */
        ExtractReport extract(const byte* samples, uint64_t sample_count) const;

        /**
         * Resolve only the redundant header
         * @return resolution, std::nullopt if the carrier holds no valid header
         */
        static std::optional<HeaderResolution> peek_header(const byte* samples, uint64_t sample_count);
    };
} // Meow

#endif //MEOWHNS_RECOVERY_HH
