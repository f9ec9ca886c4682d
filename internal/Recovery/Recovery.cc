#include "Recovery.hh"
#include "BitPlane.hh"
#include "Checksum.hh"
#include "Settings.hh"

#include <iostream>
#include <limits>

namespace Meow
{
    const char* to_string(RecoveryState state)
    {
        switch (state)
        {
            case RecoveryState::Start:
                return "START";
            case RecoveryState::HeaderResolved:
                return "HEADER_RESOLVED";
            case RecoveryState::PayloadDecoded:
                return "PAYLOAD_DECODED";
            case RecoveryState::Success:
                return "SUCCESS";
            case RecoveryState::PartialSuccess:
                return "PARTIAL_SUCCESS";
            case RecoveryState::Failed:
                return "FAILED";
        }
        return "UNKNOWN";
    }

    RecoveryOrchestrator::RecoveryOrchestrator(const BlockCodec& codec)
        : codec_(codec), encoder_(codec), decoder_(codec)
    {
    }

    EmbedReport RecoveryOrchestrator::embed(const std::vector<byte>& payload, byte* samples, uint64_t sample_count) const
    {
        EmbedReport report;
        report.bits_available = BitPlane::capacity_bits(sample_count);

        if (payload.size() > std::numeric_limits<uint32_t>::max()) {
            std::cerr << CLI_RED << "RecoveryOrchestrator::embed(): payload of " << payload.size()
                      << " bytes exceeds the 32-bit length field" << CLI_RESET << std::endl;
            report.error = MeowError::PayloadTooLarge;
            return report;
        }

        const bool ecc = this->encoder_.ecc();
        report.bits_required = required_bits(payload.size(), ecc);
        if (report.bits_required > report.bits_available) {
            std::cerr << CLI_RED << "RecoveryOrchestrator::embed(): insufficient capacity (needed " << report.bits_required
                      << " bits, available " << report.bits_available << ")" << CLI_RESET << std::endl;
            report.error = MeowError::InsufficientCapacity;
            return report;
        }

        report.header.version = kFormatVersion;
        report.header.ecc = ecc;
        report.header.payload_length = static_cast<uint32_t>(payload.size());
        report.header.checksum = payload_checksum(payload);

        /*Whole bitstream is built before the first sample is touched*/
        std::vector<byte> stream = RedundantHeader::write(report.header);
        const std::vector<byte> encoded = this->encoder_.encode(payload);
        stream.insert(stream.end(), encoded.begin(), encoded.end());

        BitPlane::write(samples, sample_count, stream);

        if (ecc) {
            report.codewords = static_cast<uint32_t>(encoded.size() / kCodewordSize);
        } else {
            report.notice = MeowError::CapabilityUnavailable;
            std::cerr << CLI_YELLOW << "RecoveryOrchestrator::embed(): no error correction available, payload stored raw"
                      << CLI_RESET << std::endl;
        }

        if (Settings::getInstance().verbose())
            std::cout << CLI_GREEN << "Embedded " << payload.size() << " bytes (" << stream.size() << " with headers"
                      << (ecc ? " and parity" : "") << ") into " << sample_count << " samples." << CLI_RESET << std::endl;
        return report;
    }

    std::optional<HeaderResolution> RecoveryOrchestrator::peek_header(const byte* samples, uint64_t sample_count)
    {
        if (BitPlane::capacity_bits(sample_count) < kHeadersSize * 8ULL)
            return std::nullopt;
        return RedundantHeader::resolve(BitPlane::read(samples, sample_count, kHeadersSize));
    }

    ExtractReport RecoveryOrchestrator::extract(const byte* samples, uint64_t sample_count) const
    {
        const std::optional<HeaderResolution> resolution = peek_header(samples, sample_count);
        if (!resolution) {
            std::cerr << CLI_RED << "RecoveryOrchestrator::extract(): no valid MEOW header in either copy"
                      << CLI_RESET << std::endl;
            ExtractReport report;
            report.state = RecoveryState::Failed;
            report.reason = MeowError::HeaderUnrecoverable;
            return report;
        }

        ExtractReport report = this->decode_with(samples, sample_count, resolution->header, resolution->source);

        /*Copies disagreed: the secondary wins only if it verifies where the primary did not*/
        if (report.state != RecoveryState::Success && resolution->alternate) {
            ExtractReport fallback = this->decode_with(samples, sample_count, *resolution->alternate, HeaderSource::Secondary);
            if (fallback.state == RecoveryState::Success) {
                std::cerr << CLI_YELLOW << "RecoveryOrchestrator::extract(): primary header rejected by checksum, "
                          << "recovered from secondary copy" << CLI_RESET << std::endl;
                return fallback;
            }
        }
        return report;
    }

    ExtractReport RecoveryOrchestrator::decode_with(const byte* samples, uint64_t sample_count,
                                                    const Header& header, HeaderSource source) const
    {
        ExtractReport report;
        report.header = header;
        report.header_source = source;
        report.state = RecoveryState::HeaderResolved;

        const uint64_t needed = required_bits(header.payload_length, header.ecc);
        if (needed > BitPlane::capacity_bits(sample_count)) {
            std::cerr << CLI_RED << "RecoveryOrchestrator::extract(): header (" << to_string(source) << ") describes "
                      << needed << " bits, carrier holds " << sample_count << CLI_RESET << std::endl;
            report.state = RecoveryState::Failed;
            report.reason = MeowError::LengthMismatch;
            return report;
        }

        const std::vector<byte> encoded = BitPlane::read(samples, sample_count,
                                                         encoded_payload_size(header.payload_length, header.ecc),
                                                         kHeadersSize * 8ULL);
        PayloadDecodeResult decoded = this->decoder_.decode(encoded, header.ecc, header.payload_length);
        report.state = RecoveryState::PayloadDecoded;

        if (decoded.error == MeowError::LengthMismatch) {
            report.state = RecoveryState::Failed;
            report.reason = MeowError::LengthMismatch;
            return report;
        }

        report.blocks = std::move(decoded.blocks);
        report.failed_blocks = std::move(decoded.failed_blocks);
        report.corrected_symbols = decoded.corrected_symbols;

        report.payload = std::move(decoded.payload);
        report.checksum_mismatch = payload_checksum(report.payload) != header.checksum;

        if (report.failed_blocks.empty() && !report.checksum_mismatch) {
            report.state = RecoveryState::Success;
            if (Settings::getInstance().verbose())
                std::cout << CLI_GREEN << "Extracted " << report.payload.size() << " bytes ("
                          << report.corrected_symbols << " symbols corrected, header from "
                          << to_string(source) << ")." << CLI_RESET << std::endl;
            return report;
        }

        report.state = RecoveryState::PartialSuccess;
        report.reason = report.failed_blocks.empty() ? MeowError::ChecksumMismatch : MeowError::UncorrectableBlock;
        std::cerr << CLI_YELLOW << "RecoveryOrchestrator::extract(): partial payload (" << report.failed_blocks.size()
                  << " failed blocks, checksum " << (report.checksum_mismatch ? "mismatch" : "ok") << ")"
                  << CLI_RESET << std::endl;
        return report;
    }
} // Meow
