#include "Payload.hh"
#include "Settings.hh"

#include <algorithm>
#include <iostream>

namespace Meow
{
    std::vector<byte> PayloadEncoder::encode(const std::vector<byte>& payload) const
    {
        if (!this->codec_.available())
            return payload;

        const std::size_t blocks = (payload.size() + kDataSize - 1) / kDataSize;
        std::vector<byte> encoded;
        encoded.reserve(blocks * kCodewordSize);

        for (std::size_t b = 0; b < blocks; ++b) {
            DataBlock chunk{};  // tail of the last chunk stays zero
            const std::size_t begin = b * kDataSize;
            const std::size_t end = std::min(begin + kDataSize, payload.size());
            std::copy(payload.begin() + begin, payload.begin() + end, chunk.begin());

            const Codeword codeword = this->codec_.encode_block(chunk);
            encoded.insert(encoded.end(), codeword.begin(), codeword.end());
        }

        if (Settings::getInstance().verbose())
            std::cout << CLI_CYAN << "PayloadEncoder::encode(): " << payload.size() << " bytes -> "
                      << blocks << " codewords" << CLI_RESET << std::endl;
        return encoded;
    }

    PayloadDecodeResult PayloadDecoder::decode(const std::vector<byte>& encoded, bool ecc, uint32_t original_length) const
    {
        PayloadDecodeResult result;

        /*Raw mode: bytes as-is*/
        if (!ecc) {
            if (encoded.size() < original_length) {
                std::cerr << CLI_RED << "PayloadDecoder::decode(): raw payload truncated (" << encoded.size()
                          << "/" << original_length << " bytes)" << CLI_RESET << std::endl;
                result.error = MeowError::LengthMismatch;
                return result;
            }
            result.payload.assign(encoded.begin(), encoded.begin() + original_length);
            return result;
        }

        const uint64_t needed = encoded_payload_size(original_length, true);
        if (encoded.size() < needed) {
            std::cerr << CLI_RED << "PayloadDecoder::decode(): encoded payload truncated (" << encoded.size()
                      << "/" << needed << " bytes)" << CLI_RESET << std::endl;
            result.error = MeowError::LengthMismatch;
            return result;
        }

        if (!this->codec_.available())
            std::cerr << CLI_YELLOW << "PayloadDecoder::decode(): ECC payload read without a correcting codec, parity ignored"
                      << CLI_RESET << std::endl;

        const std::size_t blocks = static_cast<std::size_t>(needed / kCodewordSize);
        result.payload.reserve(blocks * kDataSize);
        result.blocks.reserve(blocks);

        for (std::size_t b = 0; b < blocks; ++b) {
            Codeword codeword{};
            auto first = encoded.begin() + static_cast<std::ptrdiff_t>(b * kCodewordSize);
            std::copy(first, first + kCodewordSize, codeword.begin());

            BlockOutcome outcome;
            const std::optional<DecodedBlock> decoded = this->codec_.decode_block(codeword);
            if (decoded) {
                outcome.corrected = decoded->corrected;
                result.corrected_symbols += decoded->corrected;
                result.payload.insert(result.payload.end(), decoded->data.begin(), decoded->data.end());
            } else {
                outcome.status = BlockStatus::Failed;
                result.failed_blocks.push_back(static_cast<uint32_t>(b));
                result.payload.insert(result.payload.end(), kDataSize, 0);
                std::cerr << CLI_YELLOW << "PayloadDecoder::decode(): block " << b
                          << " uncorrectable (more than " << kMaxCorrectable << " bad symbols)" << CLI_RESET << std::endl;
            }
            result.blocks.push_back(outcome);
        }

        result.payload.resize(original_length);
        if (!result.failed_blocks.empty())
            result.error = MeowError::UncorrectableBlock;
        return result;
    }
} // Meow
