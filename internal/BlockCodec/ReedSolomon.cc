#include "ReedSolomon.hh"

#include <stdexcept>
#include <string>

namespace Meow
{
    CorrectRsRAII::CorrectRsRAII(uint16_t primitive_polynomial, uint8_t first_root, uint8_t root_gap,
                                 std::size_t num_roots) noexcept
    {
        this->rs = correct_reed_solomon_create(primitive_polynomial, first_root, root_gap, num_roots);
    }

    CorrectRsRAII::~CorrectRsRAII() noexcept
    {
        if (this->rs)
            correct_reed_solomon_destroy(this->rs);
    }

    ReedSolomon::ReedSolomon()
        : handle_(correct_rs_primitive_polynomial_8_4_3_2_0, 1, 1, kParitySize)
    {
        if (!this->handle_)
            throw std::runtime_error("ReedSolomon: correct_reed_solomon_create() failed");
    }

    Codeword ReedSolomon::encode_block(const DataBlock& data) const
    {
        Codeword codeword{};
        ssize_t written = 0;
        {
            std::lock_guard<std::mutex> lock(this->mutex_);
            written = correct_reed_solomon_encode(this->handle_.rs, data.data(), data.size(), codeword.data());
        }
        if (written != static_cast<ssize_t>(kCodewordSize))
            throw std::runtime_error("ReedSolomon::encode_block(): correct_reed_solomon_encode() returned " +
                                     std::to_string(written));
        return codeword;
    }

    std::optional<DecodedBlock> ReedSolomon::decode_block(const Codeword& codeword) const
    {
        DecodedBlock result;
        ssize_t decoded = 0;
        {
            std::lock_guard<std::mutex> lock(this->mutex_);
            decoded = correct_reed_solomon_decode(this->handle_.rs, codeword.data(), codeword.size(), result.data.data());
        }
        if (decoded != static_cast<ssize_t>(kDataSize))
            return std::nullopt;

        /*The repaired codeword is the re-encoded data; every differing symbol was corrected*/
        const Codeword repaired = this->encode_block(result.data);
        for (std::size_t i = 0; i < kCodewordSize; ++i)
            if (repaired[i] != codeword[i])
                ++result.corrected;

        if (result.corrected > kMaxCorrectable)
            return std::nullopt;
        return result;
    }
} // Meow
