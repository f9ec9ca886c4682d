#ifndef MEOWHNS_REEDSOLOMON_HH
#define MEOWHNS_REEDSOLOMON_HH

#include <mutex>
#include "BlockCodec.hh"

extern "C" {
#include <correct.h>
}

namespace Meow
{
    // RAII for a libcorrect Reed-Solomon handle (auto correct_reed_solomon_destroy).
    class CorrectRsRAII {
    public:
        correct_reed_solomon* rs = nullptr;

        /**
         * @param primitive_polynomial Field polynomial
         * @param first_root First consecutive root of the generator
         * @param root_gap Generator root gap
         * @param num_roots Parity symbols per codeword
         */
        CorrectRsRAII(uint16_t primitive_polynomial, uint8_t first_root, uint8_t root_gap, std::size_t num_roots) noexcept;
        ~CorrectRsRAII() noexcept;
        CorrectRsRAII(const CorrectRsRAII&) = delete;
        CorrectRsRAII& operator=(const CorrectRsRAII&) = delete;

        explicit operator bool() const noexcept
        { return rs != nullptr; }
    };

    /**
     * RS(255, 223) backed by libcorrect: polynomial 0x11D, first root 1, 32 parity symbols.
     * Corrects up to 16 symbol errors per codeword.
     */
    class ReedSolomon : public BlockCodec
    {
    private:
        CorrectRsRAII handle_;
        /* libcorrect keeps decoder scratch buffers inside the handle */
        mutable std::mutex mutex_;

    public:
        /**
         * @throws std::runtime_error if libcorrect cannot build the codec
         */
        ReedSolomon();

        bool available() const override
        { return true; }

        std::string name() const override
        { return "reed-solomon(255,223)"; }

        Codeword encode_block(const DataBlock& data) const override;

        /**
         * Decode, then re-encode the result to count repaired symbols.
         * @param codeword Received codeword
         * @return corrected data, or std::nullopt when more than 16 symbols are wrong
         */
        std::optional<DecodedBlock> decode_block(const Codeword& codeword) const override;
    };
} // Meow

#endif //MEOWHNS_REEDSOLOMON_HH
