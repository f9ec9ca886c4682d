#ifndef MEOWHNS_BITPLANE_HH
#define MEOWHNS_BITPLANE_HH

#include <cstdint>
#include <vector>
#include <defines.hh>

namespace Meow
{
    /**
     * LSB plane of a flat sample buffer. Bit i of the stream lives in the LSB of sample i,
     * bytes are laid out MSB-first.
     */
    class BitPlane
    {
    public:
        /**
         * @param sample_count Number of carrier samples
         * @return available bits (one per sample)
         */
        static uint64_t capacity_bits(uint64_t sample_count)
        { return sample_count; }

        /**
         * Write data into the LSB plane
         * @param samples Modified in-place
         * @param sample_count Bounds
         * @param data Bytes to embed
         * @param bit_offset First sample to use
         * @throws std::out_of_range if the data does not fit (callers check capacity first)
         */
        static void write(byte* samples, uint64_t sample_count, const std::vector<byte>& data, uint64_t bit_offset = 0);

        /**
         * Read bytes back from the LSB plane
         * @param samples Carrier samples
         * @param sample_count Bounds
         * @param byte_count Bytes to read
         * @param bit_offset First sample to read
         * @throws std::out_of_range if the plane is too short
         */
        static std::vector<byte> read(const byte* samples, uint64_t sample_count, uint64_t byte_count, uint64_t bit_offset = 0);
    };
} // Meow

#endif //MEOWHNS_BITPLANE_HH
