#include "BitPlane.hh"

#include <stdexcept>
#include <string>

namespace Meow
{
    void BitPlane::write(byte* samples, uint64_t sample_count, const std::vector<byte>& data, uint64_t bit_offset)
    {
        const uint64_t total_bits = data.size() * 8ULL;
        if (bit_offset > sample_count || total_bits > sample_count - bit_offset)
            throw std::out_of_range("BitPlane::write(): " + std::to_string(total_bits) + " bits at offset " +
                                    std::to_string(bit_offset) + " exceed " + std::to_string(sample_count) + " samples");

        for (uint64_t i = 0; i < total_bits; ++i) {
            const byte bit = (data[i / 8] >> (7 - i % 8)) & 1;
            byte& sample = samples[bit_offset + i];
            sample = static_cast<byte>((sample & 0xFE) | bit);
        }
    }

    std::vector<byte> BitPlane::read(const byte* samples, uint64_t sample_count, uint64_t byte_count, uint64_t bit_offset)
    {
        const uint64_t total_bits = byte_count * 8ULL;
        if (bit_offset > sample_count || total_bits > sample_count - bit_offset)
            throw std::out_of_range("BitPlane::read(): " + std::to_string(total_bits) + " bits at offset " +
                                    std::to_string(bit_offset) + " exceed " + std::to_string(sample_count) + " samples");

        std::vector<byte> data(byte_count, 0);
        for (uint64_t i = 0; i < total_bits; ++i) {
            const byte bit = samples[bit_offset + i] & 0x01;
            data[i / 8] |= static_cast<byte>(bit << (7 - i % 8));
        }
        return data;
    }
} // Meow
