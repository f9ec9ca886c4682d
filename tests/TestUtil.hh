#ifndef MEOWHNS_TESTUTIL_HH
#define MEOWHNS_TESTUTIL_HH

#include <algorithm>
#include <cstdint>
#include <functional>
#include <iostream>
#include <random>
#include <set>
#include <string>
#include <vector>

#include <defines.hh>
#include "BlockCodec.hh"
#include "Format.hh"

namespace MeowTest
{
    /**Collects verdicts of the run_test() calls in one executable*/
    struct Suite
    {
        uint32_t passed = 0;
        uint32_t failed = 0;

        void run_test(const std::string& name, const std::function<bool()>& test)
        {
            bool ok = false;
            try {
                ok = test();
            } catch (const std::exception& e) {
                std::cerr << name << ": unexpected exception: " << e.what() << std::endl;
            }

            if (ok) {
                ++passed;
                std::cout << CLI_GREEN << "[ OK ] " << name << CLI_RESET << std::endl;
            } else {
                ++failed;
                std::cout << CLI_RED << "[FAIL] " << name << CLI_RESET << std::endl;
            }
        }

        int finish() const
        {
            std::cout << "-------------------" << std::endl;
            std::cout << (failed ? CLI_RED : CLI_GREEN) << passed << " passed, " << failed << " failed"
                      << CLI_RESET << std::endl;
            return failed ? 1 : 0;
        }
    };

    /**Print what went wrong and hand back false, so checks read `if (...) return fail("...");`*/
    inline bool fail(const std::string& what)
    {
        std::cout << "  " << what << std::endl;
        return false;
    }

    template <typename A, typename B>
    bool expect_eq(const A& actual, const B& expected, const std::string& what)
    {
        if (actual == expected)
            return true;
        std::cout << "  " << what << ": expected " << expected << ", got " << actual << std::endl;
        return false;
    }

    /**
     * Byte-by-byte comparison, reports the first mismatch
     */
    inline bool same_bytes(const std::vector<byte>& actual, const std::vector<byte>& expected, const std::string& what)
    {
        if (actual.size() != expected.size()) {
            std::cout << "  " << what << " size mismatch: expected " << expected.size() << ", got " << actual.size() << std::endl;
            return false;
        }
        for (std::size_t i = 0; i < expected.size(); ++i) {
            if (actual[i] != expected[i]) {
                std::cout << "  " << what << " mismatch at byte " << i << ": expected " << static_cast<int>(expected[i])
                          << ", got " << static_cast<int>(actual[i]) << std::endl;
                return false;
            }
        }
        return true;
    }

    inline std::vector<byte> random_bytes(std::size_t count, uint32_t seed)
    {
        std::mt19937 rng(seed);
        std::uniform_int_distribution<int> dist(0, 255);
        std::vector<byte> out(count);
        for (auto& b : out)
            b = static_cast<byte>(dist(rng));
        return out;
    }

    /* ── Corruption harness ─────────────────────────────────── */

    /**
     * Flip the LSB of the given samples
     * @param samples Carrier samples, modified in-place
     * @param indices Sample indices (= bitstream bit indices)
     */
    inline void flip_lsb(std::vector<byte>& samples, const std::vector<uint64_t>& indices)
    {
        for (uint64_t i : indices)
            samples.at(i) ^= 0x01;
    }

    /**
     * Pick distinct sample indices inside [begin, end)
     * @param count How many (clamped to the range size)
     * @param seed Fixed seed, runs are reproducible
     */
    inline std::vector<uint64_t> random_indices(uint64_t begin, uint64_t end, std::size_t count, uint32_t seed)
    {
        std::mt19937_64 rng(seed);
        std::uniform_int_distribution<uint64_t> dist(begin, end - 1);
        count = static_cast<std::size_t>(std::min<uint64_t>(count, end - begin));

        std::set<uint64_t> picked;
        while (picked.size() < count)
            picked.insert(dist(rng));
        return std::vector<uint64_t>(picked.begin(), picked.end());
    }

    /**
     * Flip random LSBs of the carrier inside a bit range
     * @return flipped indices
     */
    inline std::vector<uint64_t> corrupt_lsb(std::vector<byte>& samples, uint64_t bit_begin, uint64_t bit_end,
                                             std::size_t flips, uint32_t seed)
    {
        auto indices = random_indices(bit_begin, bit_end, flips, seed);
        flip_lsb(samples, indices);
        return indices;
    }

    /**
     * Damage whole bytes of the embedded bitstream: one LSB flip per chosen stream byte,
     * so every listed byte becomes exactly one wrong symbol
     * @param stream_bytes Byte offsets from the start of the bitstream (headers included)
     */
    inline void corrupt_stream_bytes(std::vector<byte>& samples, const std::vector<uint64_t>& stream_bytes)
    {
        for (uint64_t offset : stream_bytes)
            samples.at(offset * 8ULL + 7ULL) ^= 0x01;
    }

    /**
     * Replace `errors` distinct symbols of a codeword with different random values
     * @return corrupted positions
     */
    inline std::vector<uint64_t> corrupt_symbols(Meow::Codeword& codeword, std::size_t errors, uint32_t seed)
    {
        auto positions = random_indices(0, Meow::kCodewordSize, errors, seed);
        std::mt19937 rng(seed ^ 0x9E3779B9u);
        std::uniform_int_distribution<int> dist(1, 255);
        for (uint64_t p : positions)
            codeword[p] ^= static_cast<byte>(dist(rng));  // non-zero xor: symbol really changes
        return positions;
    }

    /**
     * Byte offset of codeword `block` inside the bitstream
     */
    inline uint64_t codeword_offset(uint64_t block)
    {
        return Meow::kHeadersSize + block * Meow::kCodewordSize;
    }
} // MeowTest

#endif //MEOWHNS_TESTUTIL_HH
