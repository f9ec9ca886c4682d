#include <algorithm>
#include <iostream>

#include "TestUtil.hh"
#include "BlockCodec.hh"
#include "ReedSolomon.hh"

using namespace MeowTest;

namespace
{
    Meow::DataBlock random_block(uint32_t seed)
    {
        auto bytes = random_bytes(Meow::kDataSize, seed);
        Meow::DataBlock block{};
        std::copy(bytes.begin(), bytes.end(), block.begin());
        return block;
    }

    bool same_block(const Meow::DataBlock& a, const Meow::DataBlock& b)
    {
        return std::equal(a.begin(), a.end(), b.begin());
    }

    // Corrupt `errors` symbols and check the decoder against the known original.
    bool decodes_exactly(const Meow::ReedSolomon& rs, std::size_t errors, uint32_t seed)
    {
        const Meow::DataBlock data = random_block(seed);
        Meow::Codeword codeword = rs.encode_block(data);
        corrupt_symbols(codeword, errors, seed + 1);

        auto decoded = rs.decode_block(codeword);
        if (!decoded)
            return fail(std::to_string(errors) + " errors (seed " + std::to_string(seed) + ") reported uncorrectable");
        if (!same_block(decoded->data, data))
            return fail(std::to_string(errors) + " errors (seed " + std::to_string(seed) + ") decoded to wrong data");
        return expect_eq(decoded->corrected, static_cast<uint32_t>(errors), "corrected symbols");
    }
}

int main()
{
    const Meow::ReedSolomon rs;
    Suite suite;

    suite.run_test("codeword is systematic", [&] {
        const Meow::DataBlock data = random_block(1);
        const Meow::Codeword codeword = rs.encode_block(data);
        return std::equal(data.begin(), data.end(), codeword.begin());
    });

    suite.run_test("zero data encodes to zero codeword", [&] {
        const Meow::Codeword codeword = rs.encode_block(Meow::DataBlock{});
        return std::all_of(codeword.begin(), codeword.end(), [](byte b) { return b == 0; });
    });

    suite.run_test("encoding is linear over GF(256)", [&] {
        const Meow::DataBlock a = random_block(2);
        const Meow::DataBlock b = random_block(3);
        Meow::DataBlock sum{};
        for (std::size_t i = 0; i < sum.size(); ++i)
            sum[i] = a[i] ^ b[i];

        const Meow::Codeword ca = rs.encode_block(a);
        const Meow::Codeword cb = rs.encode_block(b);
        const Meow::Codeword cs = rs.encode_block(sum);
        for (std::size_t i = 0; i < cs.size(); ++i)
            if (cs[i] != (ca[i] ^ cb[i]))
                return fail("parity of a^b differs from parity(a)^parity(b) at " + std::to_string(i));
        return true;
    });

    suite.run_test("clean codeword decodes with no corrections", [&] {
        const Meow::DataBlock data = random_block(4);
        auto decoded = rs.decode_block(rs.encode_block(data));
        if (!decoded)
            return fail("clean codeword rejected");
        return same_block(decoded->data, data) && expect_eq(decoded->corrected, 0u, "corrected symbols");
    });

    suite.run_test("1..16 symbol errors are corrected exactly", [&] {
        for (std::size_t errors = 1; errors <= Meow::kMaxCorrectable; ++errors)
            for (uint32_t seed = 0; seed < 8; ++seed)
                if (!decodes_exactly(rs, errors, 100 * static_cast<uint32_t>(errors) + seed))
                    return false;
        return true;
    });

    suite.run_test("errors confined to parity are corrected", [&] {
        const Meow::DataBlock data = random_block(5);
        Meow::Codeword codeword = rs.encode_block(data);
        for (std::size_t i = Meow::kDataSize; i < Meow::kDataSize + Meow::kMaxCorrectable; ++i)
            codeword[i] ^= 0x5A;

        auto decoded = rs.decode_block(codeword);
        if (!decoded)
            return fail("16 parity errors reported uncorrectable");
        return same_block(decoded->data, data) && expect_eq(decoded->corrected, 16u, "corrected symbols");
    });

    suite.run_test("first and last symbol corrected", [&] {
        const Meow::DataBlock data = random_block(6);
        Meow::Codeword codeword = rs.encode_block(data);
        codeword.front() ^= 0xFF;
        codeword.back() ^= 0x01;

        auto decoded = rs.decode_block(codeword);
        return decoded && same_block(decoded->data, data) && expect_eq(decoded->corrected, 2u, "corrected symbols");
    });

    suite.run_test("17+ symbol errors are reported uncorrectable", [&] {
        for (std::size_t errors : {17u, 18u, 24u, 32u, 64u}) {
            for (uint32_t seed = 0; seed < 8; ++seed) {
                const Meow::DataBlock data = random_block(7000 + seed);
                Meow::Codeword codeword = rs.encode_block(data);
                corrupt_symbols(codeword, errors, 9000 + seed);

                auto decoded = rs.decode_block(codeword);
                if (decoded) {
                    // Oracle: anything returned must at least be the original data, never silently wrong.
                    return fail(std::to_string(errors) + " errors decoded " +
                                (same_block(decoded->data, data) ? "(correctly, beyond the bound)" : "to WRONG data"));
                }
            }
        }
        return true;
    });

    suite.run_test("pass-through codec strips parity", [&] {
        const Meow::PassThroughCodec raw;
        const Meow::DataBlock data = random_block(8);
        Meow::Codeword codeword = raw.encode_block(data);
        if (!std::all_of(codeword.begin() + Meow::kDataSize, codeword.end(), [](byte b) { return b == 0; }))
            return fail("pass-through parity is not zero");

        codeword[Meow::kDataSize + 3] = 0x77;  // parity is ignored
        auto decoded = raw.decode_block(codeword);
        return !raw.available() && decoded && same_block(decoded->data, data) &&
               expect_eq(decoded->corrected, 0u, "corrected symbols");
    });

    suite.run_test("pass-through cannot repair data symbols", [&] {
        const Meow::PassThroughCodec raw;
        const Meow::DataBlock data = random_block(9);
        Meow::Codeword codeword = rs.encode_block(data);
        codeword[10] ^= 0x01;
        auto decoded = raw.decode_block(codeword);
        return decoded && !same_block(decoded->data, data);
    });

    suite.run_test("libcorrect build selects Reed-Solomon by default", [&] {
        const Meow::BlockCodec& codec = Meow::detect_block_codec();
        return Meow::block_codec_built() && codec.available() &&
               expect_eq(codec.name(), rs.name(), "codec");
    });

    return suite.finish();
}
