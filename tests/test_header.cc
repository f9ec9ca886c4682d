#include <stdexcept>

#include "TestUtil.hh"
#include "Header.hh"

using namespace MeowTest;

namespace
{
    Meow::Header sample_header()
    {
        Meow::Header header;
        header.ecc = true;
        header.payload_length = 500;
        header.checksum = 0xDEADBEEF;
        return header;
    }

    bool source_is(const Meow::HeaderResolution& resolution, Meow::HeaderSource expected)
    {
        return expect_eq(std::string(Meow::to_string(resolution.source)), std::string(Meow::to_string(expected)), "header source");
    }
}

int main()
{
    Suite suite;

    suite.run_test("record layout", [] {
        const Meow::RedundantHeader::Record record = Meow::RedundantHeader::serialize(sample_header());
        const std::vector<byte> expected = {'M', 'E', 'O', 'W', 1, 1,
                                            0x00, 0x00, 0x01, 0xF4,
                                            0xDE, 0xAD, 0xBE, 0xEF};
        return same_bytes(std::vector<byte>(record.begin(), record.end()), expected, "record");
    });

    suite.run_test("two identical copies", [] {
        const std::vector<byte> headers = Meow::RedundantHeader::write(sample_header());
        if (!expect_eq(headers.size(), Meow::kHeadersSize, "written size"))
            return false;
        return std::equal(headers.begin(), headers.begin() + Meow::kHeaderSize, headers.begin() + Meow::kHeaderSize);
    });

    suite.run_test("parse rejects bad magic, version and flag", [] {
        Meow::RedundantHeader::Record record = Meow::RedundantHeader::serialize(sample_header());
        if (!Meow::RedundantHeader::parse(record.data()))
            return fail("valid record rejected");

        auto bad_magic = record;
        bad_magic[3] = 'w';
        auto bad_version = record;
        bad_version[4] = 2;
        auto bad_flag = record;
        bad_flag[5] = 2;

        return !Meow::RedundantHeader::parse(bad_magic.data()) &&
               !Meow::RedundantHeader::parse(bad_version.data()) &&
               !Meow::RedundantHeader::parse(bad_flag.data());
    });

    suite.run_test("raw flag parses as ecc = false", [] {
        Meow::Header header = sample_header();
        header.ecc = false;
        auto record = Meow::RedundantHeader::serialize(header);
        auto parsed = Meow::RedundantHeader::parse(record.data());
        return parsed && *parsed == header && !parsed->ecc;
    });

    suite.run_test("clean copies resolve to primary", [] {
        auto resolution = Meow::RedundantHeader::resolve(Meow::RedundantHeader::write(sample_header()));
        return resolution && resolution->header == sample_header() && !resolution->alternate &&
               source_is(*resolution, Meow::HeaderSource::Primary);
    });

    suite.run_test("any structural damage in primary falls back to secondary", [] {
        // Every byte of magic/version/flag, every bit
        for (std::size_t b = 0; b < 6; ++b) {
            for (int bit = 0; bit < 8; ++bit) {
                std::vector<byte> headers = Meow::RedundantHeader::write(sample_header());
                headers[b] ^= static_cast<byte>(1 << bit);
                if (b == 5 && bit == 0)
                    continue;  // 1 -> 0 is still a valid flag, covered by the disagreement test

                auto resolution = Meow::RedundantHeader::resolve(headers);
                if (!resolution)
                    return fail("unresolved after flipping byte " + std::to_string(b) + " bit " + std::to_string(bit));
                if (resolution->header != sample_header() || !source_is(*resolution, Meow::HeaderSource::Secondary))
                    return false;
            }
        }
        return true;
    });

    suite.run_test("copies that disagree keep the secondary as alternate", [] {
        std::vector<byte> headers = Meow::RedundantHeader::write(sample_header());
        headers[8] ^= 0x40;  // primary length field

        auto resolution = Meow::RedundantHeader::resolve(headers);
        if (!resolution || !source_is(*resolution, Meow::HeaderSource::Primary))
            return fail("primary should still parse");
        if (!resolution->alternate)
            return fail("alternate missing");
        return *resolution->alternate == sample_header() &&
               expect_eq(resolution->header.payload_length, 500u ^ (0x40u << 8), "primary length");
    });

    suite.run_test("both copies damaged is unrecoverable", [] {
        std::vector<byte> headers = Meow::RedundantHeader::write(sample_header());
        headers[0] ^= 0x01;
        headers[Meow::kHeaderSize + 4] ^= 0x80;
        return !Meow::RedundantHeader::resolve(headers).has_value();
    });

    suite.run_test("short input throws", [] {
        try {
            (void)Meow::RedundantHeader::resolve(std::vector<byte>(Meow::kHeadersSize - 1, 0));
        } catch (const std::invalid_argument&) {
            return true;
        }
        return fail("no exception");
    });

    return suite.finish();
}
