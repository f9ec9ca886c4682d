#include "BlockCodec.hh"
#include "Settings.hh"
#ifdef MEOWHNS_HAVE_LIBCORRECT
#include "ReedSolomon.hh"
#endif

#include <algorithm>
#include <iostream>

namespace Meow
{
    Codeword PassThroughCodec::encode_block(const DataBlock& data) const
    {
        Codeword codeword{};
        std::copy(data.begin(), data.end(), codeword.begin());
        return codeword;
    }

    std::optional<DecodedBlock> PassThroughCodec::decode_block(const Codeword& codeword) const
    {
        DecodedBlock block;
        std::copy(codeword.begin(), codeword.begin() + kDataSize, block.data.begin());
        return block;
    }

    const BlockCodec& detect_block_codec()
    {
        static const PassThroughCodec pass_through;
        static const BlockCodec* selected = [] {
            const BlockCodec* codec = &pass_through;
#ifdef MEOWHNS_HAVE_LIBCORRECT
            if (Settings::getInstance().ecc_enabled()) {
                static const ReedSolomon reed_solomon;
                codec = &reed_solomon;
            } else {
                std::cerr << CLI_YELLOW << "detect_block_codec(): error correction disabled, raw mode will be written"
                          << CLI_RESET << std::endl;
            }
#else
            std::cerr << CLI_YELLOW << "detect_block_codec(): built without libcorrect, raw mode will be written"
                      << CLI_RESET << std::endl;
#endif
            if (Settings::getInstance().verbose())
                std::cout << CLI_CYAN << "Block codec: " << codec->name() << CLI_RESET << std::endl;
            return codec;
        }();
        return *selected;
    }

    bool block_codec_built()
    {
#ifdef MEOWHNS_HAVE_LIBCORRECT
        return true;
#else
        return false;
#endif
    }
} // Meow
