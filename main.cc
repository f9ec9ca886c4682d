#include <iostream>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "EmbedData.hh"
#include "Settings.hh"
#include "PhotoHnS/PhotoHnS.hh"

namespace
{
    constexpr int kExitOk = 0;
    constexpr int kExitFailed = 1;
    constexpr int kExitPartial = 2;

    void usage(const char* argv0)
    {
        std::cerr << "Usage:\n"
                  << "  " << argv0 << " embed <cover> <payload-file> <out.png>\n"
                  << "  " << argv0 << " extract <stego.png> <out-file>\n"
                  << "  " << argv0 << " info <stego.png>\n"
                  << "  " << argv0 << " capacity <cover>\n"
                  << "Environment: MEOW_DISABLE_ECC=1 writes raw mode, MEOW_VERBOSE=1 logs progress." << std::endl;
    }

    std::optional<std::vector<byte>> read_file(const std::string& path)
    {
        std::ifstream input(path, std::ios::binary);
        if (!input) {
            std::cerr << CLI_RED << "Failed to open: " << path << CLI_RESET << std::endl;
            return std::nullopt;
        }
        return std::vector<byte>(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    }

    bool write_file(const std::string& path, const std::vector<byte>& data)
    {
        std::ofstream output(path, std::ios::binary);
        if (!output) {
            std::cerr << CLI_RED << "Failed to write: " << path << CLI_RESET << std::endl;
            return false;
        }
        output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        return static_cast<bool>(output);
    }

    // Embed a file into a cover image and print what was recorded in the header.
    int run_embed(const std::string& cover, const std::string& payload_path, const std::string& out_path)
    {
        auto payload = read_file(payload_path);
        if (!payload)
            return kExitFailed;

        Meow::PhotoHnS photo;
        std::optional<Meow::EmbedReport> report = photo.embed(*payload, cover, out_path);
        if (!report) {
            std::cerr << CLI_RED << "Embedding failed: check '" << cover << "' existence and format." << CLI_RESET << std::endl;
            return kExitFailed;
        }
        if (!report->ok()) {
            std::cerr << CLI_RED << "Embedding failed: " << Meow::to_string(report->error) << " (needed "
                      << report->bits_required << " bits, available " << report->bits_available << ")."
                      << CLI_RESET << std::endl;
            return kExitFailed;
        }

        std::cout << CLI_GREEN << "Embedded " << payload->size() << " bytes into " << out_path << CLI_RESET << std::endl;
        std::cout << "  mode:      " << (report->ecc_applied() ? "reed-solomon (255,223)" : "raw") << std::endl;
        std::cout << "  codewords: " << report->codewords << std::endl;
        std::cout << "  bits used: " << report->bits_required << "/" << report->bits_available << std::endl;
        return kExitOk;
    }

    // Extract to a file. PARTIAL_SUCCESS still writes the best-effort payload.
    int run_extract(const std::string& stego, const std::string& out_path)
    {
        Meow::PhotoHnS photo;
        std::optional<Meow::ExtractReport> report = photo.extract(stego);
        if (!report) {
            std::cerr << CLI_RED << "Extraction failed: verify '" << stego << "' integrity." << CLI_RESET << std::endl;
            return kExitFailed;
        }

        std::cout << "State: " << Meow::to_string(report->state) << std::endl;
        if (report->state == Meow::RecoveryState::Failed) {
            std::cerr << CLI_RED << "Reason: " << Meow::to_string(report->reason) << CLI_RESET << std::endl;
            return kExitFailed;
        }

        if (report->recovered_from_secondary())
            std::cout << CLI_YELLOW << "Header recovered from secondary copy." << CLI_RESET << std::endl;
        std::cout << "Corrected symbols: " << report->corrected_symbols << std::endl;

        if (!write_file(out_path, report->payload))
            return kExitFailed;

        if (report->state == Meow::RecoveryState::PartialSuccess) {
            std::cout << CLI_YELLOW << "Partial payload written to " << out_path << " (checksum "
                      << (report->checksum_mismatch ? "mismatch" : "ok") << ")." << CLI_RESET << std::endl;
            for (uint32_t block : report->failed_blocks) {
                const uint64_t begin = static_cast<uint64_t>(block) * Meow::kDataSize;
                std::cout << "  untrusted bytes [" << begin << ", " << begin + Meow::kDataSize << ")" << std::endl;
            }
            return kExitPartial;
        }

        std::cout << CLI_GREEN << "Extracted " << report->payload.size() << " bytes to " << out_path << CLI_RESET << std::endl;
        return kExitOk;
    }

    int run_info(const std::string& stego)
    {
        std::cout << "Settings: " << Meow::Settings::getInstance().describe() << std::endl;
        std::cout << "Codec:    " << Meow::detect_block_codec().name() << std::endl;

        std::optional<Meow::HeaderResolution> resolution = Meow::HnS::readHeaderOnly(stego);
        if (!resolution) {
            std::cout << CLI_YELLOW << "No MEOW header found in " << stego << CLI_RESET << std::endl;
            return kExitFailed;
        }

        const Meow::Header& header = resolution->header;
        std::cout << "Header:   version " << static_cast<int>(header.version) << ", from "
                  << Meow::to_string(resolution->source) << " copy" << std::endl;
        std::cout << "Mode:     " << (header.ecc ? "reed-solomon (255,223)" : "raw") << std::endl;
        std::cout << "Payload:  " << header.payload_length << " bytes" << std::endl;
        std::cout << "Checksum: 0x" << std::hex << header.checksum << std::dec << std::endl;
        if (resolution->alternate)
            std::cout << CLI_YELLOW << "Header copies disagree." << CLI_RESET << std::endl;
        return kExitOk;
    }

    int run_capacity(const std::string& cover)
    {
        auto ecc = Meow::PhotoHnS::capacity(cover, true);
        auto raw = Meow::PhotoHnS::capacity(cover, false);
        if (!ecc || !raw)
            return kExitFailed;
        std::cout << "Reed-Solomon: " << *ecc << " bytes" << std::endl;
        std::cout << "Raw:          " << *raw << " bytes" << std::endl;
        return kExitOk;
    }
}

int main(int argc, char** argv)
{
    if (argc < 2) {
        usage(argv[0]);
        return kExitFailed;
    }

    const std::string command = argv[1];
    try {
        if (command == "embed" && argc == 5)
            return run_embed(argv[2], argv[3], argv[4]);
        if (command == "extract" && argc == 4)
            return run_extract(argv[2], argv[3]);
        if (command == "info" && argc == 3)
            return run_info(argv[2]);
        if (command == "capacity" && argc == 3)
            return run_capacity(argv[2]);
    } catch (const std::exception& e) {
        std::cerr << CLI_RED << "meow: " << e.what() << CLI_RESET << std::endl;
        return kExitFailed;
    }

    usage(argv[0]);
    return kExitFailed;
}
