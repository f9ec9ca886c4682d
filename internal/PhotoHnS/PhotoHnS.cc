#include "PhotoHnS.hh"
#include "Settings.hh"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <filesystem>
#include <stdexcept>

namespace Meow
{
    StbImageRAII::StbImageRAII(const std::string& path) noexcept
    {
        this->pixels = stbi_load(path.c_str(), &this->width, &this->height, &this->channels, 0);
    }

    StbImageRAII::~StbImageRAII() noexcept
    {
        if (this->pixels)
            stbi_image_free(this->pixels);
    }

    int32_t PhotoHnS::colour_channels(int32_t channels)
    {
        // GA -> G, RGBA -> RGB.
        return (channels == 2 || channels == 4) ? channels - 1 : channels;
    }

    bool PhotoHnS::is_supported_carrier(const std::string& ext)
    {
        return ext == "png" || ext == "bmp" || ext == "tga";
    }

    std::vector<byte> PhotoHnS::gather_samples(const StbImageRAII& image)
    {
        const int32_t colour = colour_channels(image.channels);
        const uint64_t pixels = static_cast<uint64_t>(image.width) * static_cast<uint64_t>(image.height);

        std::vector<byte> samples;
        samples.reserve(pixels * static_cast<uint64_t>(colour));
        for (uint64_t p = 0; p < pixels; ++p) {
            const byte* px = image.pixels + p * static_cast<uint64_t>(image.channels);
            samples.insert(samples.end(), px, px + colour);
        }
        return samples;
    }

    void PhotoHnS::scatter_samples(StbImageRAII& image, const std::vector<byte>& samples)
    {
        const int32_t colour = colour_channels(image.channels);
        const uint64_t pixels = static_cast<uint64_t>(image.width) * static_cast<uint64_t>(image.height);
        if (samples.size() != pixels * static_cast<uint64_t>(colour))
            throw std::runtime_error("Internal: sample plane size mismatch in PhotoHnS::scatter_samples");

        for (uint64_t p = 0; p < pixels; ++p) {
            byte* px = image.pixels + p * static_cast<uint64_t>(image.channels);
            std::copy(samples.begin() + static_cast<std::ptrdiff_t>(p * colour),
                      samples.begin() + static_cast<std::ptrdiff_t>((p + 1) * colour), px);
        }
    }

    std::optional<std::vector<byte>> PhotoHnS::load_samples(const std::string& path, const char* caller)
    {
        StbImageRAII image(path);
        if (!image) {
            std::cerr << CLI_RED << caller << ": Failed to load image: " << path << " (" << stbi_failure_reason() << ")"
                      << CLI_RESET << std::endl;
            return std::nullopt;
        }
        return gather_samples(image);
    }

    std::optional<EmbedReport> PhotoHnS::embed(const std::vector<byte>& data, const std::string& path, const std::string& out_path)
    {
        // Path validation.
        auto ext_opt = validate_path(path);
        if (!ext_opt) {
            std::cerr << CLI_RED << "PhotoHnS::embed(): Invalid path: " << path << CLI_RESET << std::endl;
            return std::nullopt;
        }
        if (!is_supported_carrier(ext_opt.value()) && ext_opt.value() != "jpg" && ext_opt.value() != "jpeg") {
            std::cerr << CLI_RED << "PhotoHnS::embed(): Unsupported extension: " << ext_opt.value() << CLI_RESET << std::endl;
            return std::nullopt;
        }

        // Lossy output would wipe the LSB plane.
        std::string out_ext = std::filesystem::path(out_path).extension().string();
        std::transform(out_ext.begin(), out_ext.end(), out_ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (out_ext != ".png") {
            std::cerr << CLI_RED << "PhotoHnS::embed(): Output must be a .png file: " << out_path << CLI_RESET << std::endl;
            return std::nullopt;
        }

        StbImageRAII image(path);
        if (!image) {
            std::cerr << CLI_RED << "PhotoHnS::embed(): Failed to load cover: " << path << " ("
                      << stbi_failure_reason() << ")" << CLI_RESET << std::endl;
            return std::nullopt;
        }

        std::vector<byte> samples = gather_samples(image);
        EmbedReport report = this->orchestrator_.embed(data, samples.data(), samples.size());
        if (!report.ok()) {
            // Nothing written: capacity/size failures leave the output untouched.
            return report;
        }
        scatter_samples(image, samples);

        // Save (stride = width * channels).
        int success = stbi_write_png(out_path.c_str(), image.width, image.height, image.channels,
                                     image.pixels, image.width * image.channels);
        if (!success) {
            std::cerr << CLI_RED << "PhotoHnS::embed(): Failed to write PNG: " << out_path << CLI_RESET << std::endl;
            return std::nullopt;
        }

        if (Settings::getInstance().verbose())
            std::cout << CLI_GREEN << "Embedded " << data.size() << " bytes into " << out_path << " ("
                      << (report.ecc_applied() ? "reed-solomon" : "raw") << ", "
                      << report.bits_required << "/" << report.bits_available << " bits)." << CLI_RESET << std::endl;
        return report;
    }

    std::optional<ExtractReport> PhotoHnS::extract(const std::string& path)
    {
        auto ext_opt = validate_path(path);
        if (!ext_opt) {
            std::cerr << CLI_RED << "PhotoHnS::extract(): Invalid path: " << path << CLI_RESET << std::endl;
            return std::nullopt;
        }
        if (!is_supported_carrier(ext_opt.value())) {
            std::cerr << CLI_YELLOW << "PhotoHnS::extract(): ." << ext_opt.value()
                      << " is not lossless, the LSB plane is probably gone" << CLI_RESET << std::endl;
        }

        auto samples = load_samples(path, "PhotoHnS::extract()");
        if (!samples)
            return std::nullopt;

        ExtractReport report = this->orchestrator_.extract(samples->data(), samples->size());
        if (Settings::getInstance().verbose())
            std::cout << CLI_CYAN << "PhotoHnS::extract(): " << path << " -> " << to_string(report.state)
                      << CLI_RESET << std::endl;
        return report;
    }

    std::optional<HeaderResolution> PhotoHnS::read_header_only(const std::string& path)
    {
        auto samples = load_samples(path, "PhotoHnS::read_header_only()");
        if (!samples)
            return std::nullopt;
        return RecoveryOrchestrator::peek_header(samples->data(), samples->size());
    }

    std::optional<uint64_t> PhotoHnS::capacity(const std::string& path, bool ecc)
    {
        StbImageRAII image(path);
        if (!image) {
            std::cerr << CLI_RED << "PhotoHnS::capacity(): Failed to load image: " << path << CLI_RESET << std::endl;
            return std::nullopt;
        }
        const uint64_t samples = static_cast<uint64_t>(image.width) * static_cast<uint64_t>(image.height) *
                                 static_cast<uint64_t>(colour_channels(image.channels));
        return max_payload_size(samples, ecc);
    }
} // Meow
