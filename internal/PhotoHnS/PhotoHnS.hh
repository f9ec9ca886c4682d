#ifndef MEOWHNS_PHOTOHNS_HH
#define MEOWHNS_PHOTOHNS_HH

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <HnS.hh>
#include <EmbedData.hh>

namespace Meow
{
    // RAII for an stb_image pixel buffer (auto stbi_image_free).
    class StbImageRAII {
    public:
        byte*   pixels   = nullptr;
        int32_t width    = 0;
        int32_t height   = 0;
        int32_t channels = 0;

        explicit StbImageRAII(const std::string& path) noexcept;
        ~StbImageRAII() noexcept;
        StbImageRAII(const StbImageRAII&) = delete;
        StbImageRAII& operator=(const StbImageRAII&) = delete;

        explicit operator bool() const noexcept
        { return pixels != nullptr; }
    };

    class PhotoHnS : public HnS
    {
    private:
        /**
         * Colour samples carry the LSB plane; alpha (channel 2 of GA, channel 4 of RGBA) never does,
         * so the plane is the same on write and read whatever the alpha values are.
         * @param channels Channels per pixel
         * @return samples per pixel usable for embedding
         */
        static int32_t colour_channels(int32_t channels);

        /**
         * Copy colour samples into a flat buffer, pixel order, channel order.
         * @param image Loaded image
         * @return flat sample plane
         */
        static std::vector<byte> gather_samples(const StbImageRAII& image);

        /**
         * Inverse of gather_samples(), writes the plane back into the image.
         * @param image Modified in-place
         * @param samples Plane from gather_samples()
         */
        static void scatter_samples(StbImageRAII& image, const std::vector<byte>& samples);

        /**
         * Load a carrier and check it decodes.
         * @param path File path (already validated)
         * @param caller For logs
         */
        static std::optional<std::vector<byte>> load_samples(const std::string& path, const char* caller);

    public:
        /**
         * @param codec Block codec, the process-wide detected one by default
         */
        explicit PhotoHnS(const BlockCodec& codec = detect_block_codec()) : HnS(codec) {}
        ~PhotoHnS() override = default;

        /**
         * @param ext Lower-case extension
         * @return true for formats stb_image decodes losslessly (png, bmp, tga)
         */
        static bool is_supported_carrier(const std::string& ext);

        /**
         * Embed data into a picture. The cover may be PNG/BMP/TGA/JPEG, the output is always PNG.
         * @param data Data to hide.
         * @param path Cover image.
         * @param out_path Output PNG (written only if the payload fits).
         * @return report, or nullopt (bad path, unreadable cover, unwritable output).
         */
        std::optional<EmbedReport> embed(const std::vector<byte>& data, const std::string& path,
                                         const std::string& out_path) override;

        /**
         * Extract data from a MEOW picture.
         * @param path Stego image.
         * @return report with state/payload, or nullopt (bad path, unreadable image).
         */
        std::optional<ExtractReport> extract(const std::string& path) override;

        std::optional<HeaderResolution> read_header_only(const std::string& path) override;

        /**
         * Largest payload that fits a cover
         * @param path Cover image
         * @param ecc Reed-Solomon or raw mode
         * @return bytes, or nullopt if the image cannot be read
         */
        static std::optional<uint64_t> capacity(const std::string& path, bool ecc);
    };
} // Meow

#endif //MEOWHNS_PHOTOHNS_HH
