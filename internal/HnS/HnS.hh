#ifndef MEOWHNS_HNS_HH
#define MEOWHNS_HNS_HH

#include <optional>
#include <string>
#include <vector>
#include <filesystem>

#include <defines.hh>
#include "BlockCodec.hh"
#include "EmbedData.hh"
#include "Recovery.hh"

namespace Meow
{
    /**Interface for MEOW carriers*/
    class HnS
    {
    protected:
        RecoveryOrchestrator orchestrator_;

        /**
         * Check path for validity.
         * @param path Path to file
         * @return file's extension in lower case (png, bmp, etc) or std::nullopt
         */
        static std::optional<std::string> validate_path(const std::string& path);

    public:
        explicit HnS(const BlockCodec& codec) : orchestrator_(codec) {}

        /**Correct delete for children*/
        virtual ~HnS() = default;

        /**
         * Embed data to some container
         * @param data Vector with data to embed
         * @param path Path to file's container
         * @param out_path  Path to modified file
         * @return report (check ok()), or std::nullopt if a file could not be read or written
         */
        virtual std::optional<EmbedReport> embed(const std::vector<byte>& data, const std::string& path, const std::string& out_path) = 0;

        /**
         * Get data from modified file
         * @param path Path to file with container
         * @return report with terminal state and payload, or std::nullopt if the file could not be read
         */
        virtual std::optional<ExtractReport> extract(const std::string& path) = 0;

        /**
         * Resolve the redundant header without decoding the payload
         * @param path Path to file with container
         * @return header resolution or std::nullopt
         */
        virtual std::optional<HeaderResolution> read_header_only(const std::string& path) = 0;

        /**
         * Pick a carrier by extension and read its header
         * @param path Path to file with container
         * @return header resolution or std::nullopt (unsupported type, no header)
         */
        static std::optional<HeaderResolution> readHeaderOnly(const std::string& path);
    };
} // Meow

#endif //MEOWHNS_HNS_HH
