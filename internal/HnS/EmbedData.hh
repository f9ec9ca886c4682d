#ifndef MEOWHNS_EMBEDDATA_HH
#define MEOWHNS_EMBEDDATA_HH

#include <vector>
#include <optional>
#include <cstdint>
#include <defines.hh>
#include "Format.hh"
#include "Header.hh"
#include "Payload.hh"

namespace Meow
{
    enum class RecoveryState : uint8_t
    {
        Start,
        HeaderResolved,
        PayloadDecoded,
        Success,
        PartialSuccess,
        Failed
    };

    const char* to_string(RecoveryState state);

    struct EmbedReport
    {
        MeowError error          = MeowError::None;   // None, InsufficientCapacity or PayloadTooLarge
        MeowError notice         = MeowError::None;   // CapabilityUnavailable when raw mode was recorded
        Header    header;
        uint64_t  bits_required  = 0;
        uint64_t  bits_available = 0;
        uint32_t  codewords      = 0;

        bool ok() const
        { return error == MeowError::None; }

        bool ecc_applied() const
        { return header.ecc; }
    };

    struct ExtractReport
    {
        RecoveryState             state  = RecoveryState::Start;
        MeowError                 reason = MeowError::None;
        std::optional<Header>     header;
        HeaderSource              header_source = HeaderSource::Primary;
        std::vector<byte>         payload;            // empty when Failed
        std::vector<BlockOutcome> blocks;
        std::vector<uint32_t>     failed_blocks;
        uint32_t                  corrected_symbols = 0;
        bool                      checksum_mismatch = false;

        bool recovered_from_secondary() const
        { return header.has_value() && header_source == HeaderSource::Secondary; }
    };

} // namespace Meow

#endif // MEOWHNS_EMBEDDATA_HH
