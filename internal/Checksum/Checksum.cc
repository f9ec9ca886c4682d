#include "Checksum.hh"

namespace Meow
{
    uint32_t payload_checksum(const std::vector<byte>& data)
    {
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(data.data(), data.size(), hash);
        return (static_cast<uint32_t>(hash[0]) << 24) |
               (static_cast<uint32_t>(hash[1]) << 16) |
               (static_cast<uint32_t>(hash[2]) << 8) |
               static_cast<uint32_t>(hash[3]);
    }
} // Meow
