#ifndef MEOWHNS_CHECKSUM_HH
#define MEOWHNS_CHECKSUM_HH

#include <cstdint>
#include <vector>
#include <defines.hh>
#include <openssl/sha.h>

namespace Meow
{
    /**
     * Payload integrity checksum stored in the header
     * @param data Original (unpadded) payload
     * @return first 4 bytes of SHA-256(data), big-endian
     */
    uint32_t payload_checksum(const std::vector<byte>& data);
} // Meow

#endif //MEOWHNS_CHECKSUM_HH
