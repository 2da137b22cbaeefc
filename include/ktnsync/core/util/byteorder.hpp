#pragma once
#include <cstdint>
#include <cstring>
#ifdef _WIN32
#include <intrin.h>
#else
#include <endian.h>
#endif

namespace ktnsync {
    /**
     * @brief Converts a 32-bit integer from host to network byte order (big endian).
     * @param value The value to convert.
     * @return The value in network byte order.
     */
    inline uint32_t hostToNetwork32(uint32_t value) {
#ifdef _WIN32
        return _byteswap_ulong(value);
#else
        return htobe32(value);
#endif
    }

    /**
     * @brief Converts a 32-bit integer from network byte order (big endian) to host byte order.
     * @param value The value to convert.
     * @return The value in host byte order.
     */
    inline uint32_t networkToHost32(uint32_t value) {
#ifdef _WIN32
        return _byteswap_ulong(value);
#else
        return be32toh(value);
#endif
    }

    /// Write @p value big-endian into out[0..3].
    inline void storeBE32(uint8_t* out, uint32_t value) {
        const uint32_t be = hostToNetwork32(value);
        std::memcpy(out, &be, sizeof(be));
    }

    /// Read a big-endian 32-bit value from in[0..3].
    inline uint32_t loadBE32(const uint8_t* in) {
        uint32_t be = 0;
        std::memcpy(&be, in, sizeof(be));
        return networkToHost32(be);
    }
}
