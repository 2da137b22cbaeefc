/**
 * @file random.hpp
 * @brief Random number utility functions for ktnsync.
 *
 * Provides helpers for generating cryptographically secure random tokens,
 * used for device ids and transport session ids.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <array>
#include <cstdint>
#include <openssl/err.h>
#include <openssl/rand.h>
#include "ktnsync/core/util/error_types.hpp"

namespace ktnsync {

    /**
     * @brief Fill a 16-byte array with random data from the OpenSSL CSPRNG.
     *
     * @param tok Reference to a 16-byte array to fill with random bytes
     * @throws SyncError(Internal) if the generator is not seeded
     */
    inline void randomFill(std::array<uint8_t, 16>& tok)
    {
        if (RAND_bytes(tok.data(), static_cast<int>(tok.size())) != 1) {
            throw SyncError(SyncErr::Internal,
                "RAND_bytes failed: " + std::to_string(ERR_get_error()));
        }
    }

}
