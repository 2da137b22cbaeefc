/**
 * @file hex.hpp
 * @brief Hexadecimal helpers for device ids.
 *
 * Device ids are 16 random bytes rendered as 32 lowercase hex characters.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <array>
#include <string>
#include <string_view>
#include <cstdint>
#include <sstream>
#include <iomanip>

namespace ktnsync {

    /**
     * @brief Convert a 16-byte array to a 32-character lowercase hexadecimal string.
     *
     * @param buf 16-byte array to convert
     * @return 32-character lowercase hexadecimal string
     */
    inline std::string toHex(const std::array<uint8_t, 16>& buf)
    {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (auto b : buf)
            oss << std::setw(2) << static_cast<int>(b);
        return oss.str();
    }

    /**
     * @brief True if @p s is exactly 32 hexadecimal characters.
     */
    inline bool isHex128(std::string_view s)
    {
        if (s.size() != 32) return false;
        for (char c : s) {
            bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
            if (!ok) return false;
        }
        return true;
    }

}
