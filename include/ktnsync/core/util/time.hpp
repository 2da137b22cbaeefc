/**
 * @file time.hpp
 * @brief Time utility functions for ktnsync.
 *
 * Provides helpers for wall-clock milliseconds and for the
 * ISO-8601 timestamps carried by replicated entities and sync messages.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ktnsync {

    /**
     * @brief Get the current wall-clock time in milliseconds since the Unix epoch.
     * @return Current time in milliseconds since epoch
     */
    inline std::int64_t epochMillis()
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(
            system_clock::now().time_since_epoch()).count();
    }

    /**
     * @brief Format epoch milliseconds as "YYYY-MM-DDTHH:MM:SS.sssZ" (UTC).
     */
    std::string toIso8601(std::int64_t epochMs);

    /**
     * @brief Current wall-clock time as an ISO-8601 UTC string.
     */
    inline std::string isoNow() { return toIso8601(epochMillis()); }

    /**
     * @brief Parse an ISO-8601 timestamp into epoch milliseconds.
     *
     * Accepts "YYYY-MM-DD", or a date followed by "THH:MM[:SS[.fff]]" and an
     * optional "Z" or "+HH:MM"/"-HH:MM" offset. A time without a zone is read as UTC.
     *
     * @return Epoch milliseconds, or std::nullopt if the text is not a valid timestamp
     */
    std::optional<std::int64_t> parseIso8601(std::string_view text);

    /**
     * @brief True only if both timestamps parse and @p candidate is strictly later.
     */
    bool isStrictlyLater(std::string_view candidate, std::string_view reference);

    /**
     * @brief Lowercase base-36 rendering of a non-negative integer.
     */
    std::string toBase36(std::uint64_t value);
}
