#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ktnsync {

    /**
     * @brief Largest cut position <= @p limit that does not fall inside a UTF-8 sequence.
     *
     * Returns @p limit when the text is shorter. A cut never lands on a
     * continuation byte unless the run of continuation bytes exceeds four
     * (invalid input), in which case the raw limit is used.
     */
    inline size_t utf8SafeCut(std::string_view text, size_t limit) {
        if (limit >= text.size()) return text.size();
        size_t cut = limit;
        size_t backed = 0;
        while (cut > 0 && backed < 4 &&
               (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
            --cut;
            ++backed;
        }
        if (cut == 0 || backed == 4) return limit;
        return cut;
    }

    /**
     * @brief Split text into slices of at most @p size bytes on code point boundaries.
     */
    inline std::vector<std::string> utf8Split(std::string_view text, size_t size) {
        std::vector<std::string> out;
        if (size == 0) return out;
        size_t pos = 0;
        while (pos < text.size()) {
            size_t cut = utf8SafeCut(text.substr(pos), size);
            out.emplace_back(text.substr(pos, cut));
            pos += cut;
        }
        return out;
    }

}
