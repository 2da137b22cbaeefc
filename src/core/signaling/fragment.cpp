#include "ktnsync/core/signaling/fragment.hpp"
#include "ktnsync/core/util/error_types.hpp"
#include "ktnsync/core/util/logger.hpp"
#include "internal/core/util/utf8.hpp"

#include <charconv>

namespace ktnsync {

    namespace {
        /* Parses a run of decimal digits ending at delim; advances pos past delim. */
        std::optional<int> readNumber(std::string_view s, size_t& pos, char delim) {
            size_t end = s.find(delim, pos);
            if (end == std::string_view::npos || end == pos) return std::nullopt;
            if (s[pos] < '0' || s[pos] > '9') return std::nullopt;
            int value = 0;
            auto [ptr, ec] = std::from_chars(s.data() + pos, s.data() + end, value);
            if (ec != std::errc{} || ptr != s.data() + end) return std::nullopt;
            pos = end + 1;
            return value;
        }
    }

    std::vector<std::string> splitFragments(std::string_view text, size_t size) {
        if (size == 0)
            throw SyncError(SyncErr::Internal, "fragment size must be positive");
        return utf8Split(text, size);
    }

    std::string wrapFragment(int index, int total, std::string_view slice) {
        std::string out(kFragmentPrefix);
        out += std::to_string(index);
        out += '/';
        out += std::to_string(total);
        out += ':';
        out += slice;
        return out;
    }

    std::optional<Fragment> parseFragment(std::string_view raw) {
        if (raw.substr(0, kFragmentPrefix.size()) != kFragmentPrefix) return std::nullopt;
        size_t pos = kFragmentPrefix.size();

        auto index = readNumber(raw, pos, '/');
        if (!index) return std::nullopt;
        auto total = readNumber(raw, pos, ':');
        if (!total || *total < 1) return std::nullopt;
        if (pos >= raw.size()) return std::nullopt;

        return Fragment{ *index, *total, std::string(raw.substr(pos)) };
    }

    void FragmentAssembler::reset() {
        total_ = 0;
        slices_.clear();
    }

    FragmentAssembler::Progress FragmentAssembler::add(std::string_view raw) {
        Progress p;
        auto frag = parseFragment(raw);
        if (!frag) {
            p.complete = true;
            p.text = std::string(raw);
            return p;
        }

        p.fragment = true;
        if (frag->index < 1 || frag->index > frag->total) {
            LOG_WARN("Ignoring fragment " + std::to_string(frag->index) + " of " + std::to_string(frag->total));
            p.ignored = true;
            p.received = received();
            p.total = total_;
            return p;
        }
        if (frag->total != total_) {
            if (!slices_.empty())
                LOG_WARN("Fragment total changed from " + std::to_string(total_) + " to " +
                         std::to_string(frag->total) + ", restarting reassembly");
            slices_.clear();
            total_ = frag->total;
        }
        slices_[frag->index] = std::move(frag->payload);

        p.received = received();
        p.total = total_;
        if (p.received < total_) return p;
        return flush();
    }

    FragmentAssembler::Progress FragmentAssembler::flush() {
        Progress p;
        p.fragment = true;
        p.received = received();
        p.total = total_;
        if (slices_.empty()) return p;

        std::string text;
        for (int i = 1; i <= total_; ++i) {
            auto it = slices_.find(i);
            if (it != slices_.end()) {
                text += it->second;
                continue;
            }
            if (strict_)
                throw SyncError(SyncErr::MissingFragment,
                    "fragment " + std::to_string(i) + " of " + std::to_string(total_) + " missing");
            LOG_WARN("Fragment " + std::to_string(i) + " missing, rendering it empty");
        }

        reset();
        p.complete = true;
        p.text = std::move(text);
        return p;
    }

}
