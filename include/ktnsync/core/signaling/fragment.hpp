/**
 * @file fragment.hpp
 * @brief "KTN1:i/n:payload" fragments for visual or manual transfer.
 *
 * Fragments may be scanned in any order. The assembler keys slices by their
 * 1-based index and completes once it holds every index in 1..total. An
 * index outside that range is ignored.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ktnsync {

    constexpr std::string_view kFragmentPrefix = "KTN1:";
    constexpr size_t kDefaultFragmentSize = 1500;

    /**
     * @struct Fragment
     * @brief One parsed fragment.
     */
    struct Fragment {
        int         index; ///< 1-based
        int         total;
        std::string payload;
    };

    /**
     * @brief Split text into slices of at most @p size bytes, never inside a UTF-8 sequence.
     * @throws SyncError(Internal) if @p size is zero
     */
    std::vector<std::string> splitFragments(std::string_view text, size_t size = kDefaultFragmentSize);

    /// "KTN1:{index}/{total}:{slice}"
    std::string wrapFragment(int index, int total, std::string_view slice);

    /**
     * @brief Match "KTN1:<int>/<int>:<rest>" with a non-empty rest.
     * @return The fragment, or std::nullopt if @p raw is not a fragment
     */
    std::optional<Fragment> parseFragment(std::string_view raw);

    /**
     * @class FragmentAssembler
     * @brief Collects scanned strings into one signaling text.
     */
    class FragmentAssembler {
    public:
        /**
         * @struct Progress
         * @brief Result of one add() call.
         */
        struct Progress {
            bool complete{ false };  ///< text holds the reassembled payload
            bool fragment{ false };  ///< the input was a KTN1 fragment
            bool ignored{ false };   ///< the fragment index was outside 1..total
            int  received{ 0 };      ///< distinct indices held
            int  total{ 0 };         ///< claimed total
            std::string text;        ///< set when complete
        };

        /**
         * @param strict when true flush() fails with MissingFragment on a gap,
         *               otherwise a missing slice renders as empty
         */
        explicit FragmentAssembler(bool strict = true) : strict_(strict) {}

        /**
         * @brief Feed one scanned string.
         *
         * A string that is not a fragment is returned as a complete payload.
         * A fragment with a total different from the one held restarts the
         * reassembly. On completion the assembler resets itself.
         */
        Progress add(std::string_view raw);

        /**
         * @brief Assemble the slices held so far without waiting for the rest.
         *
         * Returns an incomplete Progress when nothing is held.
         *
         * @throws SyncError(MissingFragment) in strict mode when a slice is missing;
         *         the held slices are kept so the missing ones can still be added
         */
        Progress flush();

        void reset();

        int received() const { return static_cast<int>(slices_.size()); }
        int total() const { return total_; }

    private:
        bool                       strict_;
        int                        total_{ 0 };
        std::map<int, std::string> slices_;
    };

}
