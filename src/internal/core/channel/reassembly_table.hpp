/**
 * @file reassembly_table.hpp
 * @brief Per-stream buffers for chunked messages.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <algorithm>
#include <deque>
#include <optional>
#include <string>
#include <vector>
#include <folly/container/F14Map.h>
#include "ktnsync/core/protocol/sync_messages.hpp"
#include "ktnsync/core/util/logger.hpp"

namespace ktnsync {

    /**
     * @struct ChunkBuffer
     * @brief Slices of one in-flight message.
     */
    struct ChunkBuffer {
        std::vector<std::optional<std::string>> parts; ///< size == total
        int received{ 0 };                            ///< distinct indices held
    };

    /**
     * @class ReassemblyTable
     * @brief Maps chunkId to its buffer; a buffer is dropped once delivered.
     *
     * At most maxStreams incomplete streams are held. Opening one more evicts
     * the stream that was opened first.
     */
    class ReassemblyTable {
    public:
        static constexpr int kMaxChunksPerStream = 1 << 16;

        explicit ReassemblyTable(size_t maxStreams) : maxStreams_(maxStreams) {}

        /**
         * @brief Store one envelope.
         * @return The joined message once every index of its stream is held
         */
        std::optional<std::string> add(ChunkEnvelope&& c) {
            if (c.total <= 0 || c.total > kMaxChunksPerStream || c.index < 0 || c.index >= c.total) {
                LOG_WARN("Dropping chunk " + c.chunkId + " with index " + std::to_string(c.index) +
                         " of " + std::to_string(c.total));
                return std::nullopt;
            }

            auto it = buffers_.find(c.chunkId);
            if (it == buffers_.end()) {
                while (buffers_.size() >= maxStreams_) evictOldest();
                it = buffers_.try_emplace(c.chunkId).first;
                it->second.parts.resize(static_cast<size_t>(c.total));
                order_.push_back(c.chunkId);
            } else if (it->second.parts.size() != static_cast<size_t>(c.total)) {
                LOG_WARN("Dropping chunk " + c.chunkId + ": total " + std::to_string(c.total) +
                         " disagrees with " + std::to_string(it->second.parts.size()));
                return std::nullopt;
            }
            ChunkBuffer& buf = it->second;

            auto& slot = buf.parts[static_cast<size_t>(c.index)];
            if (slot) {
                LOG_DEBUG("Duplicate chunk " + std::to_string(c.index) + " of " + c.chunkId + " ignored");
                return std::nullopt;
            }
            slot = std::move(c.data);
            ++buf.received;

            if (buf.received < c.total) return std::nullopt;

            std::string joined;
            for (auto& p : buf.parts) joined += *p;
            buffers_.erase(it);
            order_.erase(std::find(order_.begin(), order_.end(), c.chunkId));
            return joined;
        }

        size_t pending() const { return buffers_.size(); }

        void clear() {
            buffers_.clear();
            order_.clear();
        }

    private:
        void evictOldest() {
            const std::string id = std::move(order_.front());
            order_.pop_front();
            auto it = buffers_.find(id);
            LOG_WARN("Too many incomplete streams, dropping " + id + " with " +
                     std::to_string(it->second.received) + " of " +
                     std::to_string(it->second.parts.size()) + " chunks");
            buffers_.erase(it);
        }

        size_t                                      maxStreams_;
        folly::F14FastMap<std::string, ChunkBuffer> buffers_;
        std::deque<std::string>                     order_;   ///< open order of buffers_ keys
    };

}
