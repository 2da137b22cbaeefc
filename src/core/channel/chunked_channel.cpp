/**
 * @file chunked_channel.cpp
 * @brief Implementation of ChunkedChannel.
 *
 * Outbound messages go through one FIFO so that the chunks of two large
 * messages never interleave. Only the head of the FIFO is in flight; chunk
 * sends pause while the channel buffers more than highWaterBytes.
 */
#include "ktnsync/core/channel/chunked_channel.hpp"
#include "ktnsync/core/util/logger.hpp"
#include "ktnsync/core/util/time.hpp"
#include "internal/core/channel/reassembly_table.hpp"
#include "internal/core/util/utf8.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <deque>

namespace ktnsync {

    struct ChunkedChannel::Impl {
        struct Outgoing {
            std::string payload;
            SendHandler done;
        };

        boost::asio::io_context&      io;
        std::shared_ptr<IDataChannel> channel;
        SyncOptions                   opts;
        boost::asio::steady_timer     pollTimer;

        std::deque<Outgoing>          outbound;
        bool                          sending{ false };
        bool                          closed{ false };

        // Head-of-queue message being chunked.
        std::vector<std::string>      chunks;
        size_t                        nextChunk{ 0 };
        std::string                   streamId;
        std::int64_t                  lastStreamMs{ 0 };

        ReassemblyTable               inbound;
        MessageHandler                onMessage;
        CloseHandler                  onClose;

        std::shared_ptr<int>          life{ std::make_shared<int>(0) };

        Impl(boost::asio::io_context& io_, std::shared_ptr<IDataChannel> ch, SyncOptions o)
            : io(io_), channel(std::move(ch)), opts(std::move(o)), pollTimer(io_),
              inbound(opts.maxPendingStreams) {}

        void attach() {
            std::weak_ptr<int> guard = life;
            channel->setOpenCallback([this, guard] {
                if (guard.expired()) return;
                if (!outbound.empty())
                    LOG_INFO("Channel open, flushing " + std::to_string(outbound.size()) + " queued messages");
                pump();
            });
            channel->setCloseCallback([this, guard] {
                if (!guard.expired()) handleClose();
            });
            channel->setMessageCallback([this, guard](const std::string& frame) {
                if (!guard.expired()) onFrame(frame);
            });
            channel->setErrorCallback([guard](const std::string& err) {
                if (!guard.expired()) LOG_WARN("Channel error: " + err);
            });
        }

        void detach() {
            channel->setOpenCallback(nullptr);
            channel->setCloseCallback(nullptr);
            channel->setMessageCallback(nullptr);
            channel->setErrorCallback(nullptr);
        }

        void complete(SendHandler done, ErrorOpt err) {
            if (!done) return;
            boost::asio::post(io, [done = std::move(done), err = std::move(err)] { done(err); });
        }

        std::string nextStreamId() {
            std::int64_t now = epochMillis();
            if (now <= lastStreamMs) now = lastStreamMs + 1;
            lastStreamMs = now;
            return toBase36(static_cast<std::uint64_t>(now));
        }

        void enqueue(std::string message, SendHandler done) {
            if (closed || channel->readyState() == ChannelState::Closed ||
                channel->readyState() == ChannelState::Closing) {
                LOG_WARN("Send rejected, channel not ready");
                complete(std::move(done), makeError(SyncErr::ChannelClosed, "send on a closed channel"));
                return;
            }
            outbound.push_back({ std::move(message), std::move(done) });
            if (channel->readyState() == ChannelState::Connecting) {
                LOG_DEBUG("Channel connecting, message queued (" + std::to_string(outbound.size()) + " waiting)");
                return;
            }
            pump();
        }

        void pump() {
            while (!sending && !outbound.empty() && !closed) {
                if (channel->readyState() != ChannelState::Open) return;

                Outgoing& head = outbound.front();
                if (head.payload.size() <= opts.maxChunkBytes) {
                    if (!sendFrame(head.payload)) return;
                    finishHead();
                    continue;
                }

                sending = true;
                chunks = utf8Split(head.payload, opts.maxChunkBytes);
                nextChunk = 0;
                streamId = nextStreamId();
                LOG_DEBUG("Sending " + std::to_string(head.payload.size()) + " bytes as " +
                          std::to_string(chunks.size()) + " chunks, stream " + streamId);
                sendChunks();
                return;
            }
        }

        /* Returns false after failing the queue. */
        bool sendFrame(const std::string& frame) {
            try {
                channel->send(frame);
                return true;
            }
            catch (const SyncError& e) {
                failAll(e.toError());
            }
            catch (const std::exception& e) {
                failAll(makeError(SyncErr::ChannelClosed, e.what()));
            }
            return false;
        }

        void sendChunks() {
            if (!sending) return;
            const int total = static_cast<int>(chunks.size());
            while (nextChunk < chunks.size()) {
                if (closed || channel->readyState() != ChannelState::Open) {
                    failAll(makeError(SyncErr::ChannelClosed, "channel closed during chunked send"));
                    return;
                }
                if (channel->bufferedAmount() > opts.highWaterBytes) {
                    std::weak_ptr<int> guard = life;
                    pollTimer.expires_after(std::chrono::milliseconds(opts.backpressurePollMs));
                    pollTimer.async_wait([this, guard](const boost::system::error_code& ec) {
                        if (ec || guard.expired()) return;
                        sendChunks();
                    });
                    return;
                }

                ChunkEnvelope env{ streamId, static_cast<int>(nextChunk), total, std::move(chunks[nextChunk]) };
                if (!sendFrame(encodeChunk(env))) return;
                ++nextChunk;
            }

            chunks.clear();
            sending = false;
            finishHead();
            pump();
        }

        void finishHead() {
            Outgoing done = std::move(outbound.front());
            outbound.pop_front();
            complete(std::move(done.done), std::nullopt);
        }

        void failAll(const ErrorObj& err) {
            pollTimer.cancel();
            if (!outbound.empty())
                LOG_WARN("Failing " + std::to_string(outbound.size()) + " pending sends: " + err.detail);
            for (auto& o : outbound) complete(std::move(o.done), err);
            outbound.clear();
            chunks.clear();
            sending = false;
        }

        void onFrame(const std::string& frame) {
            std::string message;
            if (auto env = decodeChunk(frame)) {
                auto joined = inbound.add(std::move(*env));
                if (!joined) return;
                message = std::move(*joined);
            } else {
                message = frame;
            }
            if (onMessage) {
                auto h = onMessage;
                h(message);
            }
        }

        void handleClose() {
            if (closed) return;
            closed = true;
            LOG_INFO("Channel closed");
            failAll(makeError(SyncErr::ChannelClosed, "channel closed"));
            inbound.clear();
            if (onClose) {
                auto h = onClose;
                h();
            }
        }
    };

    ChunkedChannel::ChunkedChannel(boost::asio::io_context& io, std::shared_ptr<IDataChannel> channel, SyncOptions opts)
        : pImpl_(std::make_unique<Impl>(io, std::move(channel), std::move(opts)))
    {
        validateSyncOptions(pImpl_->opts);
        pImpl_->attach();
        if (pImpl_->channel->readyState() == ChannelState::Closed) pImpl_->closed = true;
    }

    ChunkedChannel::~ChunkedChannel() {
        close();
    }

    void ChunkedChannel::send(std::string message, SendHandler done) {
        pImpl_->enqueue(std::move(message), std::move(done));
    }

    void ChunkedChannel::sendMessage(const AppMessage& m, SendHandler done) {
        pImpl_->enqueue(encodeMessage(m), std::move(done));
    }

    void ChunkedChannel::setMessageHandler(MessageHandler h) { pImpl_->onMessage = std::move(h); }
    void ChunkedChannel::setCloseHandler(CloseHandler h) { pImpl_->onClose = std::move(h); }

    ChannelState ChunkedChannel::state() const {
        return pImpl_->closed ? ChannelState::Closed : pImpl_->channel->readyState();
    }

    size_t ChunkedChannel::queuedCount() const { return pImpl_->outbound.size(); }
    size_t ChunkedChannel::pendingStreams() const { return pImpl_->inbound.pending(); }

    void ChunkedChannel::close() {
        if (!pImpl_->life) return;
        pImpl_->life.reset();
        pImpl_->detach();
        pImpl_->closed = true;
        pImpl_->failAll(makeError(SyncErr::ChannelClosed, "channel closed locally"));
        pImpl_->inbound.clear();
        pImpl_->onMessage = nullptr;
        pImpl_->onClose = nullptr;
        pImpl_->channel->close();
    }

#ifdef KTNSYNC_TEST
    void ChunkedChannel::test_onFrame(const std::string& frame) {
        pImpl_->onFrame(frame);
    }
#endif

}
