/**
 * @file chunked_channel.hpp
 * @brief Large-message delivery over one logical channel.
 *
 * Messages above SyncOptions::maxChunkBytes travel as "__chunk__" envelopes
 * sharing a stream id; the receiver joins them before handing the message on.
 * While the channel is still connecting, sends are queued and flushed in
 * order once it opens.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <functional>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include "ktnsync/core/interfaces/ichannel.hpp"
#include "ktnsync/core/protocol/sync_messages.hpp"
#include "ktnsync/core/util/error_types.hpp"
#include "ktnsync/core/util/sync_options.hpp"

namespace ktnsync {

    /**
     * @class ChunkedChannel
     * @brief Wraps an IDataChannel with chunking, reassembly, backpressure and a send queue.
     */
    class ChunkedChannel {
    public:
        using SendHandler    = std::function<void(ErrorOpt)>;
        using MessageHandler = std::function<void(const std::string&)>;
        using CloseHandler   = std::function<void()>;

        /// @throws SyncError(Internal) if @p opts fails validateSyncOptions()
        ChunkedChannel(boost::asio::io_context& io, std::shared_ptr<IDataChannel> channel, SyncOptions opts = {});
        ~ChunkedChannel();

        ChunkedChannel(const ChunkedChannel&) = delete;
        ChunkedChannel& operator=(const ChunkedChannel&) = delete;

        /**
         * @brief Send one message.
         *
         * @p done runs on the io_context once every frame of the message was
         * handed to the channel, or with ChannelClosed if the channel closed
         * first. Messages sent after close are rejected the same way.
         */
        void send(std::string message, SendHandler done = {});

        /// Encode and send an application message.
        void sendMessage(const AppMessage& m, SendHandler done = {});

        void setMessageHandler(MessageHandler h);
        void setCloseHandler(CloseHandler h);

        ChannelState state() const;

        /// Messages accepted but not fully handed to the channel yet.
        size_t queuedCount() const;

        /// Chunk streams partially received.
        size_t pendingStreams() const;

        /**
         * @brief Fail pending sends, drop buffers, detach from and close the channel.
         */
        void close();

#ifdef KTNSYNC_TEST
        /// Inject a frame as if it arrived from the channel.
        void test_onFrame(const std::string& frame);
#endif

    private:
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
