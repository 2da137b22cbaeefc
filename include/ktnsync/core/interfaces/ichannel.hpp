/**
 * @file ichannel.hpp
 * @brief Interface for the logical channel produced by negotiation.
 *
 * An IDataChannel is an ordered, reliable, message-oriented pipe. All
 * callbacks fire on the io_context the channel was created on.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <cstddef>
#include <functional>
#include <string>

namespace ktnsync {

    /**
     * @enum ChannelState
     * @brief Ready state of a logical channel.
     */
    enum class ChannelState { Connecting, Open, Closing, Closed };

    const char* toString(ChannelState s);

    using ChannelOpenCallback    = std::function<void()>;
    using ChannelCloseCallback   = std::function<void()>;
    using ChannelMessageCallback = std::function<void(const std::string&)>;
    using ChannelErrorCallback   = std::function<void(const std::string&)>;

    /**
     * @class IDataChannel
     * @brief Interface for ordered, reliable message channels.
     */
    class IDataChannel {
    public:
        virtual ~IDataChannel() = default;

        virtual const std::string& label() const = 0;
        virtual ChannelState readyState() const = 0;

        /**
         * @brief Bytes accepted by send() but not yet handed to the network.
         */
        virtual size_t bufferedAmount() const = 0;

        /**
         * @brief Queue one message frame.
         * @throws SyncError(ChannelClosed) unless the channel is Open
         */
        virtual void send(const std::string& frame) = 0;

        /**
         * @brief Close the channel; the close callback fires once, asynchronously.
         */
        virtual void close() = 0;

        virtual void setOpenCallback(ChannelOpenCallback cb) = 0;
        virtual void setCloseCallback(ChannelCloseCallback cb) = 0;
        virtual void setMessageCallback(ChannelMessageCallback cb) = 0;
        virtual void setErrorCallback(ChannelErrorCallback cb) = 0;
    };

}
