#pragma once
#include <string>
#include <vector>
#include "ktnsync/core/interfaces/ichannel.hpp"
#include "ktnsync/core/util/error_types.hpp"

using namespace ktnsync;

// Scripted channel: records frames, the test drives state and buffering.
class FakeChannel : public IDataChannel {
public:
    explicit FakeChannel(ChannelState initial = ChannelState::Open, std::string label = "sync")
        : state_(initial), label_(std::move(label)) {}

    const std::string& label() const override { return label_; }
    ChannelState readyState() const override { return state_; }
    size_t bufferedAmount() const override { return buffered; }

    void send(const std::string& frame) override {
        if (state_ != ChannelState::Open)
            throw SyncError(SyncErr::ChannelClosed, "fake channel not open");
        sent.push_back(frame);
        buffered += bufferPerSend;
    }

    void close() override {
        ++closeCalls;
        state_ = ChannelState::Closed;
    }

    void setOpenCallback(ChannelOpenCallback cb) override { onOpen = std::move(cb); }
    void setCloseCallback(ChannelCloseCallback cb) override { onClose = std::move(cb); }
    void setMessageCallback(ChannelMessageCallback cb) override { onMessage = std::move(cb); }
    void setErrorCallback(ChannelErrorCallback cb) override { onError = std::move(cb); }

    /* test controls */
    void open() {
        state_ = ChannelState::Open;
        if (onOpen) onOpen();
    }
    void remoteClose() {
        state_ = ChannelState::Closed;
        if (onClose) onClose();
    }
    void receive(const std::string& frame) {
        if (onMessage) onMessage(frame);
    }

    std::vector<std::string> sent;
    size_t buffered{ 0 };
    size_t bufferPerSend{ 0 };
    int closeCalls{ 0 };

    ChannelOpenCallback    onOpen;
    ChannelCloseCallback   onClose;
    ChannelMessageCallback onMessage;
    ChannelErrorCallback   onError;

private:
    ChannelState state_;
    std::string label_;
};
