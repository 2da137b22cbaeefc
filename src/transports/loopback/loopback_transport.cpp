#include "ktnsync/transports/loopback/loopback_transport.hpp"
#include "ktnsync/core/util/error_types.hpp"
#include "ktnsync/core/util/logger.hpp"
#include "internal/transports/sdp_util.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <algorithm>
#include <chrono>

namespace ktnsync {

    /* ------------------------------------------------------------------ */
    /*  Channel                                                           */
    /* ------------------------------------------------------------------ */

    class LoopbackDataChannel : public IDataChannel,
                                public std::enable_shared_from_this<LoopbackDataChannel> {
    public:
        LoopbackDataChannel(boost::asio::io_context& io, std::string label)
            : io_(io), label_(std::move(label)) {}

        static void pair(const std::shared_ptr<LoopbackDataChannel>& a,
                         const std::shared_ptr<LoopbackDataChannel>& b) {
            a->peer_ = b;
            b->peer_ = a;
        }

        const std::string& label() const override { return label_; }
        ChannelState readyState() const override { return state_; }
        size_t bufferedAmount() const override { return buffered_; }

        void send(const std::string& frame) override {
            if (state_ != ChannelState::Open)
                throw SyncError(SyncErr::ChannelClosed,
                    "send on loopback channel '" + label_ + "' in state " + toString(state_));

            buffered_ += frame.size();
            std::weak_ptr<LoopbackDataChannel> self = weak_from_this();
            std::weak_ptr<LoopbackDataChannel> peer = peer_;
            boost::asio::post(io_, [self, peer, frame] {
                if (auto s = self.lock()) s->buffered_ -= std::min(s->buffered_, frame.size());
                if (auto p = peer.lock()) p->deliver(frame);
            });
        }

        void close() override {
            if (state_ == ChannelState::Closing || state_ == ChannelState::Closed) return;
            state_ = ChannelState::Closing;
            std::weak_ptr<LoopbackDataChannel> self = weak_from_this();
            std::weak_ptr<LoopbackDataChannel> peer = peer_;
            boost::asio::post(io_, [self, peer] {
                if (auto s = self.lock()) s->finishClose();
                if (auto p = peer.lock()) p->finishClose();
            });
        }

        void markOpen() {
            if (state_ != ChannelState::Connecting) return;
            state_ = ChannelState::Open;
            auto cb = onOpen_;
            if (cb) cb();
        }

        /* Remote end went away without a clean close. */
        void fail(const std::string& why) {
            if (state_ == ChannelState::Closed) return;
            auto err = onError_;
            if (err) err(why);
            finishClose();
        }

        void setOpenCallback(ChannelOpenCallback cb) override { onOpen_ = std::move(cb); }
        void setCloseCallback(ChannelCloseCallback cb) override { onClose_ = std::move(cb); }
        void setMessageCallback(ChannelMessageCallback cb) override { onMessage_ = std::move(cb); }
        void setErrorCallback(ChannelErrorCallback cb) override { onError_ = std::move(cb); }

    private:
        void deliver(const std::string& frame) {
            if (state_ != ChannelState::Open) return;
            auto cb = onMessage_;
            if (cb) cb(frame);
        }

        void finishClose() {
            if (state_ == ChannelState::Closed) return;
            state_ = ChannelState::Closed;
            buffered_ = 0;
            auto cb = onClose_;
            if (cb) cb();
        }

        boost::asio::io_context& io_;
        std::string label_;
        ChannelState state_{ ChannelState::Connecting };
        size_t buffered_{ 0 };
        std::weak_ptr<LoopbackDataChannel> peer_;

        ChannelOpenCallback    onOpen_;
        ChannelCloseCallback   onClose_;
        ChannelMessageCallback onMessage_;
        ChannelErrorCallback   onError_;
    };

    /* ------------------------------------------------------------------ */
    /*  Peer connection                                                   */
    /* ------------------------------------------------------------------ */

    class LoopbackPeerConnection : public IPeerConnection,
                                   public std::enable_shared_from_this<LoopbackPeerConnection> {
    public:
        LoopbackPeerConnection(boost::asio::io_context& io, LoopbackNetwork& net)
            : io_(io), net_(net), gatherTimer_(io) {}

        ~LoopbackPeerConnection() override {
            if (!sessionId_.empty()) net_.unregisterPeer(sessionId_);
        }

        std::string setLocalDescription(SignalKind kind) override {
            if (closed_) throw SyncError(SyncErr::Internal, "loopback connection is closed");
            if (localKind_)
                throw SyncError(SyncErr::Internal, "local description already set");
            if (kind == SignalKind::Answer && !remoteSession_)
                throw SyncError(SyncErr::Internal, "answer requested before a remote offer was applied");
            if (kind == SignalKind::Offer && !channel_)
                throw SyncError(SyncErr::Internal, "offer requested without a data channel");

            localKind_ = kind;
            sessionId_ = sdp::newSessionId();
            net_.registerPeer(sessionId_, weak_from_this());

            std::string description = sdp::buildDescription(sessionId_, kind, "UDP/DTLS/SCTP",
                "a=sctp-port:5000\r\n");
            LOG_DEBUG("Loopback " + std::string(toString(kind)) + " session " + sessionId_);

            setGathering(GatheringState::Gathering);
            scheduleCandidate(0);
            return description;
        }

        void setRemoteDescription(SignalKind kind, const std::string& description) override {
            if (closed_) throw SyncError(SyncErr::Internal, "loopback connection is closed");
            auto id = sdp::sessionId(description);
            if (!id)
                throw SyncError(SyncErr::InvalidSignaling, "remote description has no session origin");
            if (kind == SignalKind::Answer && localKind_ != SignalKind::Offer)
                throw SyncError(SyncErr::InvalidSignaling, "answer applied without a local offer");
            if (kind == SignalKind::Offer && localKind_)
                throw SyncError(SyncErr::InvalidSignaling, "offer applied after a local description");

            remoteSession_ = *id;
            if (kind == SignalKind::Answer) {
                std::weak_ptr<LoopbackPeerConnection> self = weak_from_this();
                boost::asio::post(io_, [self] {
                    if (auto s = self.lock()) s->tryConnect();
                });
            }
        }

        void addRemoteCandidate(const IceCandidate& candidate) override {
            if (!remoteSession_)
                throw SyncError(SyncErr::InvalidSignaling, "candidate before remote description");
            if (!sdp::parseCandidate(candidate.candidate))
                throw SyncError(SyncErr::InvalidSignaling, "malformed candidate: " + candidate.candidate);
            ++remoteCandidates_;
        }

        std::shared_ptr<IDataChannel> createDataChannel(const std::string& label) override {
            if (localKind_)
                throw SyncError(SyncErr::Internal, "data channel must be created before the offer");
            channel_ = std::make_shared<LoopbackDataChannel>(io_, label);
            return channel_;
        }

        GatheringState gatheringState() const override { return gathering_; }
        PeerState state() const override { return state_; }

        void setLocalCandidateCallback(LocalCandidateCallback cb) override { onCandidate_ = std::move(cb); }
        void setGatheringStateCallback(GatheringStateCallback cb) override { onGathering_ = std::move(cb); }
        void setStateCallback(PeerStateCallback cb) override { onState_ = std::move(cb); }
        void setDataChannelCallback(DataChannelCallback cb) override { onDataChannel_ = std::move(cb); }

        void close() override {
            if (closed_) return;
            closed_ = true;
            gatherTimer_.cancel();
            onCandidate_ = nullptr;
            onGathering_ = nullptr;
            onState_ = nullptr;
            onDataChannel_ = nullptr;
            if (channel_) channel_->close();
            state_ = PeerState::Closed;
            if (!sessionId_.empty()) net_.unregisterPeer(sessionId_);
        }

        bool connected() const { return state_ == PeerState::Connected || state_ == PeerState::Disconnected; }

        void setState(PeerState s) {
            if (closed_ || state_ == s) return;
            state_ = s;
            auto cb = onState_;
            if (cb) cb(s);
            if (s == PeerState::Failed && channel_) channel_->fail("connection failed");
        }

    private:
        void setGathering(GatheringState g) {
            gathering_ = g;
            std::weak_ptr<LoopbackPeerConnection> self = weak_from_this();
            boost::asio::post(io_, [self, g] {
                auto s = self.lock();
                if (!s || s->closed_) return;
                auto cb = s->onGathering_;
                if (cb) cb(g);
            });
        }

        void scheduleCandidate(int n) {
            const auto& opts = net_.options();
            if (n >= opts.candidateCount) {
                if (opts.completeGathering) {
                    gathering_ = GatheringState::Complete;
                    notifyComplete();
                }
                return;
            }
            std::weak_ptr<LoopbackPeerConnection> self = weak_from_this();
            gatherTimer_.expires_after(std::chrono::milliseconds(opts.candidateIntervalMs));
            gatherTimer_.async_wait([self, n](const boost::system::error_code& ec) {
                auto s = self.lock();
                if (ec || !s || s->closed_) return;
                s->emitCandidate(n);
                s->scheduleCandidate(n + 1);
            });
        }

        void emitCandidate(int n) {
            sdp::Candidate c;
            c.foundation = std::to_string(n + 1);
            c.transport = "udp";
            c.priority = sdp::hostPriority(65535u - static_cast<uint32_t>(n));
            c.address = "127.0.0.1";
            c.port = static_cast<uint16_t>(50000 + n);
            c.type = "host";
            IceCandidate ice{ sdp::formatCandidate(c), std::string("0"), 0 };
            auto cb = onCandidate_;
            if (cb) cb(ice);
        }

        void notifyComplete() {
            std::weak_ptr<LoopbackPeerConnection> self = weak_from_this();
            boost::asio::post(io_, [self] {
                auto s = self.lock();
                if (!s || s->closed_) return;
                auto cb = s->onGathering_;
                if (cb) cb(GatheringState::Complete);
            });
        }

        /* Runs on the offering side once the answer has been applied. */
        void tryConnect() {
            if (closed_) return;
            setState(PeerState::Checking);
            if (closed_) return;

            auto remote = net_.findPeer(*remoteSession_);
            const auto& opts = net_.options();

            if (opts.neverOpen) {
                LOG_DEBUG("Loopback checks stalled for session " + sessionId_);
                return;
            }
            if (!remote || remote->closed_ || opts.failConnection || remoteCandidates_ == 0 ||
                remote->remoteCandidates_ == 0 || remote->remoteSession_ != sessionId_) {
                LOG_DEBUG("Loopback connectivity checks failed for session " + sessionId_);
                if (remote && !remote->closed_) remote->setState(PeerState::Failed);
                setState(PeerState::Failed);
                return;
            }

            remote->setState(PeerState::Connected);
            setState(PeerState::Connected);
            if (closed_ || remote->closed_ || !channel_) return;

            auto answering = std::make_shared<LoopbackDataChannel>(io_, channel_->label());
            LoopbackDataChannel::pair(channel_, answering);
            remote->channel_ = answering;
            auto cb = remote->onDataChannel_;
            if (cb) cb(answering);

            std::weak_ptr<LoopbackDataChannel> a = channel_;
            std::weak_ptr<LoopbackDataChannel> b = answering;
            boost::asio::post(io_, [a, b] {
                if (auto x = a.lock()) x->markOpen();
                if (auto y = b.lock()) y->markOpen();
            });
        }

        boost::asio::io_context& io_;
        LoopbackNetwork& net_;
        boost::asio::steady_timer gatherTimer_;

        std::optional<SignalKind> localKind_;
        std::string sessionId_;
        std::optional<std::string> remoteSession_;
        int remoteCandidates_{ 0 };
        GatheringState gathering_{ GatheringState::New };
        PeerState state_{ PeerState::New };
        bool closed_{ false };
        std::shared_ptr<LoopbackDataChannel> channel_;

        LocalCandidateCallback onCandidate_;
        GatheringStateCallback onGathering_;
        PeerStateCallback      onState_;
        DataChannelCallback    onDataChannel_;
    };

    /* ------------------------------------------------------------------ */
    /*  Network                                                           */
    /* ------------------------------------------------------------------ */

    LoopbackNetwork::LoopbackNetwork(boost::asio::io_context& io, LoopbackOptions opts)
        : io_(io), opts_(opts) {}

    LoopbackNetwork::~LoopbackNetwork() = default;

    std::shared_ptr<IPeerConnection> LoopbackNetwork::createPeerConnection(const TransportConfig& config) {
        LOG_TRACE("Loopback peer connection (" + std::to_string(config.iceServers.size()) +
                  " ice servers ignored)");
        return std::make_shared<LoopbackPeerConnection>(io_, *this);
    }

    void LoopbackNetwork::injectPeerState(PeerState s) {
        std::vector<std::shared_ptr<LoopbackPeerConnection>> live;
        for (auto& [id, weak] : peers_)
            if (auto pc = weak.lock(); pc && pc->connected()) live.push_back(pc);
        for (auto& pc : live) pc->setState(s);
    }

    std::pair<std::shared_ptr<IDataChannel>, std::shared_ptr<IDataChannel>>
    LoopbackNetwork::openChannelPair(const std::string& label) {
        auto a = std::make_shared<LoopbackDataChannel>(io_, label);
        auto b = std::make_shared<LoopbackDataChannel>(io_, label);
        LoopbackDataChannel::pair(a, b);
        std::weak_ptr<LoopbackDataChannel> wa = a, wb = b;
        boost::asio::post(io_, [wa, wb] {
            if (auto x = wa.lock()) x->markOpen();
            if (auto y = wb.lock()) y->markOpen();
        });
        return { a, b };
    }

    size_t LoopbackNetwork::liveConnections() const {
        size_t n = 0;
        for (const auto& [id, weak] : peers_)
            if (!weak.expired()) ++n;
        return n;
    }

    void LoopbackNetwork::registerPeer(const std::string& sessionId, std::weak_ptr<LoopbackPeerConnection> pc) {
        peers_[sessionId] = std::move(pc);
    }

    void LoopbackNetwork::unregisterPeer(const std::string& sessionId) {
        peers_.erase(sessionId);
    }

    std::shared_ptr<LoopbackPeerConnection> LoopbackNetwork::findPeer(const std::string& sessionId) const {
        auto it = peers_.find(sessionId);
        return it == peers_.end() ? nullptr : it->second.lock();
    }

}
