#include "ktnsync/transports/tcp/tcp_direct_transport.hpp"
#include "ktnsync/core/util/byteorder.hpp"
#include "ktnsync/core/util/error_types.hpp"
#include "ktnsync/core/util/logger.hpp"
#include "internal/transports/sdp_util.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <deque>
#include <functional>
#include <optional>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>

namespace ktnsync {

    using boost::asio::ip::tcp;

    namespace {
        const std::string kHello   = "KTNSYNC/1 HELLO";
        const std::string kWelcome = "KTNSYNC/1 WELCOME";
        const std::string kProto   = "TCP/KTNSYNC";

        /*
         * Length-prefixed frames over one socket. One read at a time; writes
         * are queued and go out in order.
         */
        class FramedStream : public std::enable_shared_from_this<FramedStream> {
        public:
            using ReadHandler  = std::function<void(const boost::system::error_code&, std::string)>;
            using WriteHandler = std::function<void(const boost::system::error_code&)>;

            FramedStream(tcp::socket sock, uint32_t maxFrame)
                : sock_(std::move(sock)), maxFrame_(maxFrame) {}

            void readFrame(ReadHandler h) {
                auto self = shared_from_this();
                boost::asio::async_read(sock_, boost::asio::buffer(header_),
                    [this, self, h](const boost::system::error_code& ec, size_t) {
                        if (ec) {
                            h(ec, {});
                            return;
                        }
                        const uint32_t len = loadBE32(header_.data());
                        if (len > maxFrame_) {
                            h(boost::asio::error::message_size, {});
                            return;
                        }
                        body_.assign(len, '\0');
                        if (len == 0) {
                            h({}, {});
                            return;
                        }
                        boost::asio::async_read(sock_, boost::asio::buffer(body_),
                            [this, self, h](const boost::system::error_code& ec2, size_t) {
                                if (ec2) {
                                    h(ec2, {});
                                    return;
                                }
                                h({}, std::move(body_));
                            });
                    });
            }

            void writeFrame(const std::string& payload, WriteHandler h) {
                std::string frame(4 + payload.size(), '\0');
                storeBE32(reinterpret_cast<uint8_t*>(frame.data()), static_cast<uint32_t>(payload.size()));
                std::memcpy(frame.data() + 4, payload.data(), payload.size());
                queue_.push_back({ std::move(frame), payload.size(), std::move(h) });
                queued_ += payload.size();
                if (!writing_) writeNext();
            }

            size_t queuedBytes() const { return queued_; }
            bool idle() const { return !writing_ && queue_.empty(); }

            void close() {
                boost::system::error_code ec;
                sock_.shutdown(tcp::socket::shutdown_both, ec);
                sock_.close(ec);
            }

        private:
            struct Pending {
                std::string  bytes;
                size_t       payloadSize;
                WriteHandler done;
            };

            void writeNext() {
                if (queue_.empty()) {
                    writing_ = false;
                    return;
                }
                writing_ = true;
                auto self = shared_from_this();
                boost::asio::async_write(sock_, boost::asio::buffer(queue_.front().bytes),
                    [this, self](const boost::system::error_code& ec, size_t) {
                        Pending head = std::move(queue_.front());
                        queue_.pop_front();
                        queued_ -= head.payloadSize;

                        if (ec) {
                            std::deque<Pending> dropped;
                            dropped.swap(queue_);
                            queued_ = 0;
                            writing_ = false;
                            if (head.done) head.done(ec);
                            for (auto& p : dropped)
                                if (p.done) p.done(ec);
                            return;
                        }
                        writeNext();
                        if (head.done) head.done(ec);
                    });
            }

            tcp::socket             sock_;
            uint32_t                maxFrame_;
            std::array<uint8_t, 4>  header_{};
            std::string             body_;
            std::deque<Pending>     queue_;
            size_t                  queued_{ 0 };
            bool                    writing_{ false };
        };

        std::vector<std::string> listAddresses(const TcpTransportOptions& opts) {
            if (opts.loopbackOnly) return { "127.0.0.1" };

            std::vector<std::string> out;
            ifaddrs* list = nullptr;
            if (getifaddrs(&list) == -1) {
                LOG_WARN(std::string("getifaddrs failed: ") + std::strerror(errno));
                return { "127.0.0.1" };
            }
            for (ifaddrs* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
                if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) continue;
                auto* in4 = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
                char buf[INET_ADDRSTRLEN];
                if (!inet_ntop(AF_INET, &in4->sin_addr, buf, sizeof(buf))) continue;
                std::string addr(buf);
                const bool loopback = addr.rfind("127.", 0) == 0;
                if (loopback && !opts.includeLoopback) continue;
                out.push_back(std::move(addr));
            }
            freeifaddrs(list);

            if (out.empty()) {
                LOG_WARN("No usable IPv4 interface, falling back to loopback");
                out.push_back("127.0.0.1");
            }
            return out;
        }

    /* ------------------------------------------------------------------ */
    /*  Channel                                                           */
    /* ------------------------------------------------------------------ */

    class TcpDataChannel : public IDataChannel, public std::enable_shared_from_this<TcpDataChannel> {
    public:
        TcpDataChannel(boost::asio::io_context& io, std::string label, uint32_t maxFrame)
            : io_(io), label_(std::move(label)), maxFrame_(maxFrame) {}

        /* Takes over a handshaken stream; open fires on the next loop turn. */
        void attach(std::shared_ptr<FramedStream> stream) {
            if (state_ != ChannelState::Connecting) {
                stream->close();
                return;
            }
            stream_ = std::move(stream);
            state_ = ChannelState::Open;

            std::weak_ptr<TcpDataChannel> self = weak_from_this();
            boost::asio::post(io_, [self] {
                auto s = self.lock();
                if (!s || s->state_ != ChannelState::Open) return;
                auto cb = s->onOpen_;
                if (cb) cb();
                s->readLoop();
            });
        }

        const std::string& label() const override { return label_; }
        ChannelState readyState() const override { return state_; }
        size_t bufferedAmount() const override { return stream_ ? stream_->queuedBytes() : 0; }

        void send(const std::string& frame) override {
            if (state_ != ChannelState::Open)
                throw SyncError(SyncErr::ChannelClosed,
                    "send on tcp channel '" + label_ + "' in state " + toString(state_));
            if (frame.size() > maxFrame_)
                throw SyncError(SyncErr::Internal,
                    "frame of " + std::to_string(frame.size()) + " bytes exceeds the tcp frame limit");

            std::weak_ptr<TcpDataChannel> self = weak_from_this();
            stream_->writeFrame(frame, [self](const boost::system::error_code& ec) {
                auto s = self.lock();
                if (!s) return;
                if (ec) {
                    s->onStreamError(ec);
                    return;
                }
                if (s->state_ == ChannelState::Closing && s->stream_->idle()) s->shutdown();
            });
        }

        void close() override {
            if (state_ == ChannelState::Closing || state_ == ChannelState::Closed) return;
            if (!stream_) {
                state_ = ChannelState::Closing;
                postFinishClose();
                return;
            }
            state_ = ChannelState::Closing;
            // Queued frames are flushed before the socket goes down.
            if (stream_->idle()) shutdown();
        }

        void setOpenCallback(ChannelOpenCallback cb) override { onOpen_ = std::move(cb); }
        void setCloseCallback(ChannelCloseCallback cb) override { onClose_ = std::move(cb); }
        void setMessageCallback(ChannelMessageCallback cb) override { onMessage_ = std::move(cb); }
        void setErrorCallback(ChannelErrorCallback cb) override { onError_ = std::move(cb); }

    private:
        void readLoop() {
            std::weak_ptr<TcpDataChannel> self = weak_from_this();
            stream_->readFrame([self](const boost::system::error_code& ec, std::string msg) {
                auto s = self.lock();
                if (!s) return;
                if (ec) {
                    if (s->state_ == ChannelState::Open) s->onStreamError(ec);
                    else s->finishClose();
                    return;
                }
                if (s->state_ == ChannelState::Open) {
                    auto cb = s->onMessage_;
                    if (cb) cb(msg);
                }
                if (s->state_ == ChannelState::Open || s->state_ == ChannelState::Closing) s->readLoop();
            });
        }

        void onStreamError(const boost::system::error_code& ec) {
            if (state_ == ChannelState::Closed) return;
            if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                LOG_WARN("TCP channel '" + label_ + "' error: " + ec.message());
                auto cb = onError_;
                if (cb) cb(ec.message());
            }
            finishClose();
        }

        void shutdown() {
            if (stream_) stream_->close();
            postFinishClose();
        }

        void postFinishClose() {
            std::weak_ptr<TcpDataChannel> self = weak_from_this();
            boost::asio::post(io_, [self] {
                if (auto s = self.lock()) s->finishClose();
            });
        }

        void finishClose() {
            if (state_ == ChannelState::Closed) return;
            state_ = ChannelState::Closed;
            if (stream_) stream_->close();
            auto cb = onClose_;
            if (cb) cb();
        }

        boost::asio::io_context&      io_;
        std::string                   label_;
        uint32_t                      maxFrame_;
        ChannelState                  state_{ ChannelState::Connecting };
        std::shared_ptr<FramedStream> stream_;

        ChannelOpenCallback    onOpen_;
        ChannelCloseCallback   onClose_;
        ChannelMessageCallback onMessage_;
        ChannelErrorCallback   onError_;
    };

    /* ------------------------------------------------------------------ */
    /*  Peer connection                                                   */
    /* ------------------------------------------------------------------ */

    class TcpPeerConnection : public IPeerConnection, public std::enable_shared_from_this<TcpPeerConnection> {
    public:
        TcpPeerConnection(boost::asio::io_context& io, TcpTransportOptions opts, std::vector<std::string> addrs)
            : io_(io), opts_(opts), addresses_(std::move(addrs)) {}

        ~TcpPeerConnection() override { close(); }

        std::string setLocalDescription(SignalKind kind) override {
            if (closed_) throw SyncError(SyncErr::Internal, "tcp connection is closed");
            if (localKind_) throw SyncError(SyncErr::Internal, "local description already set");

            std::vector<sdp::Candidate> cands;
            uint32_t pref = 65535;
            if (kind == SignalKind::Offer) {
                if (!channel_) throw SyncError(SyncErr::Internal, "offer requested without a data channel");
                for (const auto& a : addresses_)
                    cands.push_back(makeCandidate(cands.size(), a, 9, "active", pref--));
            } else {
                if (!remoteSession_)
                    throw SyncError(SyncErr::Internal, "answer requested before a remote offer was applied");
                const uint16_t port = listen();
                for (const auto& a : addresses_)
                    cands.push_back(makeCandidate(cands.size(), a, port, "passive", pref--));
            }

            localKind_ = kind;
            sessionId_ = sdp::newSessionId();
            std::string description = sdp::buildDescription(sessionId_, kind, kProto,
                "a=ktnsync-label:" + label_ + "\r\n");

            gathering_ = GatheringState::Gathering;
            std::weak_ptr<TcpPeerConnection> self = weak_from_this();
            boost::asio::post(io_, [self, cands] {
                auto s = self.lock();
                if (!s || s->closed_) return;
                for (const auto& c : cands) {
                    auto cb = s->onCandidate_;
                    if (cb) cb(IceCandidate{ sdp::formatCandidate(c), std::string("0"), 0 });
                    if (s->closed_) return;
                }
                s->gathering_ = GatheringState::Complete;
                auto g = s->onGathering_;
                if (g) g(GatheringState::Complete);
            });
            return description;
        }

        void setRemoteDescription(SignalKind kind, const std::string& description) override {
            if (closed_) throw SyncError(SyncErr::Internal, "tcp connection is closed");
            auto id = sdp::sessionId(description);
            if (!id) throw SyncError(SyncErr::InvalidSignaling, "remote description has no session origin");
            auto label = sdp::attribute(description, "ktnsync-label");
            if (!label || label->empty())
                throw SyncError(SyncErr::InvalidSignaling, "remote description is not a tcp data channel");

            if (kind == SignalKind::Answer) {
                if (localKind_ != SignalKind::Offer)
                    throw SyncError(SyncErr::InvalidSignaling, "answer applied without a local offer");
                remoteSession_ = *id;
                std::weak_ptr<TcpPeerConnection> self = weak_from_this();
                boost::asio::post(io_, [self] {
                    if (auto s = self.lock()) s->tryConnect();
                });
                return;
            }
            if (localKind_) throw SyncError(SyncErr::InvalidSignaling, "offer applied after a local description");
            remoteSession_ = *id;
            label_ = *label;
        }

        void addRemoteCandidate(const IceCandidate& candidate) override {
            if (!remoteSession_) throw SyncError(SyncErr::InvalidSignaling, "candidate before remote description");
            auto c = sdp::parseCandidate(candidate.candidate);
            if (!c) throw SyncError(SyncErr::InvalidSignaling, "malformed candidate: " + candidate.candidate);
            if (c->transport != "tcp" || c->tcpType != "passive") {
                LOG_DEBUG("Ignoring non-passive candidate " + candidate.candidate);
                return;
            }
            boost::system::error_code ec;
            auto addr = boost::asio::ip::make_address_v4(c->address, ec);
            if (ec) {
                LOG_WARN("Ignoring candidate with bad address " + c->address);
                return;
            }
            remote_.emplace_back(c->priority, tcp::endpoint(addr, c->port));
        }

        std::shared_ptr<IDataChannel> createDataChannel(const std::string& label) override {
            if (localKind_) throw SyncError(SyncErr::Internal, "data channel must be created before the offer");
            label_ = label;
            channel_ = std::make_shared<TcpDataChannel>(io_, label, opts_.maxFrameBytes);
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
            onCandidate_ = nullptr;
            onGathering_ = nullptr;
            onState_ = nullptr;
            onDataChannel_ = nullptr;
            if (acceptor_) {
                boost::system::error_code ec;
                acceptor_->close(ec);
            }
            if (handshake_) handshake_->close();
            if (channel_) channel_->close();
            state_ = PeerState::Closed;
        }

    private:
        static sdp::Candidate makeCandidate(size_t n, const std::string& addr, uint16_t port,
                                            const char* tcpType, uint32_t pref) {
            sdp::Candidate c;
            c.foundation = std::to_string(n + 1);
            c.transport = "tcp";
            c.priority = sdp::hostPriority(pref);
            c.address = addr;
            c.port = port;
            c.type = "host";
            c.tcpType = tcpType;
            return c;
        }

        void setState(PeerState s) {
            if (closed_ || state_ == s) return;
            state_ = s;
            LOG_DEBUG(std::string("TCP peer state ") + toString(s));
            auto cb = onState_;
            if (cb) cb(s);
        }

        uint16_t listen() {
            try {
                acceptor_.emplace(io_, tcp::endpoint(tcp::v4(), 0));
            }
            catch (const boost::system::system_error& e) {
                throw SyncError(SyncErr::ConnectionFailed, std::string("cannot listen: ") + e.what());
            }
            const uint16_t port = acceptor_->local_endpoint().port();
            LOG_INFO("Listening for the paired device on port " + std::to_string(port));
            accept();
            return port;
        }

        void accept() {
            std::weak_ptr<TcpPeerConnection> self = weak_from_this();
            acceptor_->async_accept([self](const boost::system::error_code& ec, tcp::socket sock) {
                auto s = self.lock();
                if (!s || s->closed_) return;
                if (ec) {
                    if (ec != boost::asio::error::operation_aborted)
                        LOG_WARN("Accept failed: " + ec.message());
                    return;
                }
                s->onAccepted(std::move(sock));
            });
        }

        /* Answering side: wait for the HELLO naming both sessions. */
        void onAccepted(tcp::socket sock) {
            if (state_ == PeerState::Connected) {
                boost::system::error_code ec;
                sock.close(ec);
                return;
            }
            setState(PeerState::Checking);
            auto stream = std::make_shared<FramedStream>(std::move(sock), opts_.maxFrameBytes);
            std::weak_ptr<TcpPeerConnection> self = weak_from_this();
            stream->readFrame([self, stream](const boost::system::error_code& ec, std::string msg) {
                auto s = self.lock();
                if (!s || s->closed_) {
                    stream->close();
                    return;
                }
                const std::string expected = kHello + " " + s->sessionId_ + " " + *s->remoteSession_;
                if (ec || msg != expected || s->state_ == PeerState::Connected) {
                    LOG_WARN("Rejected an inbound connection that is not the paired device");
                    stream->close();
                    return;
                }
                stream->writeFrame(kWelcome + " " + s->sessionId_, nullptr);
                boost::system::error_code ignored;
                s->acceptor_->close(ignored);
                s->setState(PeerState::Connected);
                if (s->closed_) return;

                s->channel_ = std::make_shared<TcpDataChannel>(s->io_, s->label_, s->opts_.maxFrameBytes);
                auto cb = s->onDataChannel_;
                if (cb) cb(s->channel_);
                s->channel_->attach(stream);
            });
            accept();
        }

        /* Offering side: dial passive candidates by priority. */
        void tryConnect() {
            if (closed_) return;
            setState(PeerState::Checking);
            std::stable_sort(remote_.begin(), remote_.end(),
                [](const auto& a, const auto& b) { return a.first > b.first; });
            if (remote_.empty()) {
                LOG_WARN("Answer carried no reachable tcp candidate");
                setState(PeerState::Failed);
                return;
            }
            connectTo(0);
        }

        void connectTo(size_t i) {
            if (closed_) return;
            if (i >= remote_.size()) {
                LOG_WARN("All " + std::to_string(remote_.size()) + " tcp candidates failed");
                setState(PeerState::Failed);
                if (channel_) channel_->close();
                return;
            }
            const tcp::endpoint ep = remote_[i].second;
            LOG_DEBUG("Dialing " + ep.address().to_string() + ":" + std::to_string(ep.port()));

            auto sock = std::make_shared<tcp::socket>(io_);
            std::weak_ptr<TcpPeerConnection> self = weak_from_this();
            sock->async_connect(ep, [self, sock, i](const boost::system::error_code& ec) {
                auto s = self.lock();
                if (!s || s->closed_) return;
                if (ec) {
                    LOG_DEBUG("Candidate " + std::to_string(i) + " unreachable: " + ec.message());
                    s->connectTo(i + 1);
                    return;
                }
                s->hello(std::move(*sock), i);
            });
        }

        void hello(tcp::socket sock, size_t i) {
            handshake_ = std::make_shared<FramedStream>(std::move(sock), opts_.maxFrameBytes);
            handshake_->writeFrame(kHello + " " + *remoteSession_ + " " + sessionId_, nullptr);

            std::weak_ptr<TcpPeerConnection> self = weak_from_this();
            auto stream = handshake_;
            stream->readFrame([self, stream, i](const boost::system::error_code& ec, std::string msg) {
                auto s = self.lock();
                if (!s || s->closed_) return;
                s->handshake_.reset();
                if (ec || msg != kWelcome + " " + *s->remoteSession_) {
                    LOG_DEBUG("Handshake on candidate " + std::to_string(i) + " failed");
                    stream->close();
                    s->connectTo(i + 1);
                    return;
                }
                s->setState(PeerState::Connected);
                if (s->closed_) return;
                s->channel_->attach(stream);
            });
        }

        boost::asio::io_context&    io_;
        TcpTransportOptions         opts_;
        std::vector<std::string>    addresses_;
        std::optional<tcp::acceptor> acceptor_;
        std::shared_ptr<FramedStream> handshake_;

        std::optional<SignalKind>   localKind_;
        std::string                 sessionId_;
        std::optional<std::string>  remoteSession_;
        std::string                 label_{ "sync" };
        std::vector<std::pair<uint32_t, tcp::endpoint>> remote_;
        GatheringState              gathering_{ GatheringState::New };
        PeerState                   state_{ PeerState::New };
        bool                        closed_{ false };
        std::shared_ptr<TcpDataChannel> channel_;

        LocalCandidateCallback onCandidate_;
        GatheringStateCallback onGathering_;
        PeerStateCallback      onState_;
        DataChannelCallback    onDataChannel_;
    };

    }

    /* ------------------------------------------------------------------ */

    TcpDirectTransport::TcpDirectTransport(boost::asio::io_context& io, TcpTransportOptions opts)
        : io_(io), opts_(opts) {}

    std::shared_ptr<IPeerConnection> TcpDirectTransport::createPeerConnection(const TransportConfig& config) {
        if (!config.iceServers.empty())
            LOG_DEBUG("TCP transport pairs on the local network only; ice servers ignored");
        return std::make_shared<TcpPeerConnection>(io_, opts_, localAddresses());
    }

    std::vector<std::string> TcpDirectTransport::localAddresses() const {
        return listAddresses(opts_);
    }

}
