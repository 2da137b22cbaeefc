#include "ktnsync/core/negotiation/transport_negotiator.hpp"
#include "ktnsync/core/util/logger.hpp"

#include <boost/asio/post.hpp>
#include <chrono>

namespace ktnsync {

    using std::chrono::milliseconds;

    const char* toString(NegotiationState s) {
        switch (s) {
        case NegotiationState::Idle:            return "idle";
        case NegotiationState::GatheringOffer:  return "gathering-offer";
        case NegotiationState::OfferReady:      return "offer-ready";
        case NegotiationState::GatheringAnswer: return "gathering-answer";
        case NegotiationState::AnswerReady:     return "answer-ready";
        case NegotiationState::Connecting:      return "connecting";
        case NegotiationState::Open:            return "open";
        case NegotiationState::Failed:          return "failed";
        case NegotiationState::Closed:          return "closed";
        }
        return "unknown";
    }

    TransportNegotiator::TransportNegotiator(boost::asio::io_context& io, IDirectTransport& transport, SyncOptions opts)
        : io_(io),
          transport_(transport),
          opts_(std::move(opts)),
          gatherTimer_(io),
          openTimer_(io)
    {}

    TransportNegotiator::~TransportNegotiator() {
        close();
    }

    void TransportNegotiator::preparePeer() {
        pc_ = transport_.createPeerConnection(TransportConfig{ opts_.iceServers });
        std::weak_ptr<int> guard = life_;

        pc_->setLocalCandidateCallback([this, guard](const IceCandidate& c) {
            if (guard.expired() || gatherDone_) return;
            localCandidates_.push_back(c);
            LOG_DEBUG("Local candidate #" + std::to_string(localCandidates_.size()) + ": " + c.candidate);
        });
        pc_->setGatheringStateCallback([this, guard](GatheringState s) {
            if (guard.expired()) return;
            if (s == GatheringState::Complete) finishGathering();
        });
        pc_->setStateCallback([this, guard](PeerState s) {
            if (guard.expired()) return;
            onPeerState(s);
        });
    }

    void TransportNegotiator::createOffer(PayloadHandler done) {
        if (state_ != NegotiationState::Idle)
            throw SyncError(SyncErr::Internal, std::string("createOffer in state ") + toString(state_));

        role_ = NegotiationRole::Initiator;
        pending_ = std::move(done);
        try {
            preparePeer();
            attachChannel(pc_->createDataChannel(opts_.channelLabel));
            startGathering(SignalKind::Offer);
        }
        catch (const SyncError& e) {
            fail(e.toError());
        }
        catch (const std::exception& e) {
            fail(makeError(SyncErr::Internal, e.what()));
        }
    }

    void TransportNegotiator::acceptOffer(const SignalingPayload& offer, PayloadHandler done) {
        if (offer.kind != SignalKind::Offer)
            throw SyncError(SyncErr::InvalidSignaling,
                std::string("expected an offer, got ") + toString(offer.kind));
        if (state_ != NegotiationState::Idle)
            throw SyncError(SyncErr::Internal, std::string("acceptOffer in state ") + toString(state_));

        role_ = NegotiationRole::Responder;
        preparePeer();

        std::weak_ptr<int> guard = life_;
        pc_->setDataChannelCallback([this, guard](std::shared_ptr<IDataChannel> ch) {
            if (guard.expired()) return;
            LOG_DEBUG("Remote channel '" + ch->label() + "' arrived");
            attachChannel(ch);
            if (ch->readyState() == ChannelState::Open) onChannelOpen();
        });

        try {
            pc_->setRemoteDescription(SignalKind::Offer, offer.description);
            for (const auto& c : offer.candidates) pc_->addRemoteCandidate(c);
        }
        catch (const std::exception&) {
            // Back to Idle so the user can scan the offer again.
            pc_->close();
            pc_.reset();
            role_.reset();
            throw;
        }

        pending_ = std::move(done);
        try {
            startGathering(SignalKind::Answer);
        }
        catch (const SyncError& e) {
            fail(e.toError());
        }
        catch (const std::exception& e) {
            fail(makeError(SyncErr::Internal, e.what()));
        }
    }

    void TransportNegotiator::applyAnswer(const SignalingPayload& answer) {
        if (answer.kind != SignalKind::Answer)
            throw SyncError(SyncErr::InvalidSignaling,
                std::string("expected an answer, got ") + toString(answer.kind));
        if (role_ != NegotiationRole::Initiator || state_ != NegotiationState::OfferReady)
            throw SyncError(SyncErr::InvalidSignaling,
                std::string("no offer is waiting for an answer (state ") + toString(state_) + ")");

        pc_->setRemoteDescription(SignalKind::Answer, answer.description);
        for (const auto& c : answer.candidates) pc_->addRemoteCandidate(c);

        state_ = NegotiationState::Connecting;
        LOG_INFO("Answer applied with " + std::to_string(answer.candidates.size()) + " candidates, connecting");
        startOpenTimer();
        if (channel_ && channel_->readyState() == ChannelState::Open) onChannelOpen();
    }

    void TransportNegotiator::startGathering(SignalKind kind) {
        state_ = kind == SignalKind::Offer ? NegotiationState::GatheringOffer
                                           : NegotiationState::GatheringAnswer;
        localKind_ = kind;
        gatherDone_ = false;
        localCandidates_.clear();

        std::weak_ptr<int> guard = life_;
        gatherTimer_.expires_after(milliseconds(opts_.gatherTimeoutMs));
        gatherTimer_.async_wait([this, guard](const boost::system::error_code& ec) {
            if (ec || guard.expired() || gatherDone_) return;
            LOG_WARN("Candidate gathering timed out after " + std::to_string(opts_.gatherTimeoutMs) +
                     " ms, proceeding with " + std::to_string(localCandidates_.size()) + " candidates");
            finishGathering();
        });

        localDescription_ = pc_->setLocalDescription(kind);
        if (pc_->gatheringState() == GatheringState::Complete) {
            boost::asio::post(io_, [this, guard] {
                if (!guard.expired()) finishGathering();
            });
        }
    }

    void TransportNegotiator::finishGathering() {
        if (gatherDone_) return;
        if (state_ != NegotiationState::GatheringOffer && state_ != NegotiationState::GatheringAnswer) return;

        gatherDone_ = true;
        gatherTimer_.cancel();

        SignalingPayload payload{ localKind_, localDescription_, localCandidates_ };
        if (localKind_ == SignalKind::Offer) {
            state_ = NegotiationState::OfferReady;
        } else {
            state_ = NegotiationState::AnswerReady;
            startOpenTimer();
        }
        LOG_INFO(std::string("Local ") + toString(localKind_) + " ready with " +
                 std::to_string(payload.candidates.size()) + " candidates");

        auto h = std::move(pending_);
        pending_ = nullptr;
        if (h) h(std::nullopt, std::move(payload));
    }

    void TransportNegotiator::startOpenTimer() {
        std::weak_ptr<int> guard = life_;
        openTimer_.expires_after(milliseconds(opts_.openTimeoutMs));
        openTimer_.async_wait([this, guard](const boost::system::error_code& ec) {
            if (ec || guard.expired()) return;
            if (state_ != NegotiationState::Connecting && state_ != NegotiationState::AnswerReady) return;
            fail(makeError(SyncErr::ConnectionTimeout,
                "channel not open after " + std::to_string(opts_.openTimeoutMs) + " ms"));
        });
    }

    void TransportNegotiator::attachChannel(std::shared_ptr<IDataChannel> ch) {
        channel_ = std::move(ch);
        std::weak_ptr<int> guard = life_;
        channel_->setOpenCallback([this, guard] {
            if (!guard.expired()) onChannelOpen();
        });
        channel_->setCloseCallback([this, guard] {
            if (guard.expired()) return;
            if (state_ == NegotiationState::Open || state_ == NegotiationState::Failed ||
                state_ == NegotiationState::Closed)
                return;
            fail(makeError(SyncErr::ConnectionFailed, "channel closed before it opened"));
        });
    }

    void TransportNegotiator::onChannelOpen() {
        if (state_ != NegotiationState::Connecting && state_ != NegotiationState::AnswerReady) return;
        state_ = NegotiationState::Open;
        openTimer_.cancel();
        LOG_INFO("Channel '" + channel_->label() + "' open");
        if (onOpen_) {
            auto h = onOpen_;
            h(channel_);
        }
    }

    void TransportNegotiator::onPeerState(PeerState s) {
        LOG_DEBUG(std::string("Peer connection state: ") + toString(s));
        switch (s) {
        case PeerState::Disconnected:
            LOG_WARN("Peer connection disconnected, waiting for it to recover");
            break;
        case PeerState::Failed:
            fail(makeError(SyncErr::ConnectionFailed, "transport reported connection failure"));
            break;
        default:
            break;
        }
    }

    void TransportNegotiator::fail(ErrorObj err) {
        if (state_ == NegotiationState::Failed || state_ == NegotiationState::Closed) return;
        LOG_ERROR(std::string("Negotiation failed in state ") + toString(state_) + ": " + err.detail);
        state_ = NegotiationState::Failed;
        gatherTimer_.cancel();
        openTimer_.cancel();

        if (pending_) {
            auto h = std::move(pending_);
            pending_ = nullptr;
            boost::asio::post(io_, [h = std::move(h), err = std::move(err)] {
                h(err, SignalingPayload{});
            });
            return;
        }
        if (onFailure_) {
            auto h = onFailure_;
            h(err);
        }
    }

    void TransportNegotiator::close() {
        life_.reset();
        gatherTimer_.cancel();
        openTimer_.cancel();

        if (channel_) {
            channel_->setOpenCallback(nullptr);
            channel_->setCloseCallback(nullptr);
            channel_->setMessageCallback(nullptr);
            channel_->setErrorCallback(nullptr);
            channel_->close();
            channel_.reset();
        }
        if (pc_) {
            pc_->setLocalCandidateCallback(nullptr);
            pc_->setGatheringStateCallback(nullptr);
            pc_->setStateCallback(nullptr);
            pc_->setDataChannelCallback(nullptr);
            pc_->close();
            pc_.reset();
        }

        pending_ = nullptr;
        onOpen_ = nullptr;
        onFailure_ = nullptr;
        if (state_ != NegotiationState::Closed)
            LOG_DEBUG(std::string("Negotiator closed in state ") + toString(state_));
        state_ = NegotiationState::Closed;
    }

}
