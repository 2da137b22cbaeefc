/**
 * @file transport_negotiator.hpp
 * @brief Offer/answer state machine over an IDirectTransport.
 *
 * Initiator: Idle -> GatheringOffer -> OfferReady -> Connecting -> Open
 * Responder: Idle -> GatheringAnswer -> AnswerReady -> Open
 *
 * Gathering is bounded by SyncOptions::gatherTimeoutMs, the wait for the
 * channel by SyncOptions::openTimeoutMs. All handlers run on the io_context.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include "ktnsync/core/interfaces/itransport.hpp"
#include "ktnsync/core/signaling/signaling_payload.hpp"
#include "ktnsync/core/util/error_types.hpp"
#include "ktnsync/core/util/sync_options.hpp"

namespace ktnsync {

    enum class NegotiationRole { Initiator, Responder };

    enum class NegotiationState {
        Idle,
        GatheringOffer,
        OfferReady,
        GatheringAnswer,
        AnswerReady,
        Connecting,
        Open,
        Failed,
        Closed
    };

    const char* toString(NegotiationState s);

    /**
     * @class TransportNegotiator
     * @brief Drives one offer/answer exchange to an open logical channel.
     */
    class TransportNegotiator {
    public:
        /// Completion of createOffer()/acceptOffer(): error, or the local payload.
        using PayloadHandler = std::function<void(ErrorOpt, SignalingPayload)>;
        using OpenHandler    = std::function<void(std::shared_ptr<IDataChannel>)>;
        using FailureHandler = std::function<void(const ErrorObj&)>;

        TransportNegotiator(boost::asio::io_context& io, IDirectTransport& transport, SyncOptions opts = {});
        ~TransportNegotiator();

        TransportNegotiator(const TransportNegotiator&) = delete;
        TransportNegotiator& operator=(const TransportNegotiator&) = delete;

        /**
         * @brief Initiator: create the channel and the offer, gather candidates.
         *
         * @p done receives the offer once gathering completes or times out.
         * @throws SyncError(Internal) unless Idle
         */
        void createOffer(PayloadHandler done);

        /**
         * @brief Responder: apply the remote offer and produce the answer.
         * @throws SyncError(InvalidSignaling) if @p offer is not an offer or cannot be applied
         */
        void acceptOffer(const SignalingPayload& offer, PayloadHandler done);

        /**
         * @brief Initiator: apply the remote answer and wait for the channel.
         * @throws SyncError(InvalidSignaling) if @p answer is not an answer, no offer is
         *         outstanding, or the transport rejects it
         */
        void applyAnswer(const SignalingPayload& answer);

        /// Called once when the logical channel opens.
        void setOpenHandler(OpenHandler h) { onOpen_ = std::move(h); }
        /// Called on ConnectionFailed / ConnectionTimeout after the local payload was delivered.
        void setFailureHandler(FailureHandler h) { onFailure_ = std::move(h); }

        NegotiationState state() const { return state_; }
        std::optional<NegotiationRole> role() const { return role_; }
        std::shared_ptr<IDataChannel> channel() const { return channel_; }

        /**
         * @brief Cancel timers, close channel and connection, drop every handler.
         */
        void close();

    private:
        void preparePeer();
        void startGathering(SignalKind kind);
        void finishGathering();
        void startOpenTimer();
        void attachChannel(std::shared_ptr<IDataChannel> ch);
        void onChannelOpen();
        void onPeerState(PeerState s);
        void fail(ErrorObj err);

        boost::asio::io_context&         io_;
        IDirectTransport&                transport_;
        SyncOptions                      opts_;

        NegotiationState                 state_{ NegotiationState::Idle };
        std::optional<NegotiationRole>   role_;
        std::shared_ptr<IPeerConnection> pc_;
        std::shared_ptr<IDataChannel>    channel_;

        SignalKind                       localKind_{ SignalKind::Offer };
        std::string                      localDescription_;
        std::vector<IceCandidate>        localCandidates_;
        bool                             gatherDone_{ false };
        PayloadHandler                   pending_;

        boost::asio::steady_timer        gatherTimer_;
        boost::asio::steady_timer        openTimer_;

        OpenHandler                      onOpen_;
        FailureHandler                   onFailure_;

        /// Expires on close(); queued handlers check it before touching members.
        std::shared_ptr<int>             life_{ std::make_shared<int>(0) };
    };

}
