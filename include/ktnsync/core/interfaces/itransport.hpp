/**
 * @file itransport.hpp
 * @brief Interface for direct (non-relayed) transports in ktnsync.
 *
 * Implement IDirectTransport to plug a connection technology under the
 * TransportNegotiator. The model follows the offer/answer exchange: a local
 * description is produced, candidates trickle in while gathering runs, the
 * remote side's description and candidates are applied, and the connection
 * reports its state asynchronously.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "ktnsync/core/interfaces/ichannel.hpp"
#include "ktnsync/core/signaling/signaling_payload.hpp"

namespace ktnsync {

    /**
     * @enum GatheringState
     * @brief Candidate gathering progress.
     */
    enum class GatheringState { New, Gathering, Complete };

    /**
     * @enum PeerState
     * @brief Connectivity state of a peer connection.
     *
     * Disconnected may recover; Failed and Closed are terminal.
     */
    enum class PeerState { New, Checking, Connected, Disconnected, Failed, Closed };

    const char* toString(PeerState s);

    /**
     * @struct TransportConfig
     * @brief Per-connection settings handed to the transport.
     */
    struct TransportConfig {
        std::vector<std::string> iceServers; ///< Reflection/relay helpers (e.g. "stun:host:port")
    };

    using LocalCandidateCallback = std::function<void(const IceCandidate&)>;
    using GatheringStateCallback = std::function<void(GatheringState)>;
    using PeerStateCallback      = std::function<void(PeerState)>;
    using DataChannelCallback    = std::function<void(std::shared_ptr<IDataChannel>)>;

    /**
     * @class IPeerConnection
     * @brief One negotiated connection to a remote device.
     */
    class IPeerConnection {
    public:
        virtual ~IPeerConnection() = default;

        /**
         * @brief Create the local description of the given kind and start gathering.
         *
         * An Answer requires a remote Offer to have been applied.
         * @return Session description text
         * @throws SyncError on a state violation
         */
        virtual std::string setLocalDescription(SignalKind kind) = 0;

        /**
         * @throws SyncError(InvalidSignaling) if the description cannot be applied
         */
        virtual void setRemoteDescription(SignalKind kind, const std::string& description) = 0;

        virtual void addRemoteCandidate(const IceCandidate& candidate) = 0;

        /**
         * @brief Create an ordered, reliable channel. Must precede the offer.
         */
        virtual std::shared_ptr<IDataChannel> createDataChannel(const std::string& label) = 0;

        virtual GatheringState gatheringState() const = 0;
        virtual PeerState state() const = 0;

        virtual void setLocalCandidateCallback(LocalCandidateCallback cb) = 0;
        virtual void setGatheringStateCallback(GatheringStateCallback cb) = 0;
        virtual void setStateCallback(PeerStateCallback cb) = 0;
        /// Fires on the answering side when the offerer's channel arrives.
        virtual void setDataChannelCallback(DataChannelCallback cb) = 0;

        /**
         * @brief Close the connection and its channels. No callback fires afterwards.
         */
        virtual void close() = 0;
    };

    /**
     * @class IDirectTransport
     * @brief Factory for peer connections of one transport technology.
     */
    class IDirectTransport {
    public:
        virtual ~IDirectTransport() = default;
        virtual std::shared_ptr<IPeerConnection> createPeerConnection(const TransportConfig& config) = 0;
    };

}
