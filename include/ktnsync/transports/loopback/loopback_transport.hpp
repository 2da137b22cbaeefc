/**
 * @file loopback_transport.hpp
 * @brief In-process IDirectTransport for tests and single-host demos.
 *
 * Peer connections created from the same LoopbackNetwork find each other
 * through the session id carried in their descriptions. Everything runs on
 * the io_context handed to the network; frames are delivered by posting, so
 * bufferedAmount() grows until the loop runs.
 *
 * The network must outlive every peer connection it created.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <boost/asio/io_context.hpp>
#include "ktnsync/core/interfaces/itransport.hpp"

namespace ktnsync {

    class LoopbackPeerConnection;

    /**
     * @struct LoopbackOptions
     * @brief Fault injection and pacing for loopback connections.
     */
    struct LoopbackOptions {
        int      candidateCount{ 1 };       ///< Host candidates emitted per description
        uint32_t candidateIntervalMs{ 0 };  ///< Delay between candidates
        bool     completeGathering{ true }; ///< Report GatheringState::Complete after the last candidate
        bool     failConnection{ false };   ///< Connectivity checks end in PeerState::Failed
        bool     neverOpen{ false };        ///< Checks never finish; channels stay Connecting
    };

    /**
     * @class LoopbackNetwork
     * @brief Registry and factory of loopback peer connections.
     */
    class LoopbackNetwork : public IDirectTransport {
    public:
        explicit LoopbackNetwork(boost::asio::io_context& io, LoopbackOptions opts = {});
        ~LoopbackNetwork() override;

        std::shared_ptr<IPeerConnection> createPeerConnection(const TransportConfig& config) override;

        LoopbackOptions& options() { return opts_; }

        /**
         * @brief Push a connectivity state to every connected peer connection.
         *
         * Used to simulate transient disconnects and hard failures.
         */
        void injectPeerState(PeerState s);

        /**
         * @brief Two already-paired channels that open on the next loop turn.
         */
        std::pair<std::shared_ptr<IDataChannel>, std::shared_ptr<IDataChannel>>
        openChannelPair(const std::string& label);

        /// Peer connections that have produced a description and are not closed.
        size_t liveConnections() const;

    private:
        friend class LoopbackPeerConnection;

        void registerPeer(const std::string& sessionId, std::weak_ptr<LoopbackPeerConnection> pc);
        void unregisterPeer(const std::string& sessionId);
        std::shared_ptr<LoopbackPeerConnection> findPeer(const std::string& sessionId) const;

        boost::asio::io_context& io_;
        LoopbackOptions opts_;
        std::map<std::string, std::weak_ptr<LoopbackPeerConnection>> peers_;
    };

}
