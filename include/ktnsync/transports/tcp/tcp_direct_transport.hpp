/**
 * @file tcp_direct_transport.hpp
 * @brief IDirectTransport over plain TCP on the local network.
 *
 * Follows the ICE-TCP pattern: the offering device advertises active
 * candidates and dials, the answering device listens on an ephemeral port
 * and advertises one passive candidate per local IPv4 address. After the
 * TCP connect a one-frame handshake binds the socket to the negotiated
 * session ids, then the socket carries the data channel.
 *
 * Frames are a 4-byte big-endian length followed by the payload.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include "ktnsync/core/interfaces/itransport.hpp"

namespace ktnsync {

    /**
     * @struct TcpTransportOptions
     * @brief Address selection for TCP candidates.
     */
    struct TcpTransportOptions {
        bool     includeLoopback{ false };      ///< Advertise 127.0.0.1 as well
        bool     loopbackOnly{ false };         ///< Advertise 127.0.0.1 only (same-host pairing)
        uint32_t maxFrameBytes{ 1024 * 1024 };  ///< Larger frames close the connection
    };

    /**
     * @class TcpDirectTransport
     * @brief Factory of TCP peer connections on one io_context.
     */
    class TcpDirectTransport : public IDirectTransport {
    public:
        explicit TcpDirectTransport(boost::asio::io_context& io, TcpTransportOptions opts = {});

        std::shared_ptr<IPeerConnection> createPeerConnection(const TransportConfig& config) override;

        /// Local IPv4 addresses candidates are advertised on.
        std::vector<std::string> localAddresses() const;

    private:
        boost::asio::io_context& io_;
        TcpTransportOptions opts_;
    };

}
