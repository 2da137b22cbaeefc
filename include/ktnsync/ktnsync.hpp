// This is the single entry point for the ktnsync library.
// Include this file to get access to the core public API.

#pragma once

// Session driving pairing and sync
#include "ktnsync/core/session/sync_session.hpp"

// Building blocks
#include "ktnsync/core/identity/device_identity.hpp"
#include "ktnsync/core/signaling/signaling_codec.hpp"
#include "ktnsync/core/signaling/fragment.hpp"
#include "ktnsync/core/negotiation/transport_negotiator.hpp"
#include "ktnsync/core/channel/chunked_channel.hpp"
#include "ktnsync/core/protocol/sync_messages.hpp"
#include "ktnsync/core/sync/reconciliation_engine.hpp"

// Data model and configuration
#include "ktnsync/core/model/entities.hpp"
#include "ktnsync/core/util/error_types.hpp"
#include "ktnsync/core/util/logger.hpp"
#include "ktnsync/core/util/sync_options.hpp"

// Public interfaces for extension
#include "ktnsync/core/interfaces/ichannel.hpp"
#include "ktnsync/core/interfaces/istore.hpp"
#include "ktnsync/core/interfaces/itransport.hpp"

// Stores
#include "ktnsync/store/memory_store.hpp"

// Direct transports
#include "ktnsync/transports/loopback/loopback_transport.hpp"
#include "ktnsync/transports/tcp/tcp_direct_transport.hpp"
