#include "ktnsync/core/interfaces/ichannel.hpp"
#include "ktnsync/core/interfaces/itransport.hpp"

namespace ktnsync {

    const char* toString(ChannelState s) {
        switch (s) {
        case ChannelState::Connecting: return "connecting";
        case ChannelState::Open:       return "open";
        case ChannelState::Closing:    return "closing";
        case ChannelState::Closed:     return "closed";
        }
        return "unknown";
    }

    const char* toString(PeerState s) {
        switch (s) {
        case PeerState::New:          return "new";
        case PeerState::Checking:     return "checking";
        case PeerState::Connected:    return "connected";
        case PeerState::Disconnected: return "disconnected";
        case PeerState::Failed:       return "failed";
        case PeerState::Closed:       return "closed";
        }
        return "unknown";
    }

}
