#ifndef PEER_H
#define PEER_H

#include "connection_types.h"
#include "constants.h"

#include <optional>
#include <string>

struct PeerDescriptor {
    std::string peer_id;                    // unique registry key
    std::string display_name;               // replaced after handshake
    std::optional<std::string> network_address;
    int signal_strength = UNKNOWN_SIGNAL_STRENGTH;
    ConnectionState connection_state = ConnectionState::DISCONNECTED;
    std::string failure_reason;             // set while FAILED
    bool discovered = false;                // false for records created by an inbound accept
    bool is_self = false;                   // recomputed on every lookup, never stored by the registry
};

// One device sighting from a discovery source.
struct DiscoveryEvent {
    std::string peer_id;
    std::string display_name;
    std::optional<int> signal_strength;
    std::optional<std::string> network_address;
    uint16_t tcp_port = 0;                  // 0 when the source does not know it
};

#endif // PEER_H
