#include "connection_types.h"

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "Disconnected";
        case ConnectionState::CONNECTING:   return "Connecting";
        case ConnectionState::CONNECTED:    return "Connected";
        case ConnectionState::FAILED:       return "Failed";
    }
    return "Unknown";
}

const char* to_string(ConnectError error) {
    switch (error) {
        case ConnectError::NONE:               return "None";
        case ConnectError::NO_ADDRESS:         return "NoAddress";
        case ConnectError::SELF_CONNECTION:    return "SelfConnection";
        case ConnectError::CONNECTION_REFUSED: return "ConnectionRefused";
        case ConnectError::CONNECT_TIMEOUT:    return "ConnectTimeout";
        case ConnectError::IO_ERROR:           return "IoError";
        case ConnectError::NOT_RUNNING:        return "NotRunning";
    }
    return "Unknown";
}
