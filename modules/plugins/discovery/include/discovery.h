#ifndef DISCOVERY_H
#define DISCOVERY_H

#include "peer.h"

#include <chrono>
#include <string>
#include <vector>

struct ScanOutcome {
    bool ok = true;
    std::string error;                      // set when ok == false
    std::vector<DiscoveryEvent> events;
};

/**
 * A platform discovery mechanism (Bluetooth inquiry, LAN broadcast, ...).
 */
class DiscoverySource {
public:
    virtual ~DiscoverySource() = default;

    // Blocks for at most `window`, or until cancel_scan() is called.
    virtual ScanOutcome scan(std::chrono::milliseconds window) = 0;

    // Interrupts a scan in progress. May be called from any thread.
    virtual void cancel_scan() = 0;

    virtual std::string name() const = 0;
};

#endif // DISCOVERY_H
