#ifndef DEVICE_UTILS_H
#define DEVICE_UTILS_H

#include <string>
#include <vector>

/**
 * @brief Generates a persistent device ID from the hardware (MAC) address.
 * Falls back to a random ID if hardware info is unavailable.
 *
 * Format: "AA:BB:CC:DD:EE:FF" or "nearlink-random-<hex>"
 */
std::string get_persistent_device_id();

/**
 * @brief True for a well-formed dotted-quad IPv4 address.
 */
bool is_ipv4_address(const std::string& value);

/**
 * @brief Dotted-quad IPv4 address for `host` (a literal address or a name).
 * Returns an empty string when the name does not resolve.
 */
std::string resolve_ipv4(const std::string& host);

/**
 * @brief The set of addresses that belong to this host.
 *
 * Used to refuse connections to ourselves when discovery reports one of our own
 * addresses. With treat_loopback_as_local, any 127.0.0.0/8 address, 0.0.0.0 and
 * "localhost" count as local as well.
 */
class LocalAddressSet {
public:
    // Collects every IPv4 address of the interfaces that are up.
    static LocalAddressSet fromInterfaces();

    LocalAddressSet(std::vector<std::string> addresses, bool treat_loopback_as_local);

    bool contains(const std::string& address) const;

    // First non-loopback address, or an empty string.
    std::string primaryAddress() const;

    const std::vector<std::string>& addresses() const { return m_addresses; }

private:
    std::vector<std::string> m_addresses;
    bool m_treat_loopback_as_local;
};

#endif // DEVICE_UTILS_H
