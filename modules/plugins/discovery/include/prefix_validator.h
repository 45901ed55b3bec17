#ifndef PREFIX_VALIDATOR_H
#define PREFIX_VALIDATOR_H

#include <optional>
#include <string>
#include <vector>

// Device-name filter: only names starting with a known prefix are eligible peers.
class PrefixValidator {
public:
    explicit PrefixValidator(std::vector<std::string> prefixes);

    // Uses device.valid_name_prefixes
    static PrefixValidator fromConfig();

    bool has_valid_prefix(const std::string& device_name) const;
    std::optional<std::string> matching_prefix(const std::string& device_name) const;

    // "DNC-User123" -> "User123"; names without a valid prefix come back unchanged.
    std::string extract_username(const std::string& device_name) const;

    const std::vector<std::string>& prefixes() const { return m_prefixes; }

private:
    std::vector<std::string> m_prefixes;
};

#endif // PREFIX_VALIDATOR_H
