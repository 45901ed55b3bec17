#include "prefix_validator.h"
#include "config_manager.h"

PrefixValidator::PrefixValidator(std::vector<std::string> prefixes)
    : m_prefixes(std::move(prefixes)) {}

PrefixValidator PrefixValidator::fromConfig() {
    return PrefixValidator(ConfigManager::getInstance().getValidNamePrefixes());
}

bool PrefixValidator::has_valid_prefix(const std::string& device_name) const {
    return matching_prefix(device_name).has_value();
}

std::optional<std::string> PrefixValidator::matching_prefix(const std::string& device_name) const {
    for (const auto& prefix : m_prefixes) {
        if (!prefix.empty() && device_name.rfind(prefix, 0) == 0) {
            return prefix;
        }
    }
    return std::nullopt;
}

std::string PrefixValidator::extract_username(const std::string& device_name) const {
    std::optional<std::string> prefix = matching_prefix(device_name);
    if (!prefix) {
        return device_name;
    }
    return device_name.substr(prefix->size());
}
