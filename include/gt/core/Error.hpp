#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace gt::core {

class Error : public std::runtime_error {
public:
    explicit Error(std::string message);
    virtual ~Error() = default;
};

inline Error::Error(std::string message)
    : std::runtime_error(std::move(message)) {}

/// Raised when a configuration value the core cannot work with reaches it
/// directly (the config loader clamps instead of throwing).
class ConfigError : public Error {
public:
    ConfigError(std::string_view setting, std::string details);

    std::string_view setting() const noexcept { return m_setting; }
    std::string_view details() const noexcept { return m_details; }

private:
    static std::string BuildMessage(std::string_view setting, const std::string& details);

    std::string m_setting;
    std::string m_details;
};

inline std::string ConfigError::BuildMessage(std::string_view setting, const std::string& details) {
    std::string message;
    message.reserve(setting.size() + details.size() + 24);
    message.append("Invalid configuration [");
    message.append(setting);
    message.append("]");
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    return message;
}

inline ConfigError::ConfigError(std::string_view setting, std::string details)
    : Error(BuildMessage(setting, details)),
      m_setting(setting),
      m_details(std::move(details)) {}

} // namespace gt::core
