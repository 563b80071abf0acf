#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <expected>
#include "../../infra/error_handler/error.hpp"
#include "../../infra/config/config.hpp"

namespace nxup::core {

inline constexpr std::string_view kPasswordPrompt = "Please enter your artifacts server password: ";
inline constexpr std::string_view kPasswordMask = "*****";

struct Credentials {
    std::string username;
    std::string password;
};

using SecretPrompt = std::function<std::expected<std::string, infra::Error>(std::string_view)>;

/// Uses the password from the configuration, or asks `prompt` exactly once.
[[nodiscard]] auto resolve_credentials(const infra::Config& config, const SecretPrompt& prompt)
    -> std::expected<Credentials, infra::Error>;

/// "Basic base64(user:password)" value for the Authorization header.
[[nodiscard]] auto basic_auth_header(const Credentials& credentials) -> std::string;

} // namespace nxup::core
