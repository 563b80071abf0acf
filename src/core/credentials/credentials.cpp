#include "credentials.hpp"

#include <boost/beast/core/detail/base64.hpp>

namespace nxup::core {

namespace base64 = boost::beast::detail::base64;

auto resolve_credentials(const infra::Config& config, const SecretPrompt& prompt)
    -> std::expected<Credentials, infra::Error>
{
    if (!config.needs_password()) {
        return Credentials{.username = config.username, .password = *config.password};
    }

    auto secret = prompt(kPasswordPrompt);
    if (!secret) {
        return std::unexpected(std::move(secret.error()));
    }
    return Credentials{.username = config.username, .password = std::move(*secret)};
}

auto basic_auth_header(const Credentials& credentials) -> std::string {
    const std::string clear = credentials.username + ":" + credentials.password;
    std::string encoded;
    encoded.resize(base64::encoded_size(clear.size()));
    encoded.resize(base64::encode(encoded.data(), clear.data(), clear.size()));
    return "Basic " + encoded;
}

} // namespace nxup::core
