#pragma once

#include <string>
#include "transport.hpp"

namespace nxup::adapters::http {

/// HTTPS PUT over Boost.Beast with OpenSSL.
/// Blocking, one connection per file, no timeouts: a stalled server stalls the run.
class BeastTransport final : public Transport {
public:
    BeastTransport();

    [[nodiscard]] auto put_file(const std::filesystem::path& file,
                                const std::string& url,
                                const core::Credentials& credentials)
        -> std::expected<int, infra::Error> override;

private:
    std::string user_agent_;
};

} // namespace nxup::adapters::http
