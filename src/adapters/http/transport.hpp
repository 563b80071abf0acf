#pragma once

#include <filesystem>
#include <string>
#include <expected>
#include "../../infra/error_handler/error.hpp"
#include "../../core/credentials/credentials.hpp"

namespace nxup::adapters::http {

/// One authenticated HTTP PUT of a local file.
/// Returns the HTTP status code of the response, or TransportFailure when no
/// complete response was received.
class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual auto put_file(const std::filesystem::path& file,
                                        const std::string& url,
                                        const core::Credentials& credentials)
        -> std::expected<int, infra::Error> = 0;
};

} // namespace nxup::adapters::http
