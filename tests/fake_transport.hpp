#pragma once

#include <deque>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include "adapters/http/transport.hpp"

namespace nxup::test_support {

// Записывает вызовы и отвечает заранее заданными статусами
class FakeTransport final : public adapters::http::Transport {
public:
    struct Call {
        std::string file;
        std::string url;
        std::string username;
        std::string password;
    };

    std::deque<std::expected<int, infra::Error>> replies;
    std::vector<Call> calls;

    auto put_file(const std::filesystem::path& file, const std::string& url, const core::Credentials& credentials)
        -> std::expected<int, infra::Error> override
    {
        calls.push_back({file.string(), url, credentials.username, credentials.password});
        if (replies.empty()) {
            return 201;
        }
        auto reply = std::move(replies.front());
        replies.pop_front();
        return reply;
    }
};

} // namespace nxup::test_support
