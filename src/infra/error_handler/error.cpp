#include "error.hpp"
#include <cstdlib>
#include <fmt/core.h>

namespace nxup::infra {

bool Error::is_usage_error() const {
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidFlagCombination:
            return true;
        default:
            return false;
    }
}

// Любая ошибка завершает весь запуск с кодом 1
int Error::to_exit_code() const {
    return EXIT_FAILURE;
}

const char* Error::what() const {
    return message.c_str();
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:        return "invalid argument";
        case ErrorCode::InvalidFlagCombination: return "invalid flag combination";
        case ErrorCode::TerminalUnavailable:    return "terminal unavailable";
        case ErrorCode::FileNotFound:           return "file not found";
        case ErrorCode::InvalidUrl:             return "invalid url";
        case ErrorCode::TransportFailure:       return "transport failure";
        case ErrorCode::RejectedStatus:         return "rejected status";
        case ErrorCode::Unknown:                break;
    }
    return "unknown";
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error log_and_return(Error&& err) {
    spdlog::debug("[{}:{} in {}] {}", err.file, err.line, err.function, to_string(err.code));
    // Многострочные сообщения выводим построчно, чтобы каждая строка шла со своим префиксом
    std::string_view rest = err.message;
    while (!rest.empty()) {
        const auto eol = rest.find('\n');
        spdlog::error("{}", rest.substr(0, eol));
        if (eol == std::string_view::npos) break;
        rest.remove_prefix(eol + 1);
    }
    return std::move(err);
}

} // namespace nxup::infra
