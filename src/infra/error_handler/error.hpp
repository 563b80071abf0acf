#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace nxup::infra {

enum class ErrorCode {
    // Ошибки использования (неверные флаги, значения)
    InvalidArgument,
    InvalidFlagCombination,

    // Окружение
    TerminalUnavailable,
    FileNotFound,
    InvalidUrl,

    // Сеть / сервер
    TransportFailure,
    RejectedStatus,

    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_usage_error() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирует ошибку (сообщение на error, место возникновения на debug) и возвращает её
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace nxup::infra
