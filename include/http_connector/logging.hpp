#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace http_connector {

    /// @brief Name under which the library logger is registered with spdlog.
    inline constexpr const char* logger_name = "http_connector";

    /// @brief The library logger. Applications may register their own
    /// logger under logger_name before first use to redirect output.
    std::shared_ptr<spdlog::logger> logger();

    void set_log_level(spdlog::level::level_enum level);

}  // namespace http_connector

#define HTTP_CONNECTOR_LOG_TRACE(...) \
    SPDLOG_LOGGER_TRACE(::http_connector::logger(), __VA_ARGS__)
#define HTTP_CONNECTOR_LOG_DEBUG(...) \
    SPDLOG_LOGGER_DEBUG(::http_connector::logger(), __VA_ARGS__)
#define HTTP_CONNECTOR_LOG_WARN(...) \
    SPDLOG_LOGGER_WARN(::http_connector::logger(), __VA_ARGS__)
#define HTTP_CONNECTOR_LOG_ERROR(...) \
    SPDLOG_LOGGER_ERROR(::http_connector::logger(), __VA_ARGS__)
