#include "http_connector/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace http_connector {

    std::shared_ptr<spdlog::logger> logger() {
        static std::shared_ptr<spdlog::logger> instance = [] {
            if (auto existing = spdlog::get(logger_name)) return existing;
            auto created = spdlog::stdout_color_mt(logger_name);
            created->set_level(spdlog::level::info);
            return created;
        }();
        return instance;
    }

    void set_log_level(spdlog::level::level_enum level) {
        logger()->set_level(level);
    }

}  // namespace http_connector
