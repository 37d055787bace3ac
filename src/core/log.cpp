#include "aamva/log.h"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace aamva {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = []() -> std::shared_ptr<spdlog::logger> {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        try {
            auto created = spdlog::stderr_color_mt(LOGGER_NAME);
            created->set_level(spdlog::level::warn);
            return created;
        } catch (const spdlog::spdlog_ex&) {
            // Registered by another thread in the meantime
            return spdlog::get(LOGGER_NAME);
        }
    }();
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace aamva
