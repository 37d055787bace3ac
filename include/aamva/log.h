#ifndef AAMVA_LOG_H
#define AAMVA_LOG_H

#include <memory>
#include <spdlog/spdlog.h>

namespace aamva {

// Name of the library's spdlog logger
constexpr const char* LOGGER_NAME = "aamva";

// Library logger (stderr, level warn until changed)
// Reuses a logger already registered under LOGGER_NAME, so applications can
// route decoder output to their own sinks.
std::shared_ptr<spdlog::logger> logger();

void setLogLevel(spdlog::level::level_enum level);

} // namespace aamva

// Payload values are personal data: log element codes and sizes only.
#define AAMVA_LOG_TRACE(...) ::aamva::logger()->trace(__VA_ARGS__)
#define AAMVA_LOG_DEBUG(...) ::aamva::logger()->debug(__VA_ARGS__)
#define AAMVA_LOG_WARN(...)  ::aamva::logger()->warn(__VA_ARGS__)
#define AAMVA_LOG_ERROR(...) ::aamva::logger()->error(__VA_ARGS__)

#endif // AAMVA_LOG_H
