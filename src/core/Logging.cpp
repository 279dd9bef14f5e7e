#include "goalglide/core/Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <QtGlobal>

namespace goalglide {
namespace core {

namespace {
LogLevel levelFromEnvironment()
{
    const QString name = qEnvironmentVariable("GOAL_GLIDE_LOG").trimmed().toLower();
    if (name == QLatin1String("debug")) {
        return LogLevel::Debug;
    }
    if (name == QLatin1String("info")) {
        return LogLevel::Info;
    }
    if (name == QLatin1String("off")) {
        return LogLevel::Off;
    }
    return LogLevel::Warn;
}
} // namespace

void initLogging()
{
    // stdout carries command output.
    auto logger = spdlog::stderr_color_mt("goalglide");
    logger->set_pattern("goalglide [%l] %v");
    spdlog::set_default_logger(logger);
    setLogLevel(levelFromEnvironment());
}

void setLogLevel(LogLevel level)
{
    if (level == LogLevel::Debug) {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == LogLevel::Info) {
        spdlog::set_level(spdlog::level::info);
    } else if (level == LogLevel::Warn) {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == LogLevel::Off) {
        spdlog::set_level(spdlog::level::off);
    }
}

} // namespace core
} // namespace goalglide
