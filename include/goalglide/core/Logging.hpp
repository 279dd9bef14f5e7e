#pragma once

#include <QString>

#include <spdlog/spdlog.h>

namespace goalglide {
namespace core {

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Off,
};

// Installs a stderr logger as the spdlog default. Level comes from
// $GOAL_GLIDE_LOG (debug, info, warn, off) and defaults to warn.
void initLogging();
void setLogLevel(LogLevel level);

// spdlog formats std::string, not QString.
inline std::string str(const QString &value)
{
    return value.toStdString();
}

} // namespace core
} // namespace goalglide
