#ifndef PXVC_LOGGER_INCLUDED_
#define PXVC_LOGGER_INCLUDED_ 1

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace pxvc
{

// Environment variable holding the log level name
constexpr const char* kLogLevelEnv = "PXVC_LOG";

// Installs the default logger: <log_dir>/<name>.log, or stderr when log_dir is empty.
// Level comes from PXVC_LOG, info when unset.
void InitLogging(const std::string& name, const std::string& log_dir);

spdlog::level::level_enum LogLevelFromEnv();

template <typename... Args>
void log_trace(Args&&... args) {
  spdlog::trace(std::forward<Args>(args)...);
}

template <typename... Args>
void log_debug(Args&&... args) {
  spdlog::debug(std::forward<Args>(args)...);
}

template <typename... Args>
void log_info(Args&&... args) {
  spdlog::info(std::forward<Args>(args)...);
}

template <typename... Args>
void log_warn(Args&&... args) {
  spdlog::warn(std::forward<Args>(args)...);
}

template <typename... Args>
void log_error(Args&&... args) {
  spdlog::error(std::forward<Args>(args)...);
}

}

#endif
