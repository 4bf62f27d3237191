#include "logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <memory>

namespace pxvc
{

spdlog::level::level_enum LogLevelFromEnv()
{
  const char* env = std::getenv(kLogLevelEnv);
  if (env == nullptr || *env == '\0')
    return spdlog::level::info;
  // from_str maps unknown names to off; keep info for typos
  const auto lvl = spdlog::level::from_str(env);
  if (lvl == spdlog::level::off && std::string(env) != "off")
    return spdlog::level::info;
  return lvl;
}

void InitLogging(const std::string& name, const std::string& log_dir)
{
  std::shared_ptr<spdlog::logger> logger;
  if (log_dir.empty())
    logger = spdlog::stderr_color_mt(name);
  else
    logger = spdlog::basic_logger_mt(name, log_dir + "/" + name + ".log");

  logger->set_level(LogLevelFromEnv());
  logger->flush_on(spdlog::level::info);
  spdlog::set_default_logger(logger);
}

}
