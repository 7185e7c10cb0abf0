// pilc/basic/logging.cpp
#include "pilc/basic/logging.hpp"

#include <spdlog/spdlog.h>

namespace pilc
{

void configure_logging(const LogConfig & config)
{
  spdlog::set_level(spdlog::level::from_str(config.level));
  spdlog::set_pattern(config.pattern);
}

}  // namespace pilc
