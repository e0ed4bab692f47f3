#include "flowtx/core/log.hpp"
#include "flowtx/core/errors.hpp"
#include <spdlog/cfg/helpers.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <string>

namespace flowtx::core {

  void init_logging(std::string_view level) {
    auto parsed = spdlog::level::from_str(std::string(level));
    if (parsed == spdlog::level::off && level != "off") {
      throw InvalidArgument("unknown log level: " + std::string(level));
    }
    spdlog::set_level(parsed);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    if (const char* env = std::getenv("FLOWTX_LOG_LEVEL")) {
      spdlog::cfg::helpers::load_levels(env);
    }
  }
}
