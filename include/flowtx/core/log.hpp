#pragma once
#include <string_view>

namespace flowtx::core {

  /**
   * Configure the default spdlog logger: level from `level` ("trace" .. "off"),
   * then overridden by FLOWTX_LOG_LEVEL when set (spdlog env syntax, e.g. "debug").
   * Throws InvalidArgument for an unknown level name.
   */
  void init_logging(std::string_view level = "info");
}
