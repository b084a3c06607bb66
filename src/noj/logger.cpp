#include "noj/logger.h"

void InitLogger(spdlog::level::level_enum level) {
  spdlog::set_pattern("[%t] %+");
  spdlog::set_level(level);
  spdlog::debug("Logger initialized at level {}", spdlog::level::to_string_view(level));
}

spdlog::level::level_enum VerbosityToLevel(int verbosity) {
  switch (verbosity) {
    case 0: return spdlog::level::info;
    case 1: return spdlog::level::debug;
    default: return spdlog::level::trace;
  }
}
