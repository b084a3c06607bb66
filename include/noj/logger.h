#ifndef INCLUDE_NOJ_LOGGER_H_
#define INCLUDE_NOJ_LOGGER_H_

#include <spdlog/spdlog.h>

void InitLogger(spdlog::level::level_enum level = spdlog::level::info);
// 0: info, 1: debug, 2+: trace
spdlog::level::level_enum VerbosityToLevel(int verbosity);

#endif  // INCLUDE_NOJ_LOGGER_H_
