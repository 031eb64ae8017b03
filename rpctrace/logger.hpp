#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace rpctrace {

inline std::shared_ptr<spdlog::logger> logger() {
  static auto ptr = [] {
    auto ptr = spdlog::stdout_color_mt("rpctrace");
    ptr->set_pattern("[%L][%t][%d-%m-%Y %H:%M:%S:%e] %v");
    return ptr;
  }();
  return ptr;
}

template <class... Args>
inline void debug(Args&&... args) {
  logger()->debug(std::forward<Args>(args)...);
}

template <class... Args>
inline void info(Args&&... args) {
  logger()->info(std::forward<Args>(args)...);
}

template <class... Args>
inline void warn(Args&&... args) {
  logger()->warn(std::forward<Args>(args)...);
}

template <class... Args>
inline void error(Args&&... args) {
  logger()->error(std::forward<Args>(args)...);
}

// Returns 0 on success and -1 if the level is not one of: d[ebug], i[nfo], w[arn], e[rror]
inline int set_loglevel(char level) {
  auto apply = [](spdlog::level::level_enum lvl) {
    spdlog::set_level(lvl);
    logger()->set_level(lvl);
  };
  if (level == 'd')
    apply(spdlog::level::debug);
  else if (level == 'i')
    apply(spdlog::level::info);
  else if (level == 'w')
    apply(spdlog::level::warn);
  else if (level == 'e')
    apply(spdlog::level::err);
  else
    return -1;  // failed
  return 0;     // success
}

}  // namespace rpctrace
