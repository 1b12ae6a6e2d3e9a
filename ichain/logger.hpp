#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace ichain {

inline std::shared_ptr<spdlog::logger> logger() {
  static auto ptr = [] {
    auto ptr = spdlog::stdout_color_mt("ichain");
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

template <class... Args>
inline void critical(Args&&... args) {
  logger()->critical(std::forward<Args>(args)...);
  std::exit(-1);
}

inline int set_loglevel(char level) {
  if (level == 'd')
    spdlog::set_level(spdlog::level::debug);
  else if (level == 'i')
    spdlog::set_level(spdlog::level::info);
  else if (level == 'w')
    spdlog::set_level(spdlog::level::warn);
  else if (level == 'e')
    spdlog::set_level(spdlog::level::err);
  else
    return -1;  // failed
  return 0;     // success
}

}  // namespace ichain
