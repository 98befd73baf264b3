#pragma once

#include "common/Config.hpp"

#include <string>

namespace Zweig {
class Logger {
public:
  static void Init(const std::string &log_file = default_log_file,
                   bool debug = false);
  static void Shutdown();

  static void Info(const char *file, int line, const std::string &msg);
  static void Warn(const char *file, int line, const std::string &msg);
  static void Error(const char *file, int line, const std::string &msg);
  static void Debug(const char *file, int line, const std::string &msg);
};
} // namespace Zweig

#include "fmt/format.h"

#define LOG_INFO(...)                                                          \
  Zweig::Logger::Info(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
#define LOG_WARN(...)                                                          \
  Zweig::Logger::Warn(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
#define LOG_ERROR(...)                                                         \
  Zweig::Logger::Error(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
#define LOG_DEBUG(...)                                                         \
  Zweig::Logger::Debug(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
