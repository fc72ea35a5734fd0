#pragma once

#include <fmt/format.h>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

class Log {
public:
  static void init(const std::string &fallbackDir = "");

  // Returns the shared logger, creating a stderr-only one on first use so
  // library code and tests can log before init() has been called.
  static std::shared_ptr<spdlog::logger> &get();

  // Set log level at runtime
  static void setLevel(spdlog::level::level_enum level) {
    get()->set_level(level);
  }

  // Parses "debug", "info", "warn", "error" (any case). Unknown names map to
  // warn.
  static spdlog::level::level_enum levelFromString(const std::string &name);

  // High-level macros for simple logging
#define LOG_TRACE(...) ::Log::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::Log::get()->debug(__VA_ARGS__)
#define LOG_INFO(...) ::Log::get()->info(__VA_ARGS__)
#define LOG_WARN(...) ::Log::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::Log::get()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::Log::get()->critical(__VA_ARGS__)

  // Categorized logging with runtime format strings to avoid C++20 consteval
  // escalation issues in lambdas.
  template <typename... Args>
  static void t(const std::string &cat, const std::string &f, Args &&...args) {
    write(spdlog::level::trace, cat, f, args...);
  }
  template <typename... Args>
  static void d(const std::string &cat, const std::string &f, Args &&...args) {
    write(spdlog::level::debug, cat, f, args...);
  }
  template <typename... Args>
  static void i(const std::string &cat, const std::string &f, Args &&...args) {
    write(spdlog::level::info, cat, f, args...);
  }
  template <typename... Args>
  static void w(const std::string &cat, const std::string &f, Args &&...args) {
    write(spdlog::level::warn, cat, f, args...);
  }
  template <typename... Args>
  static void e(const std::string &cat, const std::string &f, Args &&...args) {
    write(spdlog::level::err, cat, f, args...);
  }

#define LOG_T(cat, f, ...) ::Log::t(cat, f, ##__VA_ARGS__)
#define LOG_D(cat, f, ...) ::Log::d(cat, f, ##__VA_ARGS__)
#define LOG_I(cat, f, ...) ::Log::i(cat, f, ##__VA_ARGS__)
#define LOG_W(cat, f, ...) ::Log::w(cat, f, ##__VA_ARGS__)
#define LOG_E(cat, f, ...) ::Log::e(cat, f, ##__VA_ARGS__)

private:
  template <typename... Args>
  static void write(spdlog::level::level_enum lvl, const std::string &cat,
                    const std::string &f, Args &...args) {
    auto &logger = get();
    if (logger->should_log(lvl)) {
      logger->log(lvl, "[{}] {}", cat,
                  fmt::vformat(f, fmt::make_format_args(args...)));
    }
  }

  static std::shared_ptr<spdlog::logger> s_Logger;
};
