#pragma once

#include <cstdint>
#include <format>
#include <functional>
#include <string>
#include <string_view>

namespace tre::log {

enum class Level : uint8_t { Error, Warn, Info, Debug, Trace };

using Sink = std::function<void(Level, std::string_view)>;

// Messages above this level are dropped before formatting (default: Warn)
Level level() noexcept;
void setLevel(Level level) noexcept;

inline bool enabled(Level lvl) noexcept {
  return static_cast<uint8_t>(lvl) <= static_cast<uint8_t>(level());
}

// Replace the output sink; an empty function restores the stderr sink
void setSink(Sink sink);

std::string_view levelName(Level lvl) noexcept;

void write(Level lvl, const char *file, int line, const std::string &message);

} // namespace tre::log

#define TRE_LOG(lvl, ...)                                                                         \
  do {                                                                                            \
    if (::tre::log::enabled(lvl)) {                                                               \
      ::tre::log::write(lvl, __FILE__, __LINE__, std::format(__VA_ARGS__));                       \
    }                                                                                             \
  } while (0)

#define TRE_LOG_ERROR(...) TRE_LOG(::tre::log::Level::Error, __VA_ARGS__)
#define TRE_LOG_WARN(...) TRE_LOG(::tre::log::Level::Warn, __VA_ARGS__)
#define TRE_LOG_INFO(...) TRE_LOG(::tre::log::Level::Info, __VA_ARGS__)
#define TRE_LOG_DEBUG(...) TRE_LOG(::tre::log::Level::Debug, __VA_ARGS__)
#define TRE_LOG_TRACE(...) TRE_LOG(::tre::log::Level::Trace, __VA_ARGS__)
