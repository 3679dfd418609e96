#include <atomic>
#include <cstring>
#include <iostream>
#include <mutex>

#include <tre/log.hpp>

namespace tre::log {

namespace {

std::atomic<Level> currentLevel{Level::Warn};

std::mutex sinkMutex;
Sink currentSink;

const char *basename(const char *file) {
  const char *r = std::strrchr(file, '/');
  if (r) {
    return r + 1;
  }
  r = std::strrchr(file, '\\');
  return r ? r + 1 : file;
}

} // namespace

Level level() noexcept {
  return currentLevel.load(std::memory_order_relaxed);
}

void setLevel(Level lvl) noexcept {
  currentLevel.store(lvl, std::memory_order_relaxed);
}

void setSink(Sink sink) {
  std::lock_guard lock(sinkMutex);
  currentSink = std::move(sink);
}

std::string_view levelName(Level lvl) noexcept {
  switch (lvl) {
  case Level::Error:
    return "error";
  case Level::Warn:
    return "warn";
  case Level::Info:
    return "info";
  case Level::Debug:
    return "debug";
  case Level::Trace:
    return "trace";
  }
  return "?";
}

void write(Level lvl, const char *file, int line, const std::string &message) {
  std::lock_guard lock(sinkMutex);
  if (currentSink) {
    currentSink(lvl, message);
    return;
  }
  std::cerr << std::format("[tre] {} {}:{}: {}\n", levelName(lvl), basename(file), line, message);
}

} // namespace tre::log
