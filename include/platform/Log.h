#pragma once

#ifdef ARDUINO
  #include <Arduino.h>
  // Messages go to Serial
#else
  #include <cstdint>
  // Messages go to stderr for host builds and tests
#endif

namespace platform {

enum class LogLevel : uint8_t {
  None = 0,
  Error,
  Warn,
  Info,
  Debug
};

void setLogLevel(LogLevel level);
LogLevel logLevel();

// Printf-style message, prefixed with level letter and tag.
// Dropped when level is above the current log level.
void logMessage(LogLevel level, const char* tag, const char* format, ...)
    __attribute__((format(printf, 3, 4)));

}  // namespace platform

#define PCF_LOGE(tag, ...) ::platform::logMessage(::platform::LogLevel::Error, tag, __VA_ARGS__)
#define PCF_LOGW(tag, ...) ::platform::logMessage(::platform::LogLevel::Warn, tag, __VA_ARGS__)
#define PCF_LOGI(tag, ...) ::platform::logMessage(::platform::LogLevel::Info, tag, __VA_ARGS__)
#define PCF_LOGD(tag, ...) ::platform::logMessage(::platform::LogLevel::Debug, tag, __VA_ARGS__)
