#include "platform/Log.h"

#include <cstdarg>
#include <cstdio>

namespace {

platform::LogLevel current_level = platform::LogLevel::Warn;

char levelLetter(platform::LogLevel level) {
  switch (level) {
    case platform::LogLevel::Error: return 'E';
    case platform::LogLevel::Warn:  return 'W';
    case platform::LogLevel::Info:  return 'I';
    case platform::LogLevel::Debug: return 'D';
    default:                        return '?';
  }
}

}  // namespace

namespace platform {

void setLogLevel(LogLevel level) {
  current_level = level;
}

LogLevel logLevel() {
  return current_level;
}

void logMessage(LogLevel level, const char* tag, const char* format, ...) {
  if (level == LogLevel::None || static_cast<uint8_t>(level) > static_cast<uint8_t>(current_level)) {
    return;
  }

  char message[192];
  va_list args;
  va_start(args, format);
  vsnprintf(message, sizeof(message), format, args);
  va_end(args);

#ifdef ARDUINO
  Serial.printf("[%c][%s] %s\n", levelLetter(level), tag ? tag : "-", message);
#else
  std::fprintf(stderr, "[%c][%s] %s\n", levelLetter(level), tag ? tag : "-", message);
#endif
}

}  // namespace platform
