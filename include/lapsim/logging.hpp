#pragma once
#include <iostream>
#include <memory>
#include <string_view>

namespace lapsim::logging {

enum class Level {
  Debug,
  Info,
  Warning,
  Error,
};

class LogSink {
public:
  virtual ~LogSink() = default;
  virtual void log(Level level, std::string_view message) = 0;
};

// Null sink discards the message.
inline void log(LogSink* sink, Level level, std::string_view message) {
  if (sink) {
    sink->log(level, message);
  }
}

class OstreamLogSink : public LogSink {
public:
  explicit OstreamLogSink(std::ostream& os, Level min_level = Level::Debug)
    : os_(os), min_level_(min_level) {}

  void log(Level level, std::string_view message) override {
    if (level < min_level_) return;
    os_ << prefix(level) << message << std::endl;
  }

private:
  std::ostream& os_;
  Level min_level_;

  static constexpr const char* prefix(Level level) {
    switch (level) {
      case Level::Debug:   return "[debug] ";
      case Level::Info:    return "[info ] ";
      case Level::Warning: return "[warn ] ";
      case Level::Error:   return "[error] ";
    }
    return "";
  }
};

using LogSinkPtr = std::shared_ptr<LogSink>;

inline LogSinkPtr make_console_log_sink(Level min_level = Level::Info) {
  return std::make_shared<OstreamLogSink>(std::clog, min_level);
}

} // namespace lapsim::logging
