#pragma once

#include <iostream>
#include <mutex>
#include <string>

// Minimal leveled logger writing to stderr. Safe to call from pipeline workers.
class Logger {
public:
  enum class Level {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Off = 4
  };

  static void setLevel(Level level) {
    std::lock_guard<std::mutex> lock(mutex());
    threshold() = level;
  }

  static Level level() {
    std::lock_guard<std::mutex> lock(mutex());
    return threshold();
  }

  static void log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex());
    if (level < threshold() || level == Level::Off) return;

    const char* prefix = "";
    switch (level) {
      case Level::Debug:   prefix = "[debug] "; break;
      case Level::Info:    prefix = "[info] "; break;
      case Level::Warning: prefix = "[warn] "; break;
      case Level::Error:   prefix = "[error] "; break;
      case Level::Off:     break;
    }
    std::cerr << prefix << message << std::endl;
  }

  static void debug(const std::string& msg) { log(Level::Debug, msg); }
  static void info(const std::string& msg)  { log(Level::Info, msg); }
  static void warn(const std::string& msg)  { log(Level::Warning, msg); }
  static void error(const std::string& msg) { log(Level::Error, msg); }

private:
  static std::mutex& mutex() {
    static std::mutex m;
    return m;
  }

  static Level& threshold() {
    static Level current = Level::Info;
    return current;
  }
};
