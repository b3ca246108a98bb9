// crdt_log.hpp
#ifndef CRDT_LOG_HPP
#define CRDT_LOG_HPP

#include <functional>
#include <sstream>
#include <string>

enum class CrdtLogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

const char *to_string(CrdtLogLevel level);

/// Receives every emitted line. The default sink writes to std::cerr.
using CrdtLogSink = std::function<void(CrdtLogLevel level, const std::string &component, const std::string &message)>;

/// Process-wide log routing. Thread-safe.
class CrdtLog {
public:
  static void set_level(CrdtLogLevel level);
  static CrdtLogLevel level();
  static bool enabled(CrdtLogLevel level) { return level >= CrdtLog::level(); }

  /// Replaces the sink; passing an empty function restores the default.
  static void set_sink(CrdtLogSink sink);

  static void write(CrdtLogLevel level, const std::string &component, const std::string &message);
};

#define CRDT_LOG(level, component, message)                                                                            \
  do {                                                                                                                 \
    if (CrdtLog::enabled(level)) {                                                                                     \
      std::ostringstream crdt_log_oss_;                                                                                \
      crdt_log_oss_ << message;                                                                                        \
      CrdtLog::write(level, component, crdt_log_oss_.str());                                                           \
    }                                                                                                                  \
  } while (0)

#define CRDT_LOG_DEBUG(component, message) CRDT_LOG(CrdtLogLevel::Debug, component, message)
#define CRDT_LOG_INFO(component, message) CRDT_LOG(CrdtLogLevel::Info, component, message)
#define CRDT_LOG_WARN(component, message) CRDT_LOG(CrdtLogLevel::Warn, component, message)
#define CRDT_LOG_ERROR(component, message) CRDT_LOG(CrdtLogLevel::Error, component, message)

#endif // CRDT_LOG_HPP
