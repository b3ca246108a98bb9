// crdt_log.cpp
#include "crdt_log.hpp"
#include "crdt_errors.hpp"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace {

std::atomic<CrdtLogLevel> g_level{CrdtLogLevel::Info};
std::mutex g_sink_mutex;
CrdtLogSink g_sink;

void default_sink(CrdtLogLevel level, const std::string &component, const std::string &message) {
  auto now = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch());
  std::cerr << now.count() << " [" << std::setw(5) << to_string(level) << "] " << component << ": " << message << std::endl;
}

} // namespace

const char *to_string(CrdtLogLevel level) {
  switch (level) {
  case CrdtLogLevel::Debug:
    return "DEBUG";
  case CrdtLogLevel::Info:
    return "INFO";
  case CrdtLogLevel::Warn:
    return "WARN";
  case CrdtLogLevel::Error:
    return "ERROR";
  case CrdtLogLevel::Off:
    return "OFF";
  }
  return "";
}

const char *to_string(CrdtErrorKind kind) {
  switch (kind) {
  case CrdtErrorKind::ImmutableConflict:
    return "ImmutableConflict";
  case CrdtErrorKind::InsufficientEscrow:
    return "InsufficientEscrow";
  case CrdtErrorKind::NetworkTransient:
    return "NetworkTransient";
  case CrdtErrorKind::ProtocolViolation:
    return "ProtocolViolation";
  case CrdtErrorKind::QuorumNotReached:
    return "QuorumNotReached";
  case CrdtErrorKind::DoubleSpendDetected:
    return "DoubleSpendDetected";
  case CrdtErrorKind::DeserializeCorruption:
    return "DeserializeCorruption";
  case CrdtErrorKind::Schema:
    return "Schema";
  case CrdtErrorKind::DocumentNotFound:
    return "DocumentNotFound";
  case CrdtErrorKind::Storage:
    return "Storage";
  case CrdtErrorKind::InvalidArgument:
    return "InvalidArgument";
  }
  return "";
}

void CrdtLog::set_level(CrdtLogLevel level) { g_level.store(level); }

CrdtLogLevel CrdtLog::level() { return g_level.load(); }

void CrdtLog::set_sink(CrdtLogSink sink) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_sink = std::move(sink);
}

void CrdtLog::write(CrdtLogLevel level, const std::string &component, const std::string &message) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  if (g_sink) {
    g_sink(level, component, message);
  } else {
    default_sink(level, component, message);
  }
}
