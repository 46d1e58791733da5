#pragma once

#include <string>

/*
    Small console logger shared by every thread in the pipeline.

    Lines are written whole (one lock per line) so output from the capture thread, the watcher threads and the
    main thread doesn't interleave mid-line. Info goes to stdout, warnings and errors to stderr.

    Format: "HH:MM:SS.mmm [LEVEL] who: message"
*/

namespace fwp {

enum class LogLevel {
  Info,
  Warn,
  Error
};

void Log(LogLevel level, const std::string& who, const std::string& msg);

inline void LogInfo(const std::string& who, const std::string& msg) { Log(LogLevel::Info, who, msg); }
inline void LogWarn(const std::string& who, const std::string& msg) { Log(LogLevel::Warn, who, msg); }
inline void LogError(const std::string& who, const std::string& msg) { Log(LogLevel::Error, who, msg); }

} // namespace fwp
