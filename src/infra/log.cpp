#include "infra/log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace fwp {

static std::mutex g_log_mu;

static const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "?";
}

// Wall clock time of day with milliseconds
static std::string TimeOfDay() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::time_t t = system_clock::to_time_t(now);
  const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm tm{};
  localtime_r(&t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms;
  return oss.str();
}

void Log(LogLevel level, const std::string& who, const std::string& msg) {
  std::ostringstream line;
  line << TimeOfDay() << " [" << LevelName(level) << "] " << who << ": " << msg << "\n";

  std::lock_guard<std::mutex> lock(g_log_mu);
  if (level == LogLevel::Info) {
    std::cout << line.str() << std::flush;
  } else {
    std::cerr << line.str() << std::flush;
  }
}

} // namespace fwp
