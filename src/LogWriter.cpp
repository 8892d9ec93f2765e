#include "LogWriter.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace renamer {

LogWriter::LogWriter(std::filesystem::path logDir, Clock clock)
    : m_logDir(std::move(logDir)), m_clock(std::move(clock)) {}

std::string LogWriter::dateStamp(std::chrono::system_clock::time_point when) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &t);
#else
  localtime_r(&t, &local);
#endif

  std::ostringstream stamp;
  stamp << std::put_time(&local, "%Y%m%d");
  return stamp.str();
}

std::filesystem::path LogWriter::currentLogFile() const {
  return m_logDir / (dateStamp(m_clock()) + ".txt");
}

void LogWriter::append(const std::string &identifier) const {
  std::filesystem::path logPath = currentLogFile();

  std::ofstream out(logPath, std::ios::out | std::ios::app);
  if (!out) {
    throw std::runtime_error("Could not open log file: " + logPath.string());
  }

  out << identifier << "\n";
  out.flush();
  if (!out) {
    throw std::runtime_error("Could not write log file: " + logPath.string());
  }
}

} // namespace renamer
