#ifndef RENAMER_LOG_WRITER_HPP
#define RENAMER_LOG_WRITER_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

namespace renamer {

/**
 * @brief Append-only record of committed identifiers, one file per day
 *
 * Entries go to <logDir>/<YYYYMMDD>.txt, one identifier per line, in commit
 * order. Existing content is never truncated.
 */
class LogWriter {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  /**
   * @param logDir Directory holding the daily files
   * @param clock Source of the current time (local date is used)
   */
  explicit LogWriter(std::filesystem::path logDir,
                     Clock clock = std::chrono::system_clock::now);

  /**
   * @brief Append one identifier to today's file
   * @throws std::runtime_error if the file cannot be opened or written
   */
  void append(const std::string &identifier) const;

  /**
   * @brief Path of the file entries are appended to right now
   */
  std::filesystem::path currentLogFile() const;

  /**
   * @brief Format a time point as YYYYMMDD in local time
   */
  static std::string dateStamp(std::chrono::system_clock::time_point when);

private:
  std::filesystem::path m_logDir;
  Clock m_clock;
};

} // namespace renamer

#endif // RENAMER_LOG_WRITER_HPP
