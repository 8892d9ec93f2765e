#ifndef RENAMER_CONFIG_STORE_HPP
#define RENAMER_CONFIG_STORE_HPP

#include "CoordinateTransform.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace renamer {

/**
 * @brief Raised when the configuration file cannot be parsed
 */
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Settings read from the configuration file
 *
 * Every field carries the value used when its key is absent.
 */
struct Settings {
  // [Paths]
  std::filesystem::path inputDir = "pdf_input";
  std::filesystem::path outputDir = "pdf_output";
  std::filesystem::path logDir = "log_output";
  std::filesystem::path debugImageDir = "ocr_get_image"; ///< Empty disables

  // [OCR]
  DocRect rect{50, 50, 250, 100}; ///< x=50 y=50 width=200 height=50
  std::string ocrLanguage = "eng";
  std::string tessDataDir;
  int ocrDpi = 300;
  int ocrThreshold = 200;

  // [Filter]
  int digitFilter = 0; ///< Required candidate length, 0 disables
};

/**
 * @brief Outcome of a configuration write
 */
struct SaveResult {
  bool success = false;
  std::string errorMessage;
};

/**
 * @brief YAML configuration file holding paths, the extraction rectangle and
 * the digit filter
 *
 * Layout:
 * @code
 * Paths:
 *   input_dir: pdf_input
 *   output_dir: pdf_output
 *   log_dir: log_output
 * OCR:
 *   x: 50
 *   y: 50
 *   width: 200
 *   height: 50
 * Filter:
 *   digits: 0
 * @endcode
 */
class ConfigStore {
public:
  explicit ConfigStore(std::filesystem::path path);

  /**
   * @brief Read the settings
   *
   * A missing file gives the defaults.
   *
   * @throws ConfigError if the file is not valid YAML or a value has the
   * wrong type
   */
  Settings load() const;

  /**
   * @brief Persist a new extraction rectangle
   *
   * Only OCR.x, OCR.y, OCR.width and OCR.height are replaced (truncated to
   * integers); every other key of the file is written back as found. The
   * file is replaced atomically through a temporary sibling.
   */
  SaveResult saveRect(const DocRect &rect) const;

  /**
   * @brief Write a commented default configuration file
   * @return false if the file could not be written
   */
  bool generateDefault() const;

  bool exists() const;
  const std::filesystem::path &path() const { return m_path; }

private:
  std::filesystem::path m_path;
};

/**
 * @brief Create the input, output, log and debug directories if absent
 * @throws std::filesystem::filesystem_error on failure
 */
void ensureDirectories(const Settings &settings);

} // namespace renamer

#endif // RENAMER_CONFIG_STORE_HPP
