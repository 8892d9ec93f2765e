#include "ConfigStore.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <iostream>
#include <system_error>

namespace renamer {

namespace {

constexpr const char *kDefaultConfig = R"(# PDF renamer configuration

Paths:
  # Documents to process (sorted by name)
  input_dir: pdf_input
  # Renamed copies are written here
  output_dir: pdf_output
  # One log file per day, one line per committed identifier
  log_dir: log_output
  # Binarized OCR clips for inspection, leave empty to disable
  debug_image_dir: ocr_get_image

OCR:
  # Extraction rectangle on the first page, in points from the top-left corner
  x: 50
  y: 50
  width: 200
  height: 50
  # Tesseract language and data directory (empty: TESSDATA_PREFIX)
  language: eng
  tessdata_dir: ""
  # Clip resolution and binarization threshold
  dpi: 300
  threshold: 200

Filter:
  # Required number of digits, 0 disables the check
  digits: 0
)";

/**
 * Get a value from a section of the config
 * @param root Parsed file
 * @param section Section name (e.g "OCR")
 * @param key Key inside the section
 * @param fallback Default value if the key is absent
 */
template <typename T>
T getValue(const YAML::Node &root, const char *section, const char *key,
           const T &fallback) {
  const YAML::Node sectionNode = root[section];
  if (!sectionNode || sectionNode.IsNull()) {
    return fallback;
  }
  if (!sectionNode.IsMap()) {
    throw ConfigError(std::string("Section '") + section +
                      "' is not a key/value map");
  }

  const YAML::Node value = sectionNode[key];
  if (!value || value.IsNull()) {
    return fallback;
  }

  try {
    return value.as<T>();
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("Invalid value for ") + section + "." + key +
                      ": " + e.what());
  }
}

} // anonymous namespace

ConfigStore::ConfigStore(std::filesystem::path path) : m_path(std::move(path)) {}

bool ConfigStore::exists() const { return std::filesystem::exists(m_path); }

Settings ConfigStore::load() const {
  Settings settings;

  if (!exists()) {
    std::cerr << "Warning: config file " << m_path.string()
              << " not found, using defaults" << std::endl;
    return settings;
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(m_path.string());
  } catch (const YAML::Exception &e) {
    throw ConfigError("Parsing config file '" + m_path.string() +
                      "' failed: " + e.what());
  }

  if (root.IsNull()) {
    return settings;
  }
  if (!root.IsMap()) {
    throw ConfigError("Config file '" + m_path.string() +
                      "' must contain sections Paths, OCR and Filter");
  }

  settings.inputDir = getValue<std::string>(root, "Paths", "input_dir",
                                            settings.inputDir.string());
  settings.outputDir = getValue<std::string>(root, "Paths", "output_dir",
                                             settings.outputDir.string());
  settings.logDir = getValue<std::string>(root, "Paths", "log_dir",
                                          settings.logDir.string());
  settings.debugImageDir = getValue<std::string>(
      root, "Paths", "debug_image_dir", settings.debugImageDir.string());

  int x = getValue<int>(root, "OCR", "x", 50);
  int y = getValue<int>(root, "OCR", "y", 50);
  int width = getValue<int>(root, "OCR", "width", 200);
  int height = getValue<int>(root, "OCR", "height", 50);
  if (width > 0 && height > 0) {
    settings.rect = DocRect{static_cast<double>(x), static_cast<double>(y),
                            static_cast<double>(x + width),
                            static_cast<double>(y + height)};
  } else {
    std::cerr << "Warning: OCR rectangle " << width << "x" << height
              << " is empty, using the default rectangle" << std::endl;
  }

  settings.ocrLanguage =
      getValue<std::string>(root, "OCR", "language", settings.ocrLanguage);
  settings.tessDataDir =
      getValue<std::string>(root, "OCR", "tessdata_dir", settings.tessDataDir);
  settings.ocrDpi = getValue<int>(root, "OCR", "dpi", settings.ocrDpi);
  settings.ocrThreshold =
      getValue<int>(root, "OCR", "threshold", settings.ocrThreshold);

  settings.digitFilter =
      getValue<int>(root, "Filter", "digits", settings.digitFilter);
  if (settings.digitFilter < 0) {
    throw ConfigError("Filter.digits must not be negative");
  }
  if (settings.ocrDpi <= 0) {
    throw ConfigError("OCR.dpi must be positive");
  }

  return settings;
}

SaveResult ConfigStore::saveRect(const DocRect &rect) const {
  SaveResult result;

  // Start from what is on disk so unrelated settings survive verbatim
  YAML::Node root;
  try {
    if (exists()) {
      root = YAML::LoadFile(m_path.string());
    }
  } catch (const YAML::Exception &e) {
    result.errorMessage =
        "Could not re-read " + m_path.string() + ": " + e.what();
    return result;
  }

  if (!root.IsMap()) {
    root = YAML::Node(YAML::NodeType::Map);
  }
  if (!root["OCR"].IsMap()) {
    root["OCR"] = YAML::Node(YAML::NodeType::Map);
  }

  YAML::Node ocr = root["OCR"];
  ocr["x"] = static_cast<int>(rect.x0);
  ocr["y"] = static_cast<int>(rect.y0);
  ocr["width"] = static_cast<int>(rect.x1 - rect.x0);
  ocr["height"] = static_cast<int>(rect.y1 - rect.y0);

  YAML::Emitter emitter;
  emitter << root;
  if (!emitter.good()) {
    result.errorMessage = "Could not serialize configuration: " +
                          emitter.GetLastError();
    return result;
  }

  std::filesystem::path tmpPath = m_path;
  tmpPath += ".tmp";

  {
    std::ofstream out(tmpPath, std::ios::out | std::ios::trunc);
    if (!out) {
      result.errorMessage = "Could not open " + tmpPath.string();
      return result;
    }
    out << emitter.c_str() << "\n";
    out.flush();
    if (!out) {
      result.errorMessage = "Could not write " + tmpPath.string();
      return result;
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmpPath, m_path, ec);
  if (ec) {
    result.errorMessage =
        "Could not replace " + m_path.string() + ": " + ec.message();
    std::filesystem::remove(tmpPath, ec);
    return result;
  }

  result.success = true;
  return result;
}

bool ConfigStore::generateDefault() const {
  std::ofstream out(m_path);
  if (!out) {
    return false;
  }
  out << kDefaultConfig;
  return static_cast<bool>(out);
}

void ensureDirectories(const Settings &settings) {
  for (const auto &dir : {settings.inputDir, settings.outputDir,
                          settings.logDir, settings.debugImageDir}) {
    if (!dir.empty() && !std::filesystem::exists(dir)) {
      std::filesystem::create_directories(dir);
    }
  }
}

} // namespace renamer
