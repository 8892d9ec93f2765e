#ifndef RENAMER_REGION_EXTRACTOR_HPP
#define RENAMER_REGION_EXTRACTOR_HPP

#include "CoordinateTransform.hpp"
#include "Document.hpp"
#include "TextRecognizer.hpp"

#include <filesystem>
#include <string>

namespace renamer {

/// Prefix put in front of a candidate that fails the digit filter
inline const std::string kInvalidMarker = "(?)";

/**
 * @brief Outcome class of an extraction
 */
enum class ExtractionStatus {
  Ok,               ///< Candidate and validity are meaningful
  RenderFailed,     ///< The clip could not be rasterized
  RecognitionFailed ///< The recognizer is unavailable or failed
};

/**
 * @brief Result of extracting the identifier of one document
 */
struct ExtractionResult {
  ExtractionStatus status = ExtractionStatus::Ok;
  std::string rawText;      ///< Text as recognized
  std::string candidate;    ///< Digits only
  bool isValid = false;     ///< Candidate passes the digit filter
  std::string errorMessage; ///< Set for RenderFailed / RecognitionFailed
  double processingTimeMs = 0;

  bool success() const { return status == ExtractionStatus::Ok; }

  /**
   * @brief Text to seed the filename field with
   *
   * Invalid candidates carry the invalid marker so they cannot be committed
   * as they are. Failed extractions seed an empty field.
   */
  std::string fieldText() const;
};

/**
 * @brief Concatenate every run of ASCII digits in reading order
 *
 * "No. 12-3456  AB" gives "123456".
 */
std::string concatenateDigits(const std::string &text);

/**
 * @brief Digit filter check
 * @param digitFilter Required length, 0 disables the check
 */
bool passesDigitFilter(const std::string &candidate, int digitFilter);

/**
 * @brief Extracts the identifier from a rectangle of a document's first page
 */
class RegionExtractor {
public:
  /**
   * @param recognizer Recognition service, must outlive the extractor
   * @param dpi Resolution the clip is rasterized at
   * @param debugImageDir Where processed clips are saved (empty disables)
   */
  explicit RegionExtractor(TextRecognizer &recognizer, double dpi = 300.0,
                           std::filesystem::path debugImageDir = {});

  /**
   * @brief Extract the candidate identifier
   * @param document Open document
   * @param rect Extraction rectangle in document space
   * @param digitFilter Required candidate length, 0 for none
   * @param debugName Stem used for the debug image file
   */
  ExtractionResult extract(Document &document, const DocRect &rect,
                           int digitFilter,
                           const std::string &debugName = "") const;

private:
  void saveDebugImage(const cv::Mat &image, const std::string &name) const;

  TextRecognizer &m_recognizer;
  double m_dpi;
  std::filesystem::path m_debugImageDir;
};

} // namespace renamer

#endif // RENAMER_REGION_EXTRACTOR_HPP
