#ifndef RENAMER_TEXT_RECOGNIZER_HPP
#define RENAMER_TEXT_RECOGNIZER_HPP

#include <opencv2/core.hpp>
#include <tesseract/baseapi.h>

#include <memory>
#include <string>
#include <vector>

namespace renamer {

/**
 * @brief Result of recognizing the text of one image
 */
struct RecognitionResult {
  std::string text;          ///< Recognized UTF-8 text
  cv::Mat processedImage;    ///< Image actually handed to the engine
  double processingTimeMs = 0; ///< Processing time in milliseconds
  bool success = false;      ///< Whether recognition ran
  std::string errorMessage;  ///< Error message if failed
};

/**
 * @brief Text recognition service
 *
 * A failed result means the engine could not run. An image without text is
 * a successful result with empty text.
 */
class TextRecognizer {
public:
  virtual ~TextRecognizer() = default;

  /**
   * @brief Recognize the text of an image
   * @param image BGR, BGRA or grayscale image
   */
  virtual RecognitionResult recognize(const cv::Mat &image) = 0;
};

/**
 * @brief Configuration options for the Tesseract recognizer
 */
struct RecognizerConfig {
  std::string language = "eng"; ///< Language code (e.g., "eng", "deu+eng")
  tesseract::PageSegMode pageSegMode =
      tesseract::PSM_SINGLE_BLOCK; ///< Page segmentation mode
  bool binarize = true;            ///< Apply fixed-threshold binarization
  int threshold = 200;             ///< Pixels below become black (0-255)
  int sourceResolution = 300;      ///< DPI reported to Tesseract
  std::string tessDataPath =
      ""; ///< Path to tessdata directory (empty = TESSDATA_PREFIX/default)
};

/**
 * @brief Text recognizer using Tesseract with OpenCV preprocessing
 *
 * Example usage:
 * @code
 * renamer::TesseractRecognizer recognizer;
 * if (recognizer.initialize()) {
 *     auto result = recognizer.recognize(clip);
 *     if (result.success) {
 *         std::cout << result.text << std::endl;
 *     }
 * }
 * @endcode
 */
class TesseractRecognizer : public TextRecognizer {
public:
  TesseractRecognizer();
  explicit TesseractRecognizer(const RecognizerConfig &config);
  ~TesseractRecognizer() override;

  // Owns one engine instance for its whole life
  TesseractRecognizer(const TesseractRecognizer &) = delete;
  TesseractRecognizer &operator=(const TesseractRecognizer &) = delete;
  TesseractRecognizer(TesseractRecognizer &&) = delete;
  TesseractRecognizer &operator=(TesseractRecognizer &&) = delete;

  /**
   * @brief Initialize the OCR engine
   *
   * The tessdata path is taken from the configuration, then from
   * TESSDATA_PREFIX, then left to the Tesseract default.
   *
   * @return true if initialization was successful, false otherwise
   */
  bool initialize();

  bool isInitialized() const;

  /**
   * @brief Recognize an image
   *
   * Fails (success == false) when the engine is not initialized or the
   * image is empty.
   */
  RecognitionResult recognize(const cv::Mat &image) override;

  /**
   * @brief Convert to grayscale and apply the fixed binarization threshold
   * @param image Input image
   * @param threshold Pixels strictly below become 0, others 255
   */
  static cv::Mat binarize(const cv::Mat &image, int threshold);

  const RecognizerConfig &getConfig() const;

  static std::string getTesseractVersion();

  std::vector<std::string> getAvailableLanguages() const;

private:
  /**
   * @brief Hand an OpenCV image to Tesseract (converted to RGB)
   */
  void setImage(const cv::Mat &image);

  std::unique_ptr<tesseract::TessBaseAPI> m_tesseract;
  RecognizerConfig m_config;
  bool m_initialized;
};

} // namespace renamer

#endif // RENAMER_TEXT_RECOGNIZER_HPP
