#include "TextRecognizer.hpp"

#include <opencv2/imgproc.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>

namespace renamer {

TesseractRecognizer::TesseractRecognizer()
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(),
      m_initialized(false) {}

TesseractRecognizer::TesseractRecognizer(const RecognizerConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_initialized(false) {}

TesseractRecognizer::~TesseractRecognizer() { m_tesseract->End(); }

bool TesseractRecognizer::initialize() {
  if (m_initialized) {
    return true;
  }

  const char *tessDataPath = nullptr;

  // Priority 1: Use config path if provided
  if (!m_config.tessDataPath.empty()) {
    tessDataPath = m_config.tessDataPath.c_str();
  }
  // Priority 2: TESSDATA_PREFIX, otherwise the library default
  else {
    tessDataPath = std::getenv("TESSDATA_PREFIX");
    if (tessDataPath == nullptr) {
      std::cerr << "TESSDATA_PREFIX not set, using Tesseract default path"
                << std::endl;
    }
  }

  int result = m_tesseract->Init(tessDataPath, m_config.language.c_str());

  if (result != 0) {
    std::cerr << "Failed to initialize Tesseract with language: "
              << m_config.language << std::endl;
    return false;
  }

  m_tesseract->SetPageSegMode(m_config.pageSegMode);
  m_initialized = true;
  return true;
}

bool TesseractRecognizer::isInitialized() const { return m_initialized; }

RecognitionResult TesseractRecognizer::recognize(const cv::Mat &image) {
  RecognitionResult result;
  result.success = false;

  if (!m_initialized) {
    result.errorMessage =
        "OCR engine not initialized (is Tesseract installed with the '" +
        m_config.language + "' language data?)";
    return result;
  }

  if (image.empty()) {
    result.errorMessage = "Input image is empty";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    result.processedImage =
        m_config.binarize ? binarize(image, m_config.threshold) : image;

    setImage(result.processedImage);
    m_tesseract->SetSourceResolution(m_config.sourceResolution);

    char *outText = m_tesseract->GetUTF8Text();
    if (outText) {
      result.text = outText;
      delete[] outText;
    }
    m_tesseract->Clear();

    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("OCR failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

cv::Mat TesseractRecognizer::binarize(const cv::Mat &image, int threshold) {
  cv::Mat gray;

  // Convert to grayscale if color
  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image.clone();
  }

  // THRESH_BINARY keeps values > thresh, so thresh - 1 sends < threshold to 0
  cv::Mat binary;
  cv::threshold(gray, binary, threshold - 1, 255, cv::THRESH_BINARY);
  return binary;
}

const RecognizerConfig &TesseractRecognizer::getConfig() const {
  return m_config;
}

std::string TesseractRecognizer::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

std::vector<std::string> TesseractRecognizer::getAvailableLanguages() const {
  std::vector<std::string> languages;

  if (m_initialized) {
    m_tesseract->GetAvailableLanguagesAsVector(&languages);
  }

  return languages;
}

void TesseractRecognizer::setImage(const cv::Mat &image) {
  cv::Mat rgbImage;

  // Convert to RGB if necessary (Tesseract expects RGB)
  if (image.channels() == 1) {
    cv::cvtColor(image, rgbImage, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGR2RGB);
  }

  m_tesseract->SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                        static_cast<int>(rgbImage.step));
}

} // namespace renamer
