#include "RegionExtractor.hpp"

#include <opencv2/imgcodecs.hpp>

#include <chrono>
#include <iostream>

namespace renamer {

std::string ExtractionResult::fieldText() const {
  if (status != ExtractionStatus::Ok) {
    return "";
  }
  if (!isValid) {
    return kInvalidMarker + " " + candidate;
  }
  return candidate;
}

std::string concatenateDigits(const std::string &text) {
  std::string digits;
  for (char c : text) {
    if (c >= '0' && c <= '9') {
      digits.push_back(c);
    }
  }
  return digits;
}

bool passesDigitFilter(const std::string &candidate, int digitFilter) {
  if (digitFilter <= 0) {
    return true;
  }
  return candidate.size() == static_cast<size_t>(digitFilter);
}

RegionExtractor::RegionExtractor(TextRecognizer &recognizer, double dpi,
                                 std::filesystem::path debugImageDir)
    : m_recognizer(recognizer), m_dpi(dpi),
      m_debugImageDir(std::move(debugImageDir)) {}

ExtractionResult RegionExtractor::extract(Document &document,
                                          const DocRect &rect, int digitFilter,
                                          const std::string &debugName) const {
  ExtractionResult result;
  auto startTime = std::chrono::high_resolution_clock::now();

  // 1. Rasterize the clip of the first page
  cv::Mat clip;
  try {
    clip = document.renderRegion(rect, m_dpi);
  } catch (const std::exception &e) {
    result.status = ExtractionStatus::RenderFailed;
    result.errorMessage = e.what();
    return result;
  }

  // 2. Recognize it
  RecognitionResult recognition;
  try {
    recognition = m_recognizer.recognize(clip);
  } catch (const std::exception &e) {
    recognition.success = false;
    recognition.errorMessage = std::string("OCR failed: ") + e.what();
  }

  if (!recognition.success) {
    result.status = ExtractionStatus::RecognitionFailed;
    result.errorMessage = recognition.errorMessage;
    return result;
  }

  if (!debugName.empty()) {
    saveDebugImage(recognition.processedImage.empty()
                       ? clip
                       : recognition.processedImage,
                   debugName);
  }

  // 3. Keep the digits, 4. apply the filter
  result.rawText = recognition.text;
  result.candidate = concatenateDigits(recognition.text);
  result.isValid = passesDigitFilter(result.candidate, digitFilter);

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  std::cerr << "DEBUG: Extracted '" << result.candidate << "' from "
            << clip.cols << "x" << clip.rows << " clip ("
            << recognition.processingTimeMs << " ms OCR)" << std::endl;

  return result;
}

void RegionExtractor::saveDebugImage(const cv::Mat &image,
                                     const std::string &name) const {
  if (m_debugImageDir.empty() || image.empty()) {
    return;
  }

  std::filesystem::path savePath = m_debugImageDir / (name + ".png");
  try {
    if (!cv::imwrite(savePath.string(), image)) {
      std::cerr << "Could not save OCR debug image: " << savePath.string()
                << std::endl;
    }
  } catch (const cv::Exception &e) {
    std::cerr << "Could not save OCR debug image: " << e.what() << std::endl;
  }
}

} // namespace renamer
