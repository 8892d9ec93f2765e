#include "RegionExtractor.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace {

int failures = 0;

void check(bool condition, const std::string &what) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << what << std::endl;
  if (!condition) {
    ++failures;
  }
}

/// Document whose clip is a blank image sized after the requested region
class FakeDocument : public renamer::Document {
public:
  bool failRender = false;
  renamer::DocRect lastRect;
  double lastDpi = 0;

  int pageCount() const override { return 1; }
  cv::Size2d pageSize() const override { return cv::Size2d(600, 800); }

  cv::Mat renderPage(double scale) override {
    return cv::Mat(static_cast<int>(800 * scale), static_cast<int>(600 * scale),
                   CV_8UC3, cv::Scalar(255, 255, 255));
  }

  cv::Mat renderRegion(const renamer::DocRect &rect, double dpi) override {
    if (failRender) {
      throw renamer::DocumentError("Rendering failed");
    }
    lastRect = rect;
    lastDpi = dpi;
    double scale = dpi / 72.0;
    return cv::Mat(static_cast<int>(rect.height() * scale),
                   static_cast<int>(rect.width() * scale), CV_8UC3,
                   cv::Scalar(255, 255, 255));
  }
};

/// Recognizer returning a scripted answer
class FakeRecognizer : public renamer::TextRecognizer {
public:
  std::string text;
  bool fail = false;
  bool raise = false;
  cv::Size lastImageSize;
  int calls = 0;

  renamer::RecognitionResult recognize(const cv::Mat &image) override {
    ++calls;
    lastImageSize = image.size();
    if (raise) {
      throw std::runtime_error("engine crashed");
    }

    renamer::RecognitionResult result;
    if (fail) {
      result.errorMessage = "OCR engine not initialized";
      return result;
    }
    result.text = text;
    result.processedImage = image;
    result.success = true;
    return result;
  }
};

} // anonymous namespace

int main() {
  std::cout << "=== Test RegionExtractor ===" << std::endl << std::endl;

  // Digit concatenation
  std::cout << "concatenateDigits:" << std::endl;
  check(renamer::concatenateDigits("No. 12-3456  AB") == "123456",
        "'No. 12-3456  AB' gives '123456'");
  check(renamer::concatenateDigits("12\n34\n") == "1234",
        "runs on separate lines are joined");
  check(renamer::concatenateDigits("ABC").empty(), "no digits gives ''");
  check(renamer::concatenateDigits("").empty(), "empty text gives ''");

  // Digit filter
  std::cout << std::endl << "passesDigitFilter:" << std::endl;
  check(renamer::passesDigitFilter("123456", 6), "6 digits pass filter 6");
  check(!renamer::passesDigitFilter("12345", 6), "5 digits fail filter 6");
  check(!renamer::passesDigitFilter("1234567", 6), "7 digits fail filter 6");
  check(renamer::passesDigitFilter("12345", 0), "filter 0 accepts anything");
  check(renamer::passesDigitFilter("", 0), "filter 0 accepts ''");
  check(!renamer::passesDigitFilter("", 4), "'' fails filter 4");

  FakeDocument document;
  FakeRecognizer recognizer;
  renamer::RegionExtractor extractor(recognizer, 300.0);
  const renamer::DocRect rect{50, 50, 250, 100};

  // Valid candidate
  std::cout << std::endl << "Valid candidate:" << std::endl;
  recognizer.text = "No. 12-3456  AB\n";
  auto result = extractor.extract(document, rect, 6);
  check(result.success(), "extraction succeeds");
  check(result.rawText == "No. 12-3456  AB\n", "raw text is kept");
  check(result.candidate == "123456", "candidate is '123456'");
  check(result.isValid, "candidate is valid");
  check(result.fieldText() == "123456", "field is the bare candidate");
  check(document.lastRect == rect, "clip is the requested rectangle");
  check(document.lastDpi == 300.0, "clip is rendered at 300 dpi");
  check(recognizer.lastImageSize == cv::Size(833, 208),
        "recognizer gets the 200x50 pt clip at 300 dpi");

  // Invalid candidate
  std::cout << std::endl << "Invalid candidate:" << std::endl;
  result = extractor.extract(document, rect, 5);
  check(result.success(), "extraction succeeds");
  check(!result.isValid, "6 digits fail filter 5");
  check(result.fieldText() == renamer::kInvalidMarker + " 123456",
        "field carries the invalid marker");

  recognizer.text = "";
  result = extractor.extract(document, rect, 4);
  check(result.success() && result.candidate.empty() && !result.isValid,
        "no text with a filter is invalid");
  result = extractor.extract(document, rect, 0);
  check(result.success() && result.isValid && result.fieldText().empty(),
        "no text without a filter gives an empty valid field");

  // Failures
  std::cout << std::endl << "Failures:" << std::endl;
  recognizer.fail = true;
  result = extractor.extract(document, rect, 6);
  check(result.status == renamer::ExtractionStatus::RecognitionFailed,
        "uninitialized recognizer is a recognition failure");
  check(result.errorMessage == "OCR engine not initialized",
        "recognizer message is reported");
  check(result.fieldText().empty(), "failed extraction seeds an empty field");

  recognizer.fail = false;
  recognizer.raise = true;
  result = extractor.extract(document, rect, 6);
  check(result.status == renamer::ExtractionStatus::RecognitionFailed,
        "recognizer exception is a recognition failure");
  recognizer.raise = false;

  document.failRender = true;
  int callsBefore = recognizer.calls;
  result = extractor.extract(document, rect, 6);
  check(result.status == renamer::ExtractionStatus::RenderFailed,
        "render error is a render failure");
  check(recognizer.calls == callsBefore,
        "recognizer is not called when rendering fails");
  document.failRender = false;

  // Debug image
  std::cout << std::endl << "Debug image:" << std::endl;
  std::filesystem::path debugDir = std::filesystem::temp_directory_path() /
                                   "renamer_test_region_extractor";
  std::filesystem::remove_all(debugDir);
  std::filesystem::create_directories(debugDir);

  renamer::RegionExtractor debugExtractor(recognizer, 300.0, debugDir);
  recognizer.text = "42";
  debugExtractor.extract(document, rect, 0, "invoice_001");
  check(std::filesystem::exists(debugDir / "invoice_001.png"),
        "processed clip is saved as <name>.png");
  debugExtractor.extract(document, rect, 0);
  check(std::distance(std::filesystem::directory_iterator(debugDir),
                      std::filesystem::directory_iterator()) == 1,
        "no image without a name");

  std::filesystem::remove_all(debugDir);

  std::cout << std::endl
            << (failures == 0 ? "All checks passed"
                              : std::to_string(failures) + " check(s) failed")
            << std::endl;
  return failures == 0 ? 0 : 1;
}
