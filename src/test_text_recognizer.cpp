#include "TextRecognizer.hpp"

#include <iostream>
#include <string>

namespace {

int failures = 0;

void check(bool condition, const std::string &what) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << what << std::endl;
  if (!condition) {
    ++failures;
  }
}

/// Two pixels side by side: grey 199 then grey 200
cv::Mat greyPair(int type) {
  cv::Mat image(1, 2, type);
  image.col(0).setTo(cv::Scalar::all(199));
  image.col(1).setTo(cv::Scalar::all(200));
  return image;
}

void checkThreshold(const std::string &label, int type) {
  cv::Mat binary = renamer::TesseractRecognizer::binarize(greyPair(type), 200);
  check(binary.type() == CV_8UC1, label + ": result is single channel");
  check(binary.type() == CV_8UC1 && binary.at<uchar>(0, 0) == 0,
        label + ": 199 becomes black");
  check(binary.type() == CV_8UC1 && binary.at<uchar>(0, 1) == 255,
        label + ": 200 becomes white");
}

} // anonymous namespace

int main() {
  std::cout << "=== Test TesseractRecognizer ===" << std::endl << std::endl;

  std::cout << "Binarization at threshold 200:" << std::endl;
  checkThreshold("gray", CV_8UC1);
  checkThreshold("BGR", CV_8UC3);
  checkThreshold("BGRA", CV_8UC4);

  std::cout << std::endl << "Other thresholds:" << std::endl;
  cv::Mat ramp(1, 256, CV_8UC1);
  for (int i = 0; i < 256; ++i) {
    ramp.at<uchar>(0, i) = static_cast<uchar>(i);
  }
  cv::Mat binary = renamer::TesseractRecognizer::binarize(ramp, 128);
  check(cv::countNonZero(binary) == 128, "threshold 128 keeps 128..255 white");
  check(binary.at<uchar>(0, 127) == 0 && binary.at<uchar>(0, 128) == 255,
        "edge sits between 127 and 128");

  binary = renamer::TesseractRecognizer::binarize(ramp, 256);
  check(cv::countNonZero(binary) == 0, "threshold 256 makes everything black");

  std::cout << std::endl << "Without an engine:" << std::endl;
  renamer::RecognizerConfig config;
  check(config.threshold == 200 && config.language == "eng" &&
            config.pageSegMode == tesseract::PSM_SINGLE_BLOCK,
        "defaults are eng, single block, threshold 200");

  renamer::TesseractRecognizer recognizer(config);
  check(!recognizer.isInitialized(), "not initialized before initialize()");
  renamer::RecognitionResult result = recognizer.recognize(greyPair(CV_8UC3));
  check(!result.success && !result.errorMessage.empty(),
        "recognizing without an engine fails with a message");
  check(recognizer.getAvailableLanguages().empty(),
        "no languages without an engine");

  std::cout << std::endl
            << (failures == 0 ? "All checks passed"
                              : std::to_string(failures) + " check(s) failed")
            << std::endl;
  return failures == 0 ? 0 : 1;
}
