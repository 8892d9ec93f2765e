#include "PopplerDocument.hpp"
#include "RegionExtractor.hpp"
#include "TextRecognizer.hpp"

#include <iomanip>
#include <iostream>

int main(int argc, char *argv[]) {
  std::cout << "=== Region Extraction ===" << std::endl << std::endl;

  if (argc < 6) {
    std::cerr << "Usage: " << argv[0] << " <pdf_file> <x> <y> <width> <height>"
              << " [digits] [dpi]" << std::endl;
    std::cerr << "  x y width height  Region in points from the top-left "
                 "corner of the first page"
              << std::endl;
    std::cerr << "  digits            Required number of digits (default: 0, "
                 "no check)"
              << std::endl;
    std::cerr << "  dpi               Clip resolution (default: 300)"
              << std::endl;
    return 1;
  }

  std::string pdfPath = argv[1];
  renamer::DocRect rect;
  int digits = 0;
  double dpi = 300.0;
  try {
    rect.x0 = std::stod(argv[2]);
    rect.y0 = std::stod(argv[3]);
    rect.x1 = rect.x0 + std::stod(argv[4]);
    rect.y1 = rect.y0 + std::stod(argv[5]);
    if (argc >= 7) {
      digits = std::stoi(argv[6]);
    }
    if (argc >= 8) {
      dpi = std::stod(argv[7]);
    }
  } catch (const std::exception &e) {
    std::cerr << "Invalid number: " << e.what() << std::endl;
    return 1;
  }

  if (!rect.isValid()) {
    std::cerr << "Width and height must be positive" << std::endl;
    return 1;
  }

  renamer::TesseractRecognizer recognizer;
  if (!recognizer.initialize()) {
    std::cerr << "Failed to initialize OCR engine" << std::endl;
    return 1;
  }
  std::cout << "Tesseract version: "
            << renamer::TesseractRecognizer::getTesseractVersion()
            << std::endl;
  std::cout << "Languages:";
  for (const auto &language : recognizer.getAvailableLanguages()) {
    std::cout << " " << language;
  }
  std::cout << std::endl;

  std::unique_ptr<renamer::Document> document;
  try {
    renamer::PopplerDocumentProvider provider;
    document = provider.open(pdfPath);
  } catch (const renamer::DocumentError &e) {
    std::cerr << "Failed to open document: " << e.what() << std::endl;
    return 1;
  }

  cv::Size2d pageSize = document->pageSize();
  std::cout << "Pages: " << document->pageCount() << std::endl;
  std::cout << "Page size: " << std::fixed << std::setprecision(1)
            << pageSize.width << " x " << pageSize.height << " points"
            << std::endl;
  std::cout << "Region: (" << rect.x0 << ", " << rect.y0 << ") - (" << rect.x1
            << ", " << rect.y1 << ")" << std::endl
            << std::endl;

  renamer::RegionExtractor extractor(recognizer, dpi);
  renamer::ExtractionResult result = extractor.extract(*document, rect, digits);

  if (!result.success()) {
    std::cerr << "Extraction failed: " << result.errorMessage << std::endl;
    return 1;
  }

  std::cout << "=== Recognized Text ===" << std::endl;
  std::cout << result.rawText << std::endl;
  std::cout << "=======================" << std::endl << std::endl;

  std::cout << "Candidate: '" << result.candidate << "'" << std::endl;
  std::cout << "Valid: " << (result.isValid ? "yes" : "no") << std::endl;
  std::cout << "Field: '" << result.fieldText() << "'" << std::endl;
  std::cout << "Processing time: " << std::setprecision(2)
            << result.processingTimeMs << " ms" << std::endl;

  return 0;
}
