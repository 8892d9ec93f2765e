#include "BatchPipeline.hpp"
#include "ConfigStore.hpp"
#include "DocumentQueue.hpp"
#include "LogWriter.hpp"
#include "PopplerDocument.hpp"
#include "PreviewWindow.hpp"
#include "RegionExtractor.hpp"
#include "TextRecognizer.hpp"

#include <opencv2/core/version.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <variant>

#ifndef RENAMER_VERSION
#define RENAMER_VERSION "unknown"
#endif

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " [options]\n"
      << "\nRenames the PDF files of the input directory after the number\n"
      << "read from a fixed region of their first page.\n"
      << "\nOptions:\n"
      << "  -c, --config <path>     Configuration file (default: config.yaml)\n"
      << "  -v, --version           Show version information\n"
      << "  -h, --help              Show this help message\n"
      << "\nControls:\n"
      << "  type / Backspace        Edit the file name\n"
      << "  Enter                   Save under that name and go to the next "
         "file\n"
      << "  Tab                     Enter/leave region selection (drag with "
         "the mouse)\n"
      << "  Ctrl+O                  Show the configuration file path\n"
      << "  Esc                     Quit\n";
}

renamer::RecognizerConfig recognizerConfig(const renamer::Settings &settings) {
  renamer::RecognizerConfig config;
  config.language = settings.ocrLanguage;
  config.tessDataPath = settings.tessDataDir;
  config.threshold = settings.ocrThreshold;
  config.sourceResolution = settings.ocrDpi;
  return config;
}

int main(int argc, char *argv[]) {
  std::string configPath = "config.yaml";

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-v" || arg == "--version") {
      std::cout << "pdf_renamer " << RENAMER_VERSION << "\n"
                << "Tesseract version: "
                << renamer::TesseractRecognizer::getTesseractVersion() << "\n"
                << "OpenCV version: " << CV_VERSION << "\n";
      return 0;
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        configPath = argv[++i];
      } else {
        std::cerr << "Error: --config requires an argument\n";
        return 1;
      }
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  renamer::ConfigStore store(configPath);
  if (!store.exists()) {
    std::cerr << "Config file " << configPath
              << " not found, generating a new one" << std::endl;
    if (!store.generateDefault()) {
      std::cerr << "Warning: could not write " << configPath << std::endl;
    }
  }

  renamer::Settings settings;
  renamer::DocumentQueue queue;
  try {
    settings = store.load();
    renamer::ensureDirectories(settings);
    queue = renamer::DocumentQueue::fromDirectory(settings.inputDir);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  if (queue.empty()) {
    std::cout << "There are no PDF files in " << settings.inputDir.string()
              << "." << std::endl;
    return 0;
  }

  // A missing OCR engine is not fatal: names can still be typed by hand
  renamer::TesseractRecognizer recognizer(recognizerConfig(settings));
  if (!recognizer.initialize()) {
    std::cerr << "Warning: Tesseract is not available, the OCR feature will "
                 "report errors"
              << std::endl;
  }

  std::cout << "=== PDF Renamer ===\n"
            << "Config: " << configPath << "\n"
            << "Input: " << settings.inputDir.string() << " (" << queue.size()
            << " files)\n"
            << "Output: " << settings.outputDir.string() << "\n"
            << "OCR: " << recognizer.getConfig().language
            << (recognizer.isInitialized() ? "" : " (unavailable)") << "\n"
            << "Digits: "
            << (settings.digitFilter > 0 ? std::to_string(settings.digitFilter)
                                         : std::string("any"))
            << "\n"
            << "===================\n"
            << std::endl;

  renamer::RegionExtractor extractor(recognizer, settings.ocrDpi,
                                     settings.debugImageDir);
  renamer::PopplerDocumentProvider provider;
  renamer::LogWriter log(settings.logDir);
  renamer::PreviewWindow window("PDF Renamer");

  renamer::PipelineOptions options;
  options.outputDir = settings.outputDir;
  options.digitFilter = settings.digitFilter;

  renamer::BatchPipeline pipeline(queue, provider, extractor, store, log,
                                  window, options, settings.rect);

  try {
    window.open();
    while (!pipeline.finished()) {
      std::optional<renamer::PipelineEvent> event = window.poll();
      if (event) {
        pipeline.dispatch(*event);
      }
    }
  } catch (const cv::Exception &e) {
    std::cerr << "Error: display failed: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  if (std::holds_alternative<renamer::state::Done>(pipeline.state())) {
    window.waitForKey();
  }

  return 0;
}
