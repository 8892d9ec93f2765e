#include "PopplerDocument.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

namespace renamer {

namespace {

constexpr double kPointsPerInch = 72.0;

void configureRenderer(poppler::page_renderer &renderer) {
  renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
  renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
  renderer.set_image_format(poppler::image::format_argb32);
}

} // anonymous namespace

PopplerDocument::PopplerDocument(const std::string &pdfPath)
    : m_path(pdfPath) {
  m_document.reset(poppler::document::load_from_file(pdfPath));

  if (!m_document) {
    throw DocumentError("Failed to load PDF file: " + pdfPath);
  }

  if (m_document->is_locked()) {
    throw DocumentError("PDF file is password protected: " + pdfPath);
  }

  if (m_document->pages() < 1) {
    throw DocumentError("PDF has no pages: " + pdfPath);
  }

  m_firstPage.reset(m_document->create_page(0));
  if (!m_firstPage) {
    throw DocumentError("Failed to create first page: " + pdfPath);
  }

  std::cerr << "DEBUG: Opened " << pdfPath << " (" << m_document->pages()
            << " pages)" << std::endl;
}

PopplerDocument::~PopplerDocument() = default;

int PopplerDocument::pageCount() const { return m_document->pages(); }

cv::Size2d PopplerDocument::pageSize() const {
  poppler::rectf pageRect = m_firstPage->page_rect(poppler::crop_box);
  return cv::Size2d(pageRect.width(), pageRect.height());
}

cv::Mat PopplerDocument::renderPage(double scale) {
  if (!(scale > 0)) {
    throw DocumentError("Invalid render scale for " + m_path);
  }

  poppler::page_renderer renderer;
  configureRenderer(renderer);
  double dpi = kPointsPerInch * scale;

  poppler::image popplerImage =
      renderer.render_page(m_firstPage.get(), dpi, dpi);
  if (!popplerImage.is_valid()) {
    throw DocumentError("Failed to render first page of " + m_path);
  }

  return toMat(popplerImage);
}

cv::Mat PopplerDocument::renderRegion(const DocRect &rect, double dpi) {
  if (!rect.isValid() || !(dpi > 0)) {
    throw DocumentError("Invalid clip requested for " + m_path);
  }

  // Clip coordinates are given to Poppler in pixels at the target resolution
  double pixelsPerPoint = dpi / kPointsPerInch;
  int x = static_cast<int>(std::floor(rect.x0 * pixelsPerPoint));
  int y = static_cast<int>(std::floor(rect.y0 * pixelsPerPoint));
  int w = std::max(1, static_cast<int>(std::ceil(rect.width() *
                                                  pixelsPerPoint)));
  int h = std::max(1, static_cast<int>(std::ceil(rect.height() *
                                                  pixelsPerPoint)));

  poppler::page_renderer renderer;
  configureRenderer(renderer);
  poppler::image popplerImage =
      renderer.render_page(m_firstPage.get(), dpi, dpi, x, y, w, h);
  if (!popplerImage.is_valid()) {
    throw DocumentError("Failed to render clip of " + m_path);
  }

  return toMat(popplerImage);
}

cv::Mat PopplerDocument::toMat(const poppler::image &popplerImage) {
  int width = popplerImage.width();
  int height = popplerImage.height();

  cv::Mat mat;

  switch (popplerImage.format()) {
  case poppler::image::format_argb32: {
    // ARGB32 is stored as BGRA in memory
    mat = cv::Mat(height, width, CV_8UC4,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_BGRA2BGR);
    break;
  }
  case poppler::image::format_rgb24: {
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_RGB2BGR);
    break;
  }
  case poppler::image::format_bgr24: {
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    break;
  }
  case poppler::image::format_gray8: {
    mat = cv::Mat(height, width, CV_8UC1,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_GRAY2BGR);
    break;
  }
  default:
    throw DocumentError("Unsupported image format");
  }

  return mat;
}

std::unique_ptr<Document>
PopplerDocumentProvider::open(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw DocumentError("File not found: " + path.string());
  }
  return std::make_unique<PopplerDocument>(path.string());
}

} // namespace renamer
