#ifndef RENAMER_POPPLER_DOCUMENT_HPP
#define RENAMER_POPPLER_DOCUMENT_HPP

#include "Document.hpp"

#include <memory>
#include <string>

namespace poppler {
class document;
class page;
class image;
} // namespace poppler

namespace renamer {

/**
 * @brief PDF document backed by the Poppler C++ wrapper
 *
 * Page geometry is taken from the crop box of the first page. Rendering uses
 * antialiasing for both graphics and text.
 */
class PopplerDocument : public Document {
public:
  /**
   * @brief Load a PDF file
   * @param pdfPath Path to the PDF file
   * @throws DocumentError if loading fails, the file is password protected
   * or it has no pages
   */
  explicit PopplerDocument(const std::string &pdfPath);
  ~PopplerDocument() override;

  PopplerDocument(const PopplerDocument &) = delete;
  PopplerDocument &operator=(const PopplerDocument &) = delete;

  int pageCount() const override;
  cv::Size2d pageSize() const override;
  cv::Mat renderPage(double scale) override;
  cv::Mat renderRegion(const DocRect &rect, double dpi) override;

  /**
   * @brief Convert a Poppler image to an OpenCV BGR Mat
   * @throws DocumentError for unsupported pixel formats
   */
  static cv::Mat toMat(const poppler::image &popplerImage);

private:
  std::string m_path;
  std::unique_ptr<poppler::document> m_document;
  std::unique_ptr<poppler::page> m_firstPage;
};

/**
 * @brief Opens PDF files with Poppler
 */
class PopplerDocumentProvider : public DocumentProvider {
public:
  std::unique_ptr<Document> open(const std::filesystem::path &path) override;
};

} // namespace renamer

#endif // RENAMER_POPPLER_DOCUMENT_HPP
