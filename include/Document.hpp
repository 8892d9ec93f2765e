#ifndef RENAMER_DOCUMENT_HPP
#define RENAMER_DOCUMENT_HPP

#include "CoordinateTransform.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

namespace renamer {

/**
 * @brief Raised when a document cannot be opened or rasterized
 */
class DocumentError : public std::runtime_error {
public:
  explicit DocumentError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief An open paged document
 *
 * Only the first page is ever addressed. The handle keeps the underlying
 * file open until it is destroyed.
 */
class Document {
public:
  virtual ~Document() = default;

  /**
   * @brief Number of pages in the document
   */
  virtual int pageCount() const = 0;

  /**
   * @brief Size of the first page in document units (points)
   */
  virtual cv::Size2d pageSize() const = 0;

  /**
   * @brief Rasterize the whole first page
   * @param scale Pixels per document unit
   * @return BGR image
   * @throws DocumentError on failure
   */
  virtual cv::Mat renderPage(double scale) = 0;

  /**
   * @brief Rasterize a clip of the first page
   * @param rect Clip in document space
   * @param dpi Resolution in dots per inch
   * @return BGR image of the clip
   * @throws DocumentError on failure
   */
  virtual cv::Mat renderRegion(const DocRect &rect, double dpi) = 0;
};

/**
 * @brief Opens documents by path
 */
class DocumentProvider {
public:
  virtual ~DocumentProvider() = default;

  /**
   * @brief Open a document
   * @throws DocumentError if the file is missing, unreadable, locked or has
   * no pages
   */
  virtual std::unique_ptr<Document>
  open(const std::filesystem::path &path) = 0;
};

} // namespace renamer

#endif // RENAMER_DOCUMENT_HPP
