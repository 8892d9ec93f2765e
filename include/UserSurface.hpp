#ifndef RENAMER_USER_SURFACE_HPP
#define RENAMER_USER_SURFACE_HPP

#include "CoordinateTransform.hpp"

#include <opencv2/core.hpp>

#include <string>

namespace renamer {

/**
 * @brief What the batch pipeline needs from the user interface
 *
 * Every call is made on the control thread and may block (confirm() waits
 * for the user's answer).
 */
class UserSurface {
public:
  virtual ~UserSurface() = default;

  /// Status line (current document, position, total or a mode hint)
  virtual void showStatus(const std::string &text) = 0;

  /**
   * @brief Show a rendered page with the extraction rectangle outlined
   * @param pageImage Rasterized first page
   * @param transform Places the image and the rectangle in the preview area
   * @param extractionRect Active rectangle in document space
   */
  virtual void showPreview(const cv::Mat &pageImage,
                           const CoordinateTransform &transform,
                           const DocRect &extractionRect) = 0;

  /// Rubber band of a drag in progress, in preview space
  virtual void showSelection(const cv::Rect2d &previewRect) = 0;

  /**
   * @brief Replace the filename field
   * @param selectAll Select the text so the next keystroke overwrites it
   */
  virtual void setField(const std::string &text, bool selectAll) = 0;

  virtual void setCalibrationMode(bool active) = 0;

  virtual void info(const std::string &message) = 0;
  virtual void warn(const std::string &message) = 0;
  virtual void error(const std::string &message) = 0;

  /// Yes/no question, true for yes
  virtual bool confirm(const std::string &question) = 0;
};

} // namespace renamer

#endif // RENAMER_USER_SURFACE_HPP
