#ifndef RENAMER_COORDINATE_TRANSFORM_HPP
#define RENAMER_COORDINATE_TRANSFORM_HPP

#include <opencv2/core.hpp>

namespace renamer {

/**
 * @brief Rectangle in document space (PDF points, origin at the top-left of
 * the first page)
 */
struct DocRect {
  double x0 = 0; ///< Left edge
  double y0 = 0; ///< Top edge
  double x1 = 0; ///< Right edge
  double y1 = 0; ///< Bottom edge

  double width() const { return x1 - x0; }
  double height() const { return y1 - y0; }

  /// True when the rectangle has a positive area
  bool isValid() const { return x0 < x1 && y0 < y1; }

  bool operator==(const DocRect &other) const {
    return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 &&
           y1 == other.y1;
  }
  bool operator!=(const DocRect &other) const { return !(*this == other); }
};

/**
 * @brief Maps between preview space (pixels of the scaled page image shown
 * to the user) and document space
 *
 * A transform is built once per displayed page. The page is scaled so it
 * fits the preview area on both axes with a 5% margin and is centered in it:
 * @code
 * auto t = renamer::CoordinateTransform::fit(previewArea, pageSize);
 * cv::Point2d doc = t.toDocumentSpace(cv::Point2d(mouseX, mouseY));
 * @endcode
 */
class CoordinateTransform {
public:
  /// Fraction of the preview area the page is allowed to occupy
  static constexpr double kMarginFactor = 0.95;
  /// Below this size (either axis) a preview area is considered not laid out
  static constexpr int kMinPreviewExtent = 50;
  /// Substituted for a degenerate preview area
  static constexpr int kFallbackPreviewWidth = 800;
  static constexpr int kFallbackPreviewHeight = 1000;

  /**
   * @brief Identity transform (scale 1, no offset)
   */
  CoordinateTransform() = default;

  /**
   * @brief Constructor with explicit parameters
   * @param scaleFactor Preview pixels per document unit, must be positive
   * @param previewOffset Position of the page origin in preview space
   */
  CoordinateTransform(double scaleFactor, const cv::Point2d &previewOffset);

  /**
   * @brief Build the transform that fits and centers a page in a preview area
   *
   * If the rendered image size is known it is used for centering, otherwise
   * the exact scaled page size is.
   *
   * @param previewArea Reported size of the preview area (may be degenerate)
   * @param pageSize First-page size in document units
   * @param renderedSize Size of the rasterized page image (optional)
   * @throws std::invalid_argument if the page size is not positive
   */
  static CoordinateTransform fit(const cv::Size &previewArea,
                                 const cv::Size2d &pageSize,
                                 const cv::Size &renderedSize = cv::Size());

  /**
   * @brief Scale factor that fits a page inside a preview area
   * @return min(previewW / pageW, previewH / pageH) * 0.95
   * @throws std::invalid_argument if the page size is not positive
   */
  static double fitScale(const cv::Size &previewArea,
                         const cv::Size2d &pageSize);

  /**
   * @brief Replace a degenerate preview area by the fallback size
   */
  static cv::Size effectiveArea(const cv::Size &previewArea);

  cv::Point2d toDocumentSpace(const cv::Point2d &previewPoint) const;
  cv::Point2d toPreviewSpace(const cv::Point2d &documentPoint) const;
  cv::Rect2d toPreviewSpace(const DocRect &rect) const;

  /**
   * @brief Convert a drag gesture into a normalized, clamped document rect
   *
   * Both endpoints are mapped to document space, min/max are taken per axis
   * and the result is clamped to [0, pageWidth] x [0, pageHeight]. The drag
   * direction does not matter.
   *
   * @param start Drag anchor in preview space
   * @param end Release point in preview space
   * @param pageSize Page size in document units
   */
  DocRect dragToDocumentRect(const cv::Point2d &start, const cv::Point2d &end,
                             const cv::Size2d &pageSize) const;

  double scaleFactor() const { return m_scale; }
  const cv::Point2d &previewOffset() const { return m_offset; }

private:
  double m_scale = 1.0;
  cv::Point2d m_offset;
};

} // namespace renamer

#endif // RENAMER_COORDINATE_TRANSFORM_HPP
