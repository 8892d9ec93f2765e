#include "CoordinateTransform.hpp"

#include <algorithm>
#include <stdexcept>

namespace renamer {

CoordinateTransform::CoordinateTransform(double scaleFactor,
                                         const cv::Point2d &previewOffset)
    : m_scale(scaleFactor), m_offset(previewOffset) {
  if (!(scaleFactor > 0)) {
    throw std::invalid_argument("Scale factor must be positive");
  }
}

cv::Size CoordinateTransform::effectiveArea(const cv::Size &previewArea) {
  if (previewArea.width < kMinPreviewExtent ||
      previewArea.height < kMinPreviewExtent) {
    return cv::Size(kFallbackPreviewWidth, kFallbackPreviewHeight);
  }
  return previewArea;
}

double CoordinateTransform::fitScale(const cv::Size &previewArea,
                                     const cv::Size2d &pageSize) {
  if (!(pageSize.width > 0) || !(pageSize.height > 0)) {
    throw std::invalid_argument("Page size must be positive");
  }

  cv::Size area = effectiveArea(previewArea);
  double zoomX = area.width / pageSize.width;
  double zoomY = area.height / pageSize.height;
  return std::min(zoomX, zoomY) * kMarginFactor;
}

CoordinateTransform CoordinateTransform::fit(const cv::Size &previewArea,
                                             const cv::Size2d &pageSize,
                                             const cv::Size &renderedSize) {
  double scale = fitScale(previewArea, pageSize);
  cv::Size area = effectiveArea(previewArea);

  double imageWidth = pageSize.width * scale;
  double imageHeight = pageSize.height * scale;
  if (renderedSize.width > 0 && renderedSize.height > 0) {
    imageWidth = renderedSize.width;
    imageHeight = renderedSize.height;
  }

  cv::Point2d offset((area.width - imageWidth) / 2.0,
                     (area.height - imageHeight) / 2.0);
  return CoordinateTransform(scale, offset);
}

cv::Point2d
CoordinateTransform::toDocumentSpace(const cv::Point2d &previewPoint) const {
  return (previewPoint - m_offset) / m_scale;
}

cv::Point2d
CoordinateTransform::toPreviewSpace(const cv::Point2d &documentPoint) const {
  return documentPoint * m_scale + m_offset;
}

cv::Rect2d CoordinateTransform::toPreviewSpace(const DocRect &rect) const {
  cv::Point2d topLeft = toPreviewSpace(cv::Point2d(rect.x0, rect.y0));
  cv::Point2d bottomRight = toPreviewSpace(cv::Point2d(rect.x1, rect.y1));
  return cv::Rect2d(topLeft, bottomRight);
}

DocRect CoordinateTransform::dragToDocumentRect(
    const cv::Point2d &start, const cv::Point2d &end,
    const cv::Size2d &pageSize) const {
  cv::Point2d a = toDocumentSpace(start);
  cv::Point2d b = toDocumentSpace(end);

  DocRect rect;
  rect.x0 = std::clamp(std::min(a.x, b.x), 0.0, pageSize.width);
  rect.y0 = std::clamp(std::min(a.y, b.y), 0.0, pageSize.height);
  rect.x1 = std::clamp(std::max(a.x, b.x), 0.0, pageSize.width);
  rect.y1 = std::clamp(std::max(a.y, b.y), 0.0, pageSize.height);
  return rect;
}

} // namespace renamer
