#include "PreviewWindow.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

namespace renamer {

namespace {

namespace Key {
constexpr int CTRL_O = 15;
constexpr int BACKSPACE = 8;
constexpr int TAB = 9;
constexpr int LINE_FEED = 10;
constexpr int ENTER = 13;
constexpr int ESC = 27;
constexpr int DEL = 127;
} // namespace Key

// GTK keysyms of the non-character keys that edit or submit the field
constexpr int kGtkBackSpace = 0xFF08;
constexpr int kGtkReturn = 0xFF0D;
constexpr int kGtkKeypadEnter = 0xFF8D;
constexpr int kGtkDelete = 0xFFFF;
// GTK reports the modifier state above bit 16
constexpr int kGtkControlMask = 0x4 << 16;

const cv::Scalar kBackground(240, 240, 240);
const cv::Scalar kBandColor(225, 225, 225);
const cv::Scalar kTextColor(20, 20, 20);
const cv::Scalar kRectColor(0, 0, 255);
const cv::Scalar kSelectionColor(255, 128, 0);
const cv::Scalar kFieldSelectedColor(255, 220, 170);
const cv::Scalar kWarningColor(0, 140, 220);
const cv::Scalar kErrorColor(0, 0, 200);

constexpr int kFont = cv::FONT_HERSHEY_SIMPLEX;

std::string singleLine(std::string text) {
  std::replace(text.begin(), text.end(), '\n', ' ');
  return text;
}

cv::Rect toPixels(const cv::Rect2d &rect, int yOffset) {
  return cv::Rect(static_cast<int>(std::lround(rect.x)),
                  static_cast<int>(std::lround(rect.y)) + yOffset,
                  static_cast<int>(std::lround(rect.width)),
                  static_cast<int>(std::lround(rect.height)));
}

} // anonymous namespace

PreviewWindow::PreviewWindow(std::string title, cv::Size previewArea)
    : m_title(std::move(title)),
      m_area(CoordinateTransform::effectiveArea(previewArea)) {}

PreviewWindow::~PreviewWindow() {
  if (m_opened) {
    cv::destroyWindow(m_title);
  }
}

void PreviewWindow::open() {
  cv::namedWindow(m_title, cv::WINDOW_AUTOSIZE);
  cv::setMouseCallback(m_title, &PreviewWindow::mouseCallback, this);
  m_opened = true;
  render();
}

std::optional<PipelineEvent> PreviewWindow::poll(int delayMs) {
  if (!m_opened) {
    return event::Quit{};
  }

  if (m_dirty) {
    render();
  }

  if (!m_layoutReported) {
    // Let HighGUI lay the window out before measuring it
    cv::waitKey(1);
    cv::Rect imageRect = cv::getWindowImageRect(m_title);
    cv::Size measured(imageRect.width,
                      imageRect.height - kHeaderHeight - kFooterHeight);
    m_area = CoordinateTransform::effectiveArea(measured);
    m_layoutReported = true;
    m_dirty = true;
    return event::LayoutReady{measured};
  }

  if (!m_pending.empty()) {
    PipelineEvent next = m_pending.front();
    m_pending.pop_front();
    return next;
  }

  int key = cv::waitKeyEx(delayMs);
  if (isClosed()) {
    return event::Quit{};
  }
  if (key >= 0) {
    std::optional<PipelineEvent> keyEvent = pressKey(key);
    if (keyEvent) {
      return keyEvent;
    }
  }

  if (!m_pending.empty()) {
    PipelineEvent next = m_pending.front();
    m_pending.pop_front();
    return next;
  }
  return std::nullopt;
}

void PreviewWindow::waitForKey() {
  if (!m_opened) {
    return;
  }
  render();
  while (!isClosed() && cv::waitKey(100) < 0) {
  }
}

int PreviewWindow::normalizeKey(int rawKey) {
  if (rawKey < 0) {
    return -1;
  }

  int key = rawKey & 0xFFFF;
  switch (key) {
  case kGtkBackSpace:
    return Key::BACKSPACE;
  case kGtkReturn:
  case kGtkKeypadEnter:
    return Key::ENTER;
  case kGtkDelete:
    return Key::DEL;
  default:
    break;
  }

  // Arrows, Home/End, function keys and every other special key
  if (key == 0 || key > 0xFF) {
    return -1;
  }
  if ((rawKey & kGtkControlMask) && std::isalpha(key)) {
    return std::tolower(key) & 0x1F;
  }
  return key;
}

std::optional<PipelineEvent> PreviewWindow::pressKey(int rawKey) {
  int key = normalizeKey(rawKey);
  switch (key) {
  case Key::ESC:
    return event::Quit{};
  case Key::TAB:
    return event::ToggleCalibration{};
  case Key::CTRL_O:
    return event::ShowConfig{};
  case Key::ENTER:
  case Key::LINE_FEED:
    m_selectAll = false;
    return event::Commit{m_field};
  case Key::BACKSPACE:
  case Key::DEL:
    if (m_selectAll) {
      m_field.clear();
      m_selectAll = false;
    } else if (!m_field.empty()) {
      m_field.pop_back();
    }
    m_dirty = true;
    return std::nullopt;
  default:
    break;
  }

  if (key >= 32 && key <= 126) {
    if (m_selectAll) {
      m_field.clear();
      m_selectAll = false;
    }
    m_field.push_back(static_cast<char>(key));
    m_dirty = true;
  }
  return std::nullopt;
}

void PreviewWindow::mouseCallback(int event, int x, int y, int flags,
                                  void *userdata) {
  auto *self = static_cast<PreviewWindow *>(userdata);
  if (!self->m_calibrating) {
    return;
  }

  cv::Point2d point(x, y - kHeaderHeight);
  if (event == cv::EVENT_LBUTTONDOWN) {
    self->m_pending.push_back(event::DragBegin{point});
  } else if (event == cv::EVENT_MOUSEMOVE &&
             (flags & cv::EVENT_FLAG_LBUTTON)) {
    self->m_pending.push_back(event::DragMove{point});
  } else if (event == cv::EVENT_LBUTTONUP) {
    self->m_pending.push_back(event::DragEnd{point});
  }
}

void PreviewWindow::showStatus(const std::string &text) {
  m_status = text;
  m_dirty = true;
}

void PreviewWindow::showPreview(const cv::Mat &pageImage,
                                const CoordinateTransform &transform,
                                const DocRect &extractionRect) {
  m_pageImage = pageImage;
  m_pageOrigin =
      cv::Point(static_cast<int>(std::lround(transform.previewOffset().x)),
                static_cast<int>(std::lround(transform.previewOffset().y)));
  m_extractionRect = transform.toPreviewSpace(extractionRect);
  m_selection.reset();
  m_dirty = true;
}

void PreviewWindow::showSelection(const cv::Rect2d &previewRect) {
  m_selection = previewRect;
  m_dirty = true;
}

void PreviewWindow::setField(const std::string &text, bool selectAll) {
  m_field = text;
  m_selectAll = selectAll && !text.empty();
  m_dirty = true;
}

void PreviewWindow::setCalibrationMode(bool active) {
  m_calibrating = active;
  if (!active) {
    m_selection.reset();
  }
  m_dirty = true;
}

void PreviewWindow::info(const std::string &message) {
  std::cout << message << std::endl;
  setNotice(NoticeLevel::Info, message);
}

void PreviewWindow::warn(const std::string &message) {
  std::cerr << "Warning: " << message << std::endl;
  setNotice(NoticeLevel::Warning, message);
}

void PreviewWindow::error(const std::string &message) {
  std::cerr << "Error: " << message << std::endl;
  setNotice(NoticeLevel::Error, message);
}

bool PreviewWindow::confirm(const std::string &question) {
  std::cout << question << " [y/N]" << std::endl;
  if (!m_opened) {
    return false;
  }

  m_prompt = question + " [y/n]";
  render();

  bool answer = false;
  while (!isClosed()) {
    int key = normalizeKey(cv::waitKeyEx(100));
    if (key < 0) {
      continue;
    }
    if (key == 'y' || key == 'Y') {
      answer = true;
      break;
    }
    if (key == 'n' || key == 'N' || key == Key::ESC) {
      break;
    }
  }

  m_prompt.clear();
  m_dirty = true;
  return answer;
}

void PreviewWindow::setNotice(NoticeLevel level, const std::string &message) {
  m_noticeLevel = level;
  m_notice = singleLine(message);
  m_dirty = true;
}

bool PreviewWindow::isClosed() const {
  return cv::getWindowProperty(m_title, cv::WND_PROP_VISIBLE) < 1;
}

void PreviewWindow::render() {
  if (!m_opened) {
    return;
  }

  const int width = m_area.width;
  const int height = kHeaderHeight + m_area.height + kFooterHeight;
  cv::Mat canvas(height, width, CV_8UC3, kBackground);

  // Page
  if (!m_pageImage.empty()) {
    cv::Rect target(m_pageOrigin.x, m_pageOrigin.y + kHeaderHeight,
                    m_pageImage.cols, m_pageImage.rows);
    cv::Rect visible = target & cv::Rect(0, kHeaderHeight, width, m_area.height);
    if (!visible.empty()) {
      cv::Rect source(visible.x - target.x, visible.y - target.y,
                      visible.width, visible.height);
      m_pageImage(source).copyTo(canvas(visible));
    }
    if (!m_calibrating || !m_selection) {
      cv::rectangle(canvas, toPixels(m_extractionRect, kHeaderHeight),
                    kRectColor, 2);
    }
  }
  if (m_selection) {
    cv::rectangle(canvas, toPixels(*m_selection, kHeaderHeight),
                  kSelectionColor, 2);
  }

  // Status band
  cv::rectangle(canvas, cv::Rect(0, 0, width, kHeaderHeight), kBandColor,
                cv::FILLED);
  std::string status = m_calibrating ? "[CALIBRATION] " + m_status : m_status;
  cv::putText(canvas, status, cv::Point(10, 24), kFont, 0.6, kTextColor, 1,
              cv::LINE_AA);

  // Field band
  const int footerTop = kHeaderHeight + m_area.height;
  cv::rectangle(canvas, cv::Rect(0, footerTop, width, kFooterHeight),
                kBandColor, cv::FILLED);
  cv::putText(canvas, "New file name (without extension):",
              cv::Point(10, footerTop + 18), kFont, 0.45, kTextColor, 1,
              cv::LINE_AA);

  cv::Rect fieldBox(10, footerTop + 24, width - 20, 28);
  cv::rectangle(canvas, fieldBox,
                m_selectAll ? kFieldSelectedColor : cv::Scalar(255, 255, 255),
                cv::FILLED);
  cv::rectangle(canvas, fieldBox, kTextColor, 1);
  cv::putText(canvas, m_selectAll ? m_field : m_field + "_",
              cv::Point(fieldBox.x + 6, fieldBox.y + 20), kFont, 0.6,
              kTextColor, 1, cv::LINE_AA);

  std::string noticeText = m_prompt.empty() ? m_notice : m_prompt;
  cv::Scalar noticeColor = kTextColor;
  if (m_prompt.empty() && m_noticeLevel == NoticeLevel::Warning) {
    noticeColor = kWarningColor;
  } else if (!m_prompt.empty() || m_noticeLevel == NoticeLevel::Error) {
    noticeColor = kErrorColor;
  }
  cv::putText(canvas, noticeText, cv::Point(10, footerTop + 74), kFont, 0.45,
              noticeColor, 1, cv::LINE_AA);

  cv::imshow(m_title, canvas);
  m_dirty = false;
}

} // namespace renamer
