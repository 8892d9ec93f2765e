#ifndef RENAMER_PREVIEW_WINDOW_HPP
#define RENAMER_PREVIEW_WINDOW_HPP

#include "BatchPipeline.hpp"
#include "UserSurface.hpp"

#include <opencv2/core.hpp>

#include <deque>
#include <optional>
#include <string>

namespace renamer {

/**
 * @brief OpenCV HighGUI front end of the pipeline
 *
 * One window with three bands: the status line on top, the page preview in
 * the middle and the filename field with the last notice at the bottom.
 *
 * Keys: printable characters edit the field, Backspace deletes, Enter
 * commits, Tab toggles calibration, Ctrl+O shows the configuration file,
 * Esc quits. Other special keys (arrows, Home/End, function keys) are
 * ignored. While calibrating, a left drag over the preview draws the new
 * rectangle.
 */
class PreviewWindow : public UserSurface {
public:
  static constexpr int kHeaderHeight = 36;
  static constexpr int kFooterHeight = 84;

  /**
   * @param title Window title (also the HighGUI window name)
   * @param previewArea Size of the middle band in pixels
   */
  explicit PreviewWindow(std::string title,
                         cv::Size previewArea = cv::Size(800, 1000));
  ~PreviewWindow() override;

  PreviewWindow(const PreviewWindow &) = delete;
  PreviewWindow &operator=(const PreviewWindow &) = delete;

  /**
   * @brief Create the window and install the mouse callback
   */
  void open();

  /**
   * @brief Pump HighGUI once and return the next pipeline event, if any
   *
   * The first call after the window has been shown yields LayoutReady with
   * the measured preview area.
   *
   * @param delayMs How long to wait for a key
   */
  std::optional<PipelineEvent> poll(int delayMs = 30);

  /**
   * @brief Keep the last frame on screen until a key is pressed
   */
  void waitForKey();

  /**
   * @brief Apply one key code as returned by cv::waitKeyEx
   * @return The pipeline event the key stands for, if any
   */
  std::optional<PipelineEvent> pressKey(int rawKey);

  /**
   * @brief Reduce a cv::waitKeyEx code to an ASCII code
   *
   * Backend keysyms for Backspace, Enter and Delete map to their ASCII
   * codes and Ctrl+letter to its control code. Every other key outside
   * Latin-1 gives -1.
   */
  static int normalizeKey(int rawKey);

  const std::string &fieldText() const { return m_field; }
  bool fieldSelected() const { return m_selectAll; }

  // UserSurface
  void showStatus(const std::string &text) override;
  void showPreview(const cv::Mat &pageImage,
                   const CoordinateTransform &transform,
                   const DocRect &extractionRect) override;
  void showSelection(const cv::Rect2d &previewRect) override;
  void setField(const std::string &text, bool selectAll) override;
  void setCalibrationMode(bool active) override;
  void info(const std::string &message) override;
  void warn(const std::string &message) override;
  void error(const std::string &message) override;
  bool confirm(const std::string &question) override;

private:
  enum class NoticeLevel { Info, Warning, Error };

  static void mouseCallback(int event, int x, int y, int flags,
                            void *userdata);

  void setNotice(NoticeLevel level, const std::string &message);
  void render();
  bool isClosed() const;

  std::string m_title;
  cv::Size m_area;
  bool m_opened = false;
  bool m_layoutReported = false;
  bool m_dirty = true;

  std::string m_status;
  std::string m_field;
  bool m_selectAll = false;
  bool m_calibrating = false;

  NoticeLevel m_noticeLevel = NoticeLevel::Info;
  std::string m_notice;
  std::string m_prompt;

  cv::Mat m_pageImage;
  cv::Point m_pageOrigin;
  cv::Rect2d m_extractionRect;
  std::optional<cv::Rect2d> m_selection;

  std::deque<PipelineEvent> m_pending;
};

} // namespace renamer

#endif // RENAMER_PREVIEW_WINDOW_HPP
