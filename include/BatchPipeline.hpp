#ifndef RENAMER_BATCH_PIPELINE_HPP
#define RENAMER_BATCH_PIPELINE_HPP

#include "ConfigStore.hpp"
#include "CoordinateTransform.hpp"
#include "Document.hpp"
#include "DocumentQueue.hpp"
#include "LogWriter.hpp"
#include "RegionExtractor.hpp"
#include "UserSurface.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace renamer {

namespace state {

/// Waiting for the preview area to get a real size
struct Idle {};

/// Document `index` is shown and waits for a commit
struct Displaying {
  size_t index = 0;
};

/// The user is drawing a new extraction rectangle over document `index`
struct Calibrating {
  size_t index = 0;
  std::optional<cv::Point2d> anchor; ///< Drag start in preview space
};

/// Every document has been handled
struct Done {};

} // namespace state

using PipelineState = std::variant<state::Idle, state::Displaying,
                                   state::Calibrating, state::Done>;

namespace event {

struct LayoutReady {
  cv::Size previewArea;
};
struct Commit {
  std::string fieldText;
};
struct ToggleCalibration {};
struct DragBegin {
  cv::Point2d point;
};
struct DragMove {
  cv::Point2d point;
};
struct DragEnd {
  cv::Point2d point;
};
struct Quit {};
/// Report where the configuration file lives (any state)
struct ShowConfig {};

} // namespace event

using PipelineEvent =
    std::variant<event::LayoutReady, event::Commit, event::ToggleCalibration,
                 event::DragBegin, event::DragMove, event::DragEnd,
                 event::Quit, event::ShowConfig>;

/**
 * @brief The extraction rectangle in effect, replaced as a whole on each
 * calibration
 */
struct ActiveRect {
  DocRect rect;
  unsigned version = 0;
};

/**
 * @brief Working state of the current document
 */
struct CurrentDocumentState {
  std::string name;            ///< File name
  std::filesystem::path path;  ///< Source path
  std::string rawText;         ///< Recognized text
  std::string candidate;       ///< Digits extracted from it
  bool isValid = false;        ///< Candidate passes the digit filter
  std::string field;           ///< Text the filename field was seeded with
};

struct PipelineOptions {
  std::filesystem::path outputDir;
  int digitFilter = 0;
};

/**
 * @brief Sequential batch state machine
 *
 * Documents are processed in queue order. For each one the first page is
 * previewed, the identifier is extracted from the active rectangle and the
 * user commits (copy + log), or recalibrates the rectangle. A document that
 * cannot be opened or rendered is reported and skipped.
 *
 * All input arrives through dispatch(); the only resting states are those
 * of PipelineState.
 */
class BatchPipeline {
public:
  /**
   * Collaborators are borrowed and must outlive the pipeline.
   */
  BatchPipeline(DocumentQueue queue, DocumentProvider &provider,
                RegionExtractor &extractor, ConfigStore &store,
                LogWriter &log, UserSurface &surface, PipelineOptions options,
                const DocRect &initialRect);
  ~BatchPipeline();

  BatchPipeline(const BatchPipeline &) = delete;
  BatchPipeline &operator=(const BatchPipeline &) = delete;

  /**
   * @brief Apply one event (the single transition function)
   */
  void dispatch(const PipelineEvent &event);

  const PipelineState &state() const { return m_state; }

  /// True once Done is reached or Quit was received
  bool finished() const;

  /// Index of the current document, queue size when done
  size_t cursor() const;

  const ActiveRect &activeRect() const { return m_rect; }
  const std::optional<CurrentDocumentState> &current() const {
    return m_current;
  }
  const DocumentQueue &queue() const { return m_queue; }

  /// Status text shown for a document
  std::string statusText(size_t index) const;

private:
  // Transitions. The template catches every pair that has no effect.
  PipelineState on(const state::Idle &s, const event::LayoutReady &e);
  PipelineState on(const state::Displaying &s, const event::LayoutReady &e);
  PipelineState on(const state::Displaying &s, const event::Commit &e);
  PipelineState on(const state::Displaying &s,
                   const event::ToggleCalibration &e);
  PipelineState on(const state::Calibrating &s, const event::LayoutReady &e);
  PipelineState on(const state::Calibrating &s, const event::Commit &e);
  PipelineState on(const state::Calibrating &s,
                   const event::ToggleCalibration &e);
  PipelineState on(const state::Calibrating &s, const event::DragBegin &e);
  PipelineState on(const state::Calibrating &s, const event::DragMove &e);
  PipelineState on(const state::Calibrating &s, const event::DragEnd &e);

  template <typename State, typename Event>
  PipelineState on(const State &s, const Event &) {
    return s;
  }

  /// Make document `index` current, skipping documents that fail
  PipelineState enterDocument(size_t index);
  PipelineState exitCalibration(size_t index);
  PipelineState finish();

  void showConfigLocation();
  void skipDocument(size_t index, const std::string &reason);
  void openDocument(size_t index);
  void closeDocument();
  void renderPreview();
  void redrawPreview();
  ExtractionResult runExtraction();

  DocumentQueue m_queue;
  DocumentProvider &m_provider;
  RegionExtractor &m_extractor;
  ConfigStore &m_store;
  LogWriter &m_log;
  UserSurface &m_surface;
  PipelineOptions m_options;

  PipelineState m_state;
  ActiveRect m_rect;
  bool m_quit = false;

  cv::Size m_previewArea;
  std::unique_ptr<Document> m_document;
  cv::Size2d m_pageSize;
  cv::Mat m_pageImage;
  CoordinateTransform m_transform;
  std::optional<CurrentDocumentState> m_current;
};

} // namespace renamer

#endif // RENAMER_BATCH_PIPELINE_HPP
