#include "BatchPipeline.hpp"

#include <iostream>
#include <sstream>
#include <system_error>

namespace renamer {

namespace {

// ASCII whitespace plus U+00A0 and the ideographic space U+3000 (UTF-8)
const char *const kWideSpaces[] = {"\xC2\xA0", "\xE3\x80\x80"};

bool isAsciiSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' ||
         c == '\r';
}

std::string trim(const std::string &text) {
  size_t begin = 0;
  size_t end = text.size();

  bool stripped = true;
  while (stripped && begin < end) {
    stripped = false;
    if (isAsciiSpace(text[begin])) {
      ++begin;
      stripped = true;
      continue;
    }
    for (const char *space : kWideSpaces) {
      size_t length = std::char_traits<char>::length(space);
      if (end - begin >= length && text.compare(begin, length, space) == 0) {
        begin += length;
        stripped = true;
        break;
      }
    }
  }

  stripped = true;
  while (stripped && begin < end) {
    stripped = false;
    if (isAsciiSpace(text[end - 1])) {
      --end;
      stripped = true;
      continue;
    }
    for (const char *space : kWideSpaces) {
      size_t length = std::char_traits<char>::length(space);
      if (end - begin >= length &&
          text.compare(end - length, length, space) == 0) {
        end -= length;
        stripped = true;
        break;
      }
    }
  }

  return text.substr(begin, end - begin);
}

bool isCommittable(const std::string &name) {
  if (name.empty() || name.rfind(kInvalidMarker, 0) == 0) {
    return false;
  }
  // The name must stay inside the output directory
  return name.find_first_of("/\\") == std::string::npos && name != "." &&
         name != "..";
}

} // anonymous namespace

BatchPipeline::BatchPipeline(DocumentQueue queue, DocumentProvider &provider,
                             RegionExtractor &extractor, ConfigStore &store,
                             LogWriter &log, UserSurface &surface,
                             PipelineOptions options,
                             const DocRect &initialRect)
    : m_queue(std::move(queue)), m_provider(provider), m_extractor(extractor),
      m_store(store), m_log(log), m_surface(surface),
      m_options(std::move(options)), m_state(state::Idle{}),
      m_rect{initialRect, 0} {}

BatchPipeline::~BatchPipeline() { closeDocument(); }

void BatchPipeline::dispatch(const PipelineEvent &event) {
  if (m_quit) {
    return;
  }

  if (std::holds_alternative<event::Quit>(event)) {
    closeDocument();
    m_quit = true;
    return;
  }
  if (std::holds_alternative<event::ShowConfig>(event)) {
    showConfigLocation();
    return;
  }

  m_state = std::visit(
      [this](const auto &s, const auto &e) -> PipelineState {
        return on(s, e);
      },
      m_state, event);
}

bool BatchPipeline::finished() const {
  return m_quit || std::holds_alternative<state::Done>(m_state);
}

size_t BatchPipeline::cursor() const {
  if (const auto *displaying = std::get_if<state::Displaying>(&m_state)) {
    return displaying->index;
  }
  if (const auto *calibrating = std::get_if<state::Calibrating>(&m_state)) {
    return calibrating->index;
  }
  if (std::holds_alternative<state::Done>(m_state)) {
    return m_queue.size();
  }
  return 0;
}

std::string BatchPipeline::statusText(size_t index) const {
  std::ostringstream status;
  status << "processing: " << m_queue.at(index).filename().string() << " ("
         << (index + 1) << "/" << m_queue.size() << ")";
  return status.str();
}

// --- Idle -------------------------------------------------------------------

PipelineState BatchPipeline::on(const state::Idle &,
                                const event::LayoutReady &e) {
  m_previewArea = e.previewArea;
  return enterDocument(0);
}

// --- Displaying -------------------------------------------------------------

PipelineState BatchPipeline::on(const state::Displaying &s,
                                const event::LayoutReady &e) {
  m_previewArea = e.previewArea;
  try {
    openDocument(s.index);
    renderPreview();
  } catch (const std::exception &ex) {
    skipDocument(s.index, ex.what());
    return enterDocument(s.index + 1);
  }
  return s;
}

PipelineState BatchPipeline::on(const state::Displaying &s,
                                const event::Commit &e) {
  const std::string name = trim(e.fieldText);
  if (!isCommittable(name)) {
    m_surface.warn("Please enter a valid file name.");
    return s;
  }

  const std::filesystem::path source = m_queue.at(s.index);
  const std::filesystem::path target =
      m_options.outputDir / (name + source.extension().string());

  std::error_code ec;
  const bool targetExists = std::filesystem::exists(target, ec);
  if (ec) {
    m_surface.error("An error occurred while saving the file:\n" +
                    target.filename().string() + ": " + ec.message());
    return s;
  }
  if (targetExists &&
      !m_surface.confirm(target.filename().string() +
                         " already exists. Overwrite it?")) {
    return s;
  }

  // The copy must not race an open handle on platforms that lock files
  closeDocument();

  try {
    std::filesystem::copy_file(
        source, target,
        targetExists ? std::filesystem::copy_options::overwrite_existing
                     : std::filesystem::copy_options::none);
    std::filesystem::last_write_time(target,
                                     std::filesystem::last_write_time(source));
    std::filesystem::permissions(target,
                                 std::filesystem::status(source).permissions());
    m_log.append(name);
  } catch (const std::exception &ex) {
    m_surface.error(std::string("An error occurred while saving the file:\n") +
                    ex.what());
    return s;
  }

  std::cout << "Saved " << source.filename().string() << " as "
            << target.string() << std::endl;

  return enterDocument(s.index + 1);
}

PipelineState BatchPipeline::on(const state::Displaying &s,
                                const event::ToggleCalibration &) {
  m_surface.setCalibrationMode(true);
  m_surface.showStatus(
      "Select the region: drag the mouse to draw a new rectangle.");
  return state::Calibrating{s.index, std::nullopt};
}

// --- Calibrating ------------------------------------------------------------

PipelineState BatchPipeline::on(const state::Calibrating &s,
                                const event::LayoutReady &e) {
  m_previewArea = e.previewArea;
  try {
    openDocument(s.index);
    renderPreview();
  } catch (const std::exception &ex) {
    m_surface.setCalibrationMode(false);
    skipDocument(s.index, ex.what());
    return enterDocument(s.index + 1);
  }
  // The anchor was taken in the old preview geometry
  return state::Calibrating{s.index, std::nullopt};
}

PipelineState BatchPipeline::on(const state::Calibrating &s,
                                const event::Commit &) {
  return exitCalibration(s.index);
}

PipelineState BatchPipeline::on(const state::Calibrating &s,
                                const event::ToggleCalibration &) {
  return exitCalibration(s.index);
}

PipelineState BatchPipeline::on(const state::Calibrating &s,
                                const event::DragBegin &e) {
  m_surface.showSelection(cv::Rect2d(e.point, e.point));
  return state::Calibrating{s.index, e.point};
}

PipelineState BatchPipeline::on(const state::Calibrating &s,
                                const event::DragMove &e) {
  if (s.anchor) {
    m_surface.showSelection(cv::Rect2d(*s.anchor, e.point));
  }
  return s;
}

PipelineState BatchPipeline::on(const state::Calibrating &s,
                                const event::DragEnd &e) {
  if (!s.anchor) {
    return s;
  }

  DocRect rect = m_transform.dragToDocumentRect(*s.anchor, e.point, m_pageSize);
  if (!rect.isValid()) {
    m_surface.warn("The selected region is empty. Drag again to draw it.");
    redrawPreview();
    return state::Calibrating{s.index, std::nullopt};
  }

  m_rect = ActiveRect{rect, m_rect.version + 1};
  std::cerr << "DEBUG: New extraction rectangle (" << rect.x0 << ", "
            << rect.y0 << ", " << rect.x1 << ", " << rect.y1 << "), version "
            << m_rect.version << std::endl;

  // Re-extract the current document with the new rectangle
  ExtractionResult result;
  try {
    openDocument(s.index);
    result = runExtraction();
  } catch (const std::exception &ex) {
    result.status = ExtractionStatus::RenderFailed;
    result.errorMessage = ex.what();
  }

  SaveResult saved = m_store.saveRect(rect);
  if (saved.success) {
    m_surface.info("Saved the new reading region to " +
                   m_store.path().string() + ".");
  } else {
    m_surface.error("Could not save the new reading region (it stays in "
                    "effect for this run):\n" +
                    saved.errorMessage);
  }

  m_surface.setCalibrationMode(false);

  if (result.status == ExtractionStatus::RenderFailed) {
    skipDocument(s.index, result.errorMessage);
    return enterDocument(s.index + 1);
  }

  m_surface.showStatus(statusText(s.index));
  redrawPreview();
  return state::Displaying{s.index};
}

// --- Helpers ----------------------------------------------------------------

PipelineState BatchPipeline::enterDocument(size_t index) {
  while (index < m_queue.size()) {
    closeDocument();

    const std::filesystem::path &path = m_queue.at(index);
    CurrentDocumentState current;
    current.name = path.filename().string();
    current.path = path;
    m_current = current;

    m_surface.showStatus(statusText(index));
    std::cout << statusText(index) << std::endl;

    try {
      openDocument(index);
      renderPreview();
    } catch (const std::exception &ex) {
      skipDocument(index, ex.what());
      ++index;
      continue;
    }

    ExtractionResult result = runExtraction();
    if (result.status == ExtractionStatus::RenderFailed) {
      skipDocument(index, result.errorMessage);
      ++index;
      continue;
    }

    return state::Displaying{index};
  }

  return finish();
}

PipelineState BatchPipeline::exitCalibration(size_t index) {
  m_surface.setCalibrationMode(false);
  m_surface.showStatus(statusText(index));
  redrawPreview();
  return state::Displaying{index};
}

PipelineState BatchPipeline::finish() {
  closeDocument();
  m_current.reset();
  m_pageImage.release();

  m_surface.showStatus("done");
  m_surface.info("All PDF files have been processed.");
  std::cout << "Processed " << m_queue.size() << " documents" << std::endl;
  return state::Done{};
}

void BatchPipeline::showConfigLocation() {
  std::error_code ec;
  std::filesystem::path location =
      std::filesystem::absolute(m_store.path(), ec);
  if (ec) {
    location = m_store.path();
  }
  m_surface.info("Configuration file: " + location.string());
}

void BatchPipeline::skipDocument(size_t index, const std::string &reason) {
  const std::string name = m_queue.at(index).filename().string();
  std::cerr << "Error: skipping " << name << ": " << reason << std::endl;
  m_surface.error("An error occurred while processing " + name + ":\n" +
                  reason);
  closeDocument();
  m_current.reset();
}

void BatchPipeline::openDocument(size_t index) {
  if (m_document) {
    return;
  }
  m_document = m_provider.open(m_queue.at(index));
  m_pageSize = m_document->pageSize();
  if (!(m_pageSize.width > 0) || !(m_pageSize.height > 0)) {
    throw DocumentError("First page has no usable size");
  }
}

void BatchPipeline::closeDocument() { m_document.reset(); }

void BatchPipeline::renderPreview() {
  double scale = CoordinateTransform::fitScale(m_previewArea, m_pageSize);
  m_pageImage = m_document->renderPage(scale);
  if (m_pageImage.empty()) {
    throw DocumentError("Rendered page is empty");
  }
  m_transform =
      CoordinateTransform::fit(m_previewArea, m_pageSize, m_pageImage.size());
  redrawPreview();
}

void BatchPipeline::redrawPreview() {
  if (!m_pageImage.empty()) {
    m_surface.showPreview(m_pageImage, m_transform, m_rect.rect);
  }
}

ExtractionResult BatchPipeline::runExtraction() {
  std::string stem;
  if (m_current) {
    stem = m_current->path.stem().string();
  }

  ExtractionResult result = m_extractor.extract(*m_document, m_rect.rect,
                                                m_options.digitFilter, stem);

  if (m_current) {
    m_current->rawText = result.rawText;
    m_current->candidate = result.candidate;
    m_current->isValid = result.isValid;
    m_current->field = result.fieldText();
  }

  switch (result.status) {
  case ExtractionStatus::Ok:
    m_surface.setField(result.fieldText(), true);
    break;
  case ExtractionStatus::RecognitionFailed:
    m_surface.error("An error occurred during OCR: " + result.errorMessage);
    m_surface.setField("", false);
    break;
  case ExtractionStatus::RenderFailed:
    break;
  }

  return result;
}

} // namespace renamer
