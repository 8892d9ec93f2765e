#include "DocumentQueue.hpp"

#include <algorithm>
#include <cctype>

namespace renamer {

namespace {

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

} // anonymous namespace

DocumentQueue::DocumentQueue(std::vector<std::filesystem::path> documents)
    : m_documents(std::move(documents)) {
  std::sort(m_documents.begin(), m_documents.end(),
            [](const std::filesystem::path &a, const std::filesystem::path &b) {
              return a.filename().string() < b.filename().string();
            });
}

DocumentQueue DocumentQueue::fromDirectory(
    const std::filesystem::path &directory, const std::string &extension) {
  std::vector<std::filesystem::path> documents;
  const std::string wanted = toLower(extension);

  for (const auto &entry : std::filesystem::directory_iterator(directory)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    if (toLower(entry.path().extension().string()) == wanted) {
      documents.push_back(entry.path());
    }
  }

  return DocumentQueue(std::move(documents));
}

const std::filesystem::path &DocumentQueue::at(size_t index) const {
  return m_documents.at(index);
}

} // namespace renamer
