#ifndef RENAMER_DOCUMENT_QUEUE_HPP
#define RENAMER_DOCUMENT_QUEUE_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace renamer {

/**
 * @brief Ordered list of the documents of one run
 *
 * Built once by listing a directory; entries are sorted by file name and
 * never change afterwards.
 */
class DocumentQueue {
public:
  DocumentQueue() = default;
  explicit DocumentQueue(std::vector<std::filesystem::path> documents);

  /**
   * @brief List the regular files of a directory with a given extension
   * @param directory Directory to list (not recursive)
   * @param extension Extension including the dot, compared case-insensitively
   * @throws std::filesystem::filesystem_error if the directory is unreadable
   */
  static DocumentQueue fromDirectory(const std::filesystem::path &directory,
                                     const std::string &extension = ".pdf");

  size_t size() const { return m_documents.size(); }
  bool empty() const { return m_documents.empty(); }
  const std::filesystem::path &at(size_t index) const;

  const std::vector<std::filesystem::path> &documents() const {
    return m_documents;
  }

private:
  std::vector<std::filesystem::path> m_documents;
};

} // namespace renamer

#endif // RENAMER_DOCUMENT_QUEUE_HPP
