#ifndef ROSTER_ZIP_ARCHIVE_HPP
#define ROSTER_ZIP_ARCHIVE_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace roster {

/**
 * @brief In-memory builder for a small ZIP container
 *
 * Entries are deflated with zlib as they are added and written out with a
 * central directory, which is all an Office Open XML package needs. No ZIP64
 * support: every entry and the archive itself must stay below 4 GiB.
 *
 * Example usage:
 * @code
 * roster::ZipArchive zip;
 * zip.addFile("hello.txt", "Hello");
 * std::ofstream out("hello.zip", std::ios::binary);
 * if (!zip.writeTo(out)) {
 *     std::cerr << zip.errorMessage() << "\n";
 * }
 * @endcode
 */
class ZipArchive {
public:
  /**
   * @brief Compress and append one file
   * @param name Path inside the archive, '/' separated
   * @param content File contents
   * @return false if compression failed; errorMessage() explains
   */
  bool addFile(const std::string &name, const std::string &content);

  /**
   * @brief Write local headers, data and the central directory
   * @return false if the stream failed or the archive is too large
   */
  bool writeTo(std::ostream &out);

  size_t entryCount() const { return m_entries.size(); }

  const std::string &errorMessage() const { return m_errorMessage; }

private:
  struct Entry {
    std::string name;
    uint32_t crc = 0;               ///< CRC-32 of the uncompressed data
    uint32_t uncompressedSize = 0;
    std::vector<uint8_t> data;      ///< Raw deflate stream
  };

  std::vector<Entry> m_entries;
  std::string m_errorMessage;
};

} // namespace roster

#endif // ROSTER_ZIP_ARCHIVE_HPP
