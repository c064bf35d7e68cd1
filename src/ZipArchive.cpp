#include "ZipArchive.hpp"

#include <limits>
#include <utility>

#include <zlib.h>

namespace roster {

namespace {

const uint32_t kLocalHeaderSignature = 0x04034b50;
const uint32_t kCentralHeaderSignature = 0x02014b50;
const uint32_t kEndOfCentralDirSignature = 0x06054b50;

const uint16_t kVersionNeeded = 20; // 2.0: deflate
const uint16_t kMethodDeflate = 8;
const uint16_t kDosTime = 0;
const uint16_t kDosDate = (0 << 9) | (1 << 5) | 1; // 1980-01-01

void appendU16(std::string &buffer, uint16_t value) {
  buffer += static_cast<char>(value & 0xFF);
  buffer += static_cast<char>((value >> 8) & 0xFF);
}

void appendU32(std::string &buffer, uint32_t value) {
  buffer += static_cast<char>(value & 0xFF);
  buffer += static_cast<char>((value >> 8) & 0xFF);
  buffer += static_cast<char>((value >> 16) & 0xFF);
  buffer += static_cast<char>((value >> 24) & 0xFF);
}

// Fields shared by the local and the central header, from "version needed"
// through the extra field length
void appendEntryFields(std::string &buffer, const std::string &name,
                       uint32_t crc, uint32_t compressedSize,
                       uint32_t uncompressedSize) {
  appendU16(buffer, kVersionNeeded);
  appendU16(buffer, 0); // flags
  appendU16(buffer, kMethodDeflate);
  appendU16(buffer, kDosTime);
  appendU16(buffer, kDosDate);
  appendU32(buffer, crc);
  appendU32(buffer, compressedSize);
  appendU32(buffer, uncompressedSize);
  appendU16(buffer, static_cast<uint16_t>(name.size()));
  appendU16(buffer, 0); // extra field length
}

// Raw deflate (no zlib header), as the ZIP format stores it
bool deflateRaw(const std::string &input, std::vector<uint8_t> &output,
                std::string &errorMessage) {
  z_stream stream{};
  int ret = deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                         -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    errorMessage = "zlib deflateInit2 failed (error " + std::to_string(ret) +
                   ")";
    return false;
  }

  output.resize(deflateBound(&stream, static_cast<uLong>(input.size())));
  stream.next_in =
      reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
  stream.avail_in = static_cast<uInt>(input.size());
  stream.next_out = output.data();
  stream.avail_out = static_cast<uInt>(output.size());

  ret = deflate(&stream, Z_FINISH);
  const uLong written = stream.total_out;
  deflateEnd(&stream);

  if (ret != Z_STREAM_END) {
    errorMessage = "zlib deflate failed (error " + std::to_string(ret) + ")";
    return false;
  }

  output.resize(written);
  return true;
}

} // anonymous namespace

bool ZipArchive::addFile(const std::string &name, const std::string &content) {
  if (name.empty() || name.size() > std::numeric_limits<uint16_t>::max()) {
    m_errorMessage = "Invalid archive entry name: " + name;
    return false;
  }
  if (content.size() >= std::numeric_limits<uint32_t>::max() ||
      m_entries.size() >= std::numeric_limits<uint16_t>::max()) {
    m_errorMessage = "Archive entry too large: " + name;
    return false;
  }

  Entry entry;
  entry.name = name;
  entry.uncompressedSize = static_cast<uint32_t>(content.size());
  entry.crc = static_cast<uint32_t>(
      crc32(crc32(0L, Z_NULL, 0),
            reinterpret_cast<const Bytef *>(content.data()),
            static_cast<uInt>(content.size())));

  if (!deflateRaw(content, entry.data, m_errorMessage)) {
    m_errorMessage = name + ": " + m_errorMessage;
    return false;
  }

  m_entries.push_back(std::move(entry));
  return true;
}

bool ZipArchive::writeTo(std::ostream &out) {
  std::string archive;
  std::string centralDirectory;

  for (const auto &entry : m_entries) {
    if (archive.size() >= std::numeric_limits<uint32_t>::max()) {
      m_errorMessage = "Archive exceeds 4 GiB";
      return false;
    }
    const uint32_t localOffset = static_cast<uint32_t>(archive.size());
    const uint32_t compressedSize = static_cast<uint32_t>(entry.data.size());

    appendU32(archive, kLocalHeaderSignature);
    appendEntryFields(archive, entry.name, entry.crc, compressedSize,
                      entry.uncompressedSize);
    archive += entry.name;
    archive.append(reinterpret_cast<const char *>(entry.data.data()),
                   entry.data.size());

    appendU32(centralDirectory, kCentralHeaderSignature);
    appendU16(centralDirectory, kVersionNeeded); // version made by
    appendEntryFields(centralDirectory, entry.name, entry.crc, compressedSize,
                      entry.uncompressedSize);
    appendU16(centralDirectory, 0); // comment length
    appendU16(centralDirectory, 0); // disk number
    appendU16(centralDirectory, 0); // internal attributes
    appendU32(centralDirectory, 0); // external attributes
    appendU32(centralDirectory, localOffset);
    centralDirectory += entry.name;
  }

  if (archive.size() + centralDirectory.size() >=
      std::numeric_limits<uint32_t>::max()) {
    m_errorMessage = "Archive exceeds 4 GiB";
    return false;
  }

  const uint16_t count = static_cast<uint16_t>(m_entries.size());
  const uint32_t centralOffset = static_cast<uint32_t>(archive.size());
  archive += centralDirectory;

  appendU32(archive, kEndOfCentralDirSignature);
  appendU16(archive, 0); // this disk
  appendU16(archive, 0); // disk with the central directory
  appendU16(archive, count);
  appendU16(archive, count);
  appendU32(archive, static_cast<uint32_t>(centralDirectory.size()));
  appendU32(archive, centralOffset);
  appendU16(archive, 0); // comment length

  out.write(archive.data(), static_cast<std::streamsize>(archive.size()));
  if (!out) {
    m_errorMessage = "Failed to write archive";
    return false;
  }
  return true;
}

} // namespace roster
