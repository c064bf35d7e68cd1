#ifndef ROSTER_RECORD_WRITER_HPP
#define ROSTER_RECORD_WRITER_HPP

#include "RosterTypes.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace roster {

/**
 * @brief File formats the records can be written in
 */
enum class OutputFormat {
  Csv,            ///< UTF-8 CSV with byte order mark
  SpreadsheetXml, ///< SpreadsheetML 2003 workbook (opens in Excel)
  Xlsx            ///< Office Open XML workbook
};

/**
 * @brief Result of writing records to a file
 */
struct WriteResult {
  bool success = false;     ///< Whether the file was written
  std::string errorMessage; ///< Error message if failed
  std::string outputPath;   ///< Path that was written
  size_t rowCount = 0;      ///< Records written, header excluded
};

/**
 * @brief Column titles, in output order
 */
const std::vector<std::string> &recordColumns();

/**
 * @brief Choose the output format from a file extension
 *
 * ".xlsx" selects Xlsx, ".xls" and ".xml" select SpreadsheetXml, anything
 * else is CSV. The comparison ignores case.
 *
 * @param outputPath Output file path
 * @param format Receives the chosen format
 * @param errorMessage Set when no file can be written to the path
 * @return false if the path is empty
 */
bool outputFormatForPath(const std::string &outputPath, OutputFormat &format,
                         std::string &errorMessage);

/**
 * @brief Quote a CSV field if it contains a comma, quote or line break
 */
std::string csvEscape(const std::string &field);

/**
 * @brief Write records as CSV (header row first, '\n' line endings)
 */
void writeCsv(const std::vector<Record> &records, std::ostream &out);

/**
 * @brief Write records as a single-sheet SpreadsheetML workbook
 */
void writeSpreadsheetXml(const std::vector<Record> &records, std::ostream &out);

/**
 * @brief Write records as a single-sheet .xlsx package
 *
 * Cells are inline strings, so the workbook needs no shared string table or
 * styles part.
 *
 * @return false if the package could not be built or written
 */
bool writeXlsx(const std::vector<Record> &records, std::ostream &out,
               std::string &errorMessage);

/**
 * @brief Write records to a file, format chosen by extension
 */
WriteResult writeRecords(const std::vector<Record> &records,
                         const std::string &outputPath);

} // namespace roster

#endif // ROSTER_RECORD_WRITER_HPP
