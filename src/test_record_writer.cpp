#include "RecordWriter.hpp"
#include "ZipArchive.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <zlib.h>

static int failures = 0;

static void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  PASS: " : "  FAIL: ") << description
            << std::endl;
  if (!condition) {
    failures++;
  }
}

static std::string readFile(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

static uint32_t readLe(const std::string &data, size_t offset, int bytes) {
  uint32_t value = 0;
  for (int i = bytes - 1; i >= 0; i--) {
    value = (value << 8) | static_cast<unsigned char>(data[offset + i]);
  }
  return value;
}

/**
 * @brief Find a member by walking the local headers and inflate it
 * @return false if the member is missing or does not inflate to its size
 */
static bool extractMember(const std::string &zip, const std::string &name,
                          std::string &content) {
  size_t offset = 0;
  while (offset + 30 <= zip.size() && readLe(zip, offset, 4) == 0x04034b50) {
    uint32_t compressed = readLe(zip, offset + 18, 4);
    uint32_t size = readLe(zip, offset + 22, 4);
    uint32_t nameLength = readLe(zip, offset + 26, 2);
    uint32_t extraLength = readLe(zip, offset + 28, 2);
    size_t dataStart = offset + 30 + nameLength + extraLength;
    if (dataStart + compressed > zip.size()) {
      return false;
    }

    if (zip.compare(offset + 30, nameLength, name) == 0) {
      content.assign(size, '\0');
      z_stream stream{};
      if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        return false;
      }
      stream.next_in = reinterpret_cast<Bytef *>(
          const_cast<char *>(zip.data() + dataStart));
      stream.avail_in = compressed;
      stream.next_out = reinterpret_cast<Bytef *>(&content[0]);
      stream.avail_out = size;
      int ret = inflate(&stream, Z_FINISH);
      inflateEnd(&stream);
      return ret == Z_STREAM_END && stream.total_out == size &&
             crc32(0L, reinterpret_cast<const Bytef *>(content.data()),
                   size) == readLe(zip, offset + 14, 4);
    }
    offset = dataStart + compressed;
  }
  return false;
}

int main(int argc, char *argv[]) {
  std::cout << "=== Test RecordWriter ===" << std::endl << std::endl;

  std::vector<roster::Record> records = {
      {"BAHAMAS", "Mr.", "John Doe", "Ministry of Environment"},
      {"CÔTE D'IVOIRE", "S.E. Mme", "Awa Koné",
       "Ministère de l'Environnement, Abidjan"},
      {"", "", "Jane \"JJ\" Roe", "R&D <Unit>"}};

  std::cout << "CSV fields:" << std::endl;
  check(roster::csvEscape("plain") == "plain", "plain field unchanged");
  check(roster::csvEscape("") == "", "empty field unchanged");
  check(roster::csvEscape("a,b") == "\"a,b\"", "comma forces quotes");
  check(roster::csvEscape("say \"hi\"") == "\"say \"\"hi\"\"\"",
        "quotes are doubled");
  check(roster::csvEscape("two\nlines") == "\"two\nlines\"",
        "line break forces quotes");

  std::cout << std::endl << "CSV document:" << std::endl;
  std::ostringstream csv;
  roster::writeCsv(records, csv);
  std::string expected =
      "Delegation,Honorific,Person_Name,Affiliation\n"
      "BAHAMAS,Mr.,John Doe,Ministry of Environment\n"
      "CÔTE D'IVOIRE,S.E. Mme,Awa Koné,"
      "\"Ministère de l'Environnement, Abidjan\"\n"
      ",,\"Jane \"\"JJ\"\" Roe\",R&D <Unit>\n";
  std::cout << csv.str();
  check(csv.str() == expected, "header row then one row per record");

  std::ostringstream emptyCsv;
  roster::writeCsv({}, emptyCsv);
  check(emptyCsv.str() == "Delegation,Honorific,Person_Name,Affiliation\n",
        "no records still write the header");

  std::cout << std::endl << "Format from extension:" << std::endl;
  roster::OutputFormat format = roster::OutputFormat::Csv;
  std::string error;
  check(roster::outputFormatForPath("out.csv", format, error) &&
            format == roster::OutputFormat::Csv,
        ".csv is CSV");
  check(roster::outputFormatForPath("out.XLS", format, error) &&
            format == roster::OutputFormat::SpreadsheetXml,
        ".XLS is a spreadsheet, case ignored");
  check(roster::outputFormatForPath("dir.v2/participants", format, error) &&
            format == roster::OutputFormat::Csv,
        "no extension falls back to CSV");
  check(roster::outputFormatForPath("out.xlsx", format, error) &&
            format == roster::OutputFormat::Xlsx,
        ".xlsx is an Office Open XML workbook");
  error.clear();
  check(!roster::outputFormatForPath("", format, error) && !error.empty(),
        "empty path is rejected with a message");

  std::cout << std::endl << "Spreadsheet document:" << std::endl;
  std::ostringstream xml;
  roster::writeSpreadsheetXml(records, xml);
  const std::string sheet = xml.str();
  check(sheet.find("<Workbook") != std::string::npos, "workbook element");
  check(sheet.find(">Person_Name<") != std::string::npos, "header cells");
  check(sheet.find("R&amp;D &lt;Unit&gt;") != std::string::npos,
        "markup characters escaped");
  check(sheet.find("Jane &quot;JJ&quot; Roe") != std::string::npos,
        "quotes escaped");

  std::ostringstream controlXml;
  roster::writeSpreadsheetXml(
      {{"FIJI", "Mr.", "Page\fBreak", "Line\x01One\tTab\nTwo"}}, controlXml);
  const std::string controlSheet = controlXml.str();
  check(controlSheet.find('\f') == std::string::npos &&
            controlSheet.find('\x01') == std::string::npos,
        "control characters dropped");
  check(controlSheet.find(">PageBreak<") != std::string::npos &&
            controlSheet.find("LineOne\tTab\nTwo") != std::string::npos,
        "tab and line feed kept");

  std::cout << std::endl << "Zip container:" << std::endl;
  {
    roster::ZipArchive zip;
    check(zip.addFile("empty.txt", "") && zip.addFile("a/b.txt", "hello"),
          "entries added");
    check(!zip.addFile("", "x") && !zip.errorMessage().empty(),
          "unnamed entry rejected");
    std::ostringstream out;
    check(zip.writeTo(out) && zip.entryCount() == 2, "archive written");
    const std::string bytes = out.str();
    std::string member;
    check(extractMember(bytes, "a/b.txt", member) && member == "hello",
          "member inflates with a matching CRC");
    check(extractMember(bytes, "empty.txt", member) && member.empty(),
          "empty member");
    check(bytes.size() >= 22 &&
              readLe(bytes, bytes.size() - 22, 4) == 0x06054b50 &&
              readLe(bytes, bytes.size() - 12, 2) == 2,
          "end record counts both entries");
  }

  std::cout << std::endl << "Workbook document:" << std::endl;
  std::ostringstream xlsx;
  check(roster::writeXlsx(records, xlsx, error), "workbook built");
  const std::string package = xlsx.str();
  check(package.rfind("PK\x03\x04", 0) == 0, "package is a zip archive");
  check(package.compare(30, 19, "[Content_Types].xml") == 0,
        "content types part comes first");
  check(package.size() >= 22 &&
            readLe(package, package.size() - 22, 4) == 0x06054b50 &&
            readLe(package, package.size() - 12, 2) == 5,
        "five package parts");

  std::string part;
  check(extractMember(package, "xl/workbook.xml", part) &&
            part.find("name=\"Participants\"") != std::string::npos,
        "sheet named Participants");
  check(extractMember(package, "xl/_rels/workbook.xml.rels", part) &&
            part.find("worksheets/sheet1.xml") != std::string::npos,
        "workbook points at its sheet");

  std::string worksheet;
  check(extractMember(package, "xl/worksheets/sheet1.xml", worksheet),
        "worksheet inflates");
  check(worksheet.find("<c r=\"C1\" t=\"inlineStr\"><is><t "
                       "xml:space=\"preserve\">Person_Name</t>") !=
            std::string::npos,
        "header row in row 1");
  check(worksheet.find("<c r=\"A3\" t=\"inlineStr\"><is><t "
                       "xml:space=\"preserve\">CÔTE D'IVOIRE</t>") !=
            std::string::npos,
        "second record in row 3, UTF-8 kept");
  check(worksheet.find("R&amp;D &lt;Unit&gt;") != std::string::npos,
        "markup characters escaped");
  check(worksheet.find("<row r=\"5\"") == std::string::npos,
        "one row per record after the header");

  std::cout << std::endl << "Files:" << std::endl;
  auto dir = std::filesystem::temp_directory_path() / "roster_writer_test";
  std::filesystem::create_directories(dir);

  auto csvPath = dir / "participants.csv";
  auto written = roster::writeRecords(records, csvPath.string());
  check(written.success && written.rowCount == records.size(),
        "CSV file written");
  std::string csvFile = readFile(csvPath);
  check(csvFile.rfind("\xEF\xBB\xBF", 0) == 0, "CSV starts with a BOM");
  check(csvFile.substr(3) == expected, "CSV body follows the BOM");

  auto xlsPath = dir / "participants.xls";
  written = roster::writeRecords(records, xlsPath.string());
  std::string xlsFile = readFile(xlsPath);
  check(written.success && xlsFile.rfind("<?xml", 0) == 0,
        "spreadsheet file written without a BOM");

  auto xlsxPath = dir / "participants.xlsx";
  written = roster::writeRecords(records, xlsxPath.string());
  std::string xlsxFile = readFile(xlsxPath);
  check(written.success && written.rowCount == records.size() &&
            xlsxFile.rfind("PK\x03\x04", 0) == 0,
        ".xlsx file written without a BOM");
  check(extractMember(xlsxFile, "xl/worksheets/sheet1.xml", worksheet) &&
            worksheet.find("Ministry of Environment") != std::string::npos,
        ".xlsx file holds the records");

  written = roster::writeRecords(records,
                                 (dir / "missing" / "out.csv").string());
  check(!written.success && !written.errorMessage.empty(),
        "unwritable path reports an error");

  std::filesystem::remove_all(dir);

  std::cout << std::endl;
  if (failures == 0) {
    std::cout << "All RecordWriter tests passed" << std::endl;
    return 0;
  }
  std::cout << failures << " RecordWriter test(s) failed" << std::endl;
  return 1;
}
