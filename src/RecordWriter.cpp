#include "RecordWriter.hpp"
#include "ZipArchive.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace roster {

namespace {

const char kUtf8Bom[] = "\xEF\xBB\xBF";

std::vector<std::string> recordFields(const Record &record) {
  return {record.delegation, record.honorific, record.personName,
          record.affiliation};
}

std::string xmlEscape(const std::string &text) {
  std::string escaped;
  escaped.reserve(text.size());

  for (char c : text) {
    const unsigned char byte = static_cast<unsigned char>(c);

    // XML 1.0 forbids C0 controls other than tab, LF and CR
    if (byte < 0x20 && c != '\t' && c != '\n' && c != '\r') {
      continue;
    }

    switch (c) {
    case '&':
      escaped += "&amp;";
      break;
    case '<':
      escaped += "&lt;";
      break;
    case '>':
      escaped += "&gt;";
      break;
    case '"':
      escaped += "&quot;";
      break;
    default:
      escaped += c;
      break;
    }
  }
  return escaped;
}

void writeXmlRow(const std::vector<std::string> &cells, std::ostream &out) {
  out << "   <Row>\n";
  for (const auto &cell : cells) {
    out << "    <Cell><Data ss:Type=\"String\">" << xmlEscape(cell)
        << "</Data></Cell>\n";
  }
  out << "   </Row>\n";
}

// "A1" style reference; the sheet never has more than 26 columns
std::string cellReference(size_t column, size_t row) {
  return std::string(1, static_cast<char>('A' + column)) + std::to_string(row);
}

void writeSheetRow(const std::vector<std::string> &cells, size_t row,
                   std::ostream &out) {
  out << "<row r=\"" << row << "\">";
  for (size_t column = 0; column < cells.size(); ++column) {
    out << "<c r=\"" << cellReference(column, row)
        << "\" t=\"inlineStr\"><is><t xml:space=\"preserve\">"
        << xmlEscape(cells[column]) << "</t></is></c>";
  }
  out << "</row>";
}

const char kXmlDeclaration[] =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";

const char kContentTypes[] =
    "<Types "
    "xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
    "<Default Extension=\"rels\" "
    "ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
    "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
    "<Override PartName=\"/xl/workbook.xml\" "
    "ContentType=\"application/"
    "vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml\"/>"
    "<Override PartName=\"/xl/worksheets/sheet1.xml\" "
    "ContentType=\"application/"
    "vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml\"/>"
    "</Types>";

const char kPackageRels[] =
    "<Relationships "
    "xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" "
    "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/"
    "relationships/officeDocument\" Target=\"xl/workbook.xml\"/>"
    "</Relationships>";

const char kWorkbook[] =
    "<workbook "
    "xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
    "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/"
    "relationships\">"
    "<sheets><sheet name=\"Participants\" sheetId=\"1\" r:id=\"rId1\"/></sheets>"
    "</workbook>";

const char kWorkbookRels[] =
    "<Relationships "
    "xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" "
    "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/"
    "relationships/worksheet\" Target=\"worksheets/sheet1.xml\"/>"
    "</Relationships>";

} // anonymous namespace

const std::vector<std::string> &recordColumns() {
  static const std::vector<std::string> columns = {
      "Delegation", "Honorific", "Person_Name", "Affiliation"};
  return columns;
}

bool outputFormatForPath(const std::string &outputPath, OutputFormat &format,
                         std::string &errorMessage) {
  std::string extension = std::filesystem::path(outputPath).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (outputPath.empty()) {
    errorMessage = "Output path is empty";
    return false;
  }

  if (extension == ".xlsx") {
    format = OutputFormat::Xlsx;
  } else if (extension == ".xls" || extension == ".xml") {
    format = OutputFormat::SpreadsheetXml;
  } else {
    format = OutputFormat::Csv;
  }
  return true;
}

std::string csvEscape(const std::string &field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    return field;
  }

  std::string quoted = "\"";
  for (char c : field) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

void writeCsv(const std::vector<Record> &records, std::ostream &out) {
  auto writeRow = [&out](const std::vector<std::string> &fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
      if (i > 0) {
        out << ',';
      }
      out << csvEscape(fields[i]);
    }
    out << '\n';
  };

  writeRow(recordColumns());
  for (const auto &record : records) {
    writeRow(recordFields(record));
  }
}

void writeSpreadsheetXml(const std::vector<Record> &records,
                         std::ostream &out) {
  out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      << "<?mso-application progid=\"Excel.Sheet\"?>\n"
      << "<Workbook xmlns=\"urn:schemas-microsoft-com:office:spreadsheet\"\n"
      << " xmlns:ss=\"urn:schemas-microsoft-com:office:spreadsheet\">\n"
      << " <Worksheet ss:Name=\"Participants\">\n"
      << "  <Table>\n";

  writeXmlRow(recordColumns(), out);
  for (const auto &record : records) {
    writeXmlRow(recordFields(record), out);
  }

  out << "  </Table>\n"
      << " </Worksheet>\n"
      << "</Workbook>\n";
}

bool writeXlsx(const std::vector<Record> &records, std::ostream &out,
               std::string &errorMessage) {
  std::ostringstream sheet;
  sheet << kXmlDeclaration
        << "<worksheet "
           "xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/"
           "main\"><sheetData>";
  size_t row = 1;
  writeSheetRow(recordColumns(), row++, sheet);
  for (const auto &record : records) {
    writeSheetRow(recordFields(record), row++, sheet);
  }
  sheet << "</sheetData></worksheet>";

  const std::string declaration = kXmlDeclaration;
  ZipArchive zip;

  // [Content_Types].xml must be the first entry of the package
  bool added =
      zip.addFile("[Content_Types].xml", declaration + kContentTypes) &&
      zip.addFile("_rels/.rels", declaration + kPackageRels) &&
      zip.addFile("xl/workbook.xml", declaration + kWorkbook) &&
      zip.addFile("xl/_rels/workbook.xml.rels", declaration + kWorkbookRels) &&
      zip.addFile("xl/worksheets/sheet1.xml", sheet.str());

  if (!added || !zip.writeTo(out)) {
    errorMessage = "Failed to build workbook: " + zip.errorMessage();
    return false;
  }
  return true;
}

WriteResult writeRecords(const std::vector<Record> &records,
                         const std::string &outputPath) {
  WriteResult result;
  result.outputPath = outputPath;

  OutputFormat format = OutputFormat::Csv;
  if (!outputFormatForPath(outputPath, format, result.errorMessage)) {
    return result;
  }

  std::ofstream out(outputPath, std::ios::binary);
  if (!out) {
    result.errorMessage = "Failed to open output file: " + outputPath;
    return result;
  }

  switch (format) {
  case OutputFormat::Csv:
    out << kUtf8Bom;
    writeCsv(records, out);
    break;
  case OutputFormat::SpreadsheetXml:
    writeSpreadsheetXml(records, out);
    break;
  case OutputFormat::Xlsx:
    if (!writeXlsx(records, out, result.errorMessage)) {
      return result;
    }
    break;
  }

  out.flush();
  if (!out) {
    result.errorMessage = "Failed to write output file: " + outputPath;
    return result;
  }

  result.rowCount = records.size();
  result.success = true;
  return result;
}

} // namespace roster
