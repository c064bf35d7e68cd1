#include "PdfTokenSource.hpp"
#include "RosterExtractor.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  PASS: " : "  FAIL: ") << description
            << std::endl;
  if (!condition) {
    failures++;
  }
}

/**
 * @brief In-memory token source built from positioned text lines
 *
 * Each page is a list of lines; words or glyphs are generated on demand so
 * the source can serve either granularity like the Poppler source does.
 */
class MemoryTokenSource : public roster::TokenSource {
public:
  struct TextLine {
    std::string text;
    double x0;
    double top;
    bool bold;
  };

  explicit MemoryTokenSource(bool fontWeight = true)
      : m_fontWeight(fontWeight) {}

  void addPage(const std::vector<TextLine> &lines) { m_pages.push_back(lines); }

  void failPage(int pageIndex) { m_failing.insert(pageIndex); }

  void throwOnPage(int pageIndex) { m_throwing.insert(pageIndex); }

  int pageCount() const override { return static_cast<int>(m_pages.size()); }

  bool hasFontWeight() const override { return m_fontWeight; }

  roster::PageTokens extractPage(int pageIndex,
                                 roster::TokenGranularity granularity) override {
    requests.push_back(pageIndex);

    if (m_throwing.count(pageIndex) > 0) {
      throw std::runtime_error("corrupt page object");
    }

    roster::PageTokens page;
    page.pageNumber = pageIndex + 1;
    page.granularity = granularity;

    if (m_failing.count(pageIndex) > 0) {
      page.errorMessage = "Failed to load page " + std::to_string(pageIndex + 1);
      return page;
    }

    for (const auto &line : m_pages[pageIndex]) {
      if (granularity == roster::TokenGranularity::Character) {
        for (size_t i = 0; i < line.text.size(); i++) {
          page.tokens.push_back(roster::Token{std::string(1, line.text[i]),
                                              line.x0 + 5.0 * i, line.top,
                                              line.bold && m_fontWeight});
        }
      } else {
        double x = line.x0;
        size_t start = 0;
        while (start < line.text.size()) {
          size_t end = line.text.find(' ', start);
          if (end == std::string::npos) {
            end = line.text.size();
          }
          if (end > start) {
            page.tokens.push_back(
                roster::Token{line.text.substr(start, end - start), x,
                              line.top, false});
            x += 6.0 * (end - start + 1);
          }
          start = end + 1;
        }
      }
    }

    page.success = true;
    return page;
  }

  std::vector<int> requests; ///< Page indices requested, in order

private:
  bool m_fontWeight;
  std::vector<std::vector<TextLine>> m_pages;
  std::set<int> m_failing;
  std::set<int> m_throwing;
};

static std::vector<MemoryTokenSource::TextLine> singleColumnPage() {
  return {{"BAHAMAS", 50, 14, true},
          {"Mr. John Doe", 50, 26, false},
          {"Ministry of Environment", 50, 38, false}};
}

static std::vector<MemoryTokenSource::TextLine> twoColumnPage() {
  return {{"ARGENTINA", 50, 10, false},
          {"Mr. John Smith", 50, 40, false},
          {"Ministry of Environment", 50, 52, false},
          {"Jane Roe", 50, 90, false},
          {"Dept. of Wildlife", 50, 102, false},
          {"Ms. Ana Lima", 300, 40, false},
          {"Embassy", 300, 52, false}};
}

/**
 * @brief Write a one-page PDF with a bold header line and two regular lines
 *
 * Uses the standard Helvetica fonts so nothing needs embedding. Object offsets
 * for the xref table are measured while the file is assembled.
 */
static bool writeSamplePdf(const std::filesystem::path &path) {
  const std::string content = "BT /F1 12 Tf 50 760 Td (BAHAMAS) Tj ET\n"
                              "BT /F2 12 Tf 50 748 Td (Mr. John Doe) Tj ET\n"
                              "BT /F2 12 Tf 50 736 Td (Ministry of Environment)"
                              " Tj ET\n";
  const std::vector<std::string> objects = {
      "<< /Type /Catalog /Pages 2 0 R >>",
      "<< /Type /Pages /Kids [3 0 R] /Count 1 >>",
      "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] "
      "/Resources << /Font << /F1 4 0 R /F2 5 0 R >> >> /Contents 6 0 R >>",
      "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica-Bold >>",
      "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>",
      "<< /Length " + std::to_string(content.size()) + " >>\nstream\n" +
          content + "endstream"};

  std::string pdf = "%PDF-1.4\n";
  std::vector<size_t> offsets;
  for (size_t i = 0; i < objects.size(); i++) {
    offsets.push_back(pdf.size());
    pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
  }

  const size_t xrefOffset = pdf.size();
  pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n";
  pdf += "0000000000 65535 f \n";
  for (size_t offset : offsets) {
    char entry[21];
    std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
    pdf += entry;
  }
  pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) +
         " /Root 1 0 R >>\nstartxref\n" + std::to_string(xrefOffset) +
         "\n%%EOF\n";

  std::ofstream out(path, std::ios::binary);
  out << pdf;
  return static_cast<bool>(out);
}

int main(int argc, char *argv[]) {
  std::cout << "=== Test RosterExtractor dispatch ===" << std::endl
            << std::endl;

  roster::ExtractorConfig config;

  std::cout << "Layout detection:" << std::endl;
  {
    MemoryTokenSource source;
    source.addPage(twoColumnPage());
    roster::RosterExtractor extractor(config);
    auto result = extractor.extract(source);
    check(result.success, "two-column document extracted");
    check(result.layoutMode == roster::LayoutMode::Two, "detected two columns");
    check(result.records.size() == 3, "three records");
    check(!result.usedOcr, "text layer only");
  }
  {
    MemoryTokenSource source;
    source.addPage(singleColumnPage());
    roster::RosterExtractor extractor(config);
    auto result = extractor.extract(source);
    check(result.layoutMode == roster::LayoutMode::Single,
          "detected one column");
    check(result.records.size() == 1 &&
              result.records[0].delegation == "BAHAMAS" &&
              result.records[0].affiliation == "Ministry of Environment",
          "bold delegation record from glyphs");
  }

  std::cout << std::endl << "Layout override:" << std::endl;
  {
    MemoryTokenSource source;
    source.addPage(singleColumnPage());
    roster::ExtractorConfig forced = config;
    forced.layout = roster::LayoutOverride::Two;
    roster::RosterExtractor extractor(forced);
    check(extractor.resolveLayout(source) == roster::LayoutMode::Two,
          "forced two columns");
    check(source.requests.empty(), "override skips layout sampling");

    forced.layout = roster::LayoutOverride::One;
    extractor.setConfig(forced);
    MemoryTokenSource balanced;
    balanced.addPage(twoColumnPage());
    check(extractor.resolveLayout(balanced) == roster::LayoutMode::Single,
          "forced one column");
  }
  {
    MemoryTokenSource ocrLike(false);
    ocrLike.addPage(singleColumnPage());
    roster::ExtractorConfig forced = config;
    forced.layout = roster::LayoutOverride::One;
    roster::RosterExtractor extractor(forced);
    auto result = extractor.extract(ocrLike);
    check(result.layoutMode == roster::LayoutMode::Two,
          "source without font weight always uses two columns");
    check(result.usedOcr, "weightless source is reported as OCR");
  }

  std::cout << std::endl << "Page failures:" << std::endl;
  {
    MemoryTokenSource source;
    source.addPage(twoColumnPage());
    source.addPage(twoColumnPage());
    source.addPage(twoColumnPage());
    source.addPage(twoColumnPage());
    source.failPage(1);
    source.throwOnPage(2);

    roster::RosterExtractor extractor(config);
    auto result = extractor.extract(source);
    check(result.success, "page failures do not fail the document");
    check(result.pageCount == 4 && result.pagesProcessed == 2,
          "two of four pages processed");
    check(result.skippedPages == std::vector<int>({2, 3}),
          "failed and throwing pages reported 1-indexed");
    check(result.records.size() == 6, "records from the readable pages");
  }
  {
    MemoryTokenSource source;
    source.addPage(twoColumnPage());
    source.addPage(twoColumnPage());
    source.failPage(0);
    source.failPage(1);
    roster::RosterExtractor extractor(config);
    check(extractor.resolveLayout(source) == roster::LayoutMode::Single,
          "unreadable sample pages fall back to one column");
  }

  std::cout << std::endl << "Empty pages:" << std::endl;
  {
    MemoryTokenSource source;
    source.addPage(twoColumnPage());
    source.addPage({});
    roster::RosterExtractor extractor(config);
    auto result = extractor.extract(source);
    check(result.pagesProcessed == 2 && result.skippedPages.empty(),
          "empty page is processed, not skipped");
    check(result.records.size() == 3, "empty page adds no records");
  }
  {
    MemoryTokenSource source;
    source.addPage(singleColumnPage());
    source.addPage({});

    MemoryTokenSource ocr(false);
    ocr.addPage({});
    ocr.addPage(twoColumnPage());

    roster::RosterExtractor extractor(config);
    auto result = extractor.extract(source, &ocr);
    check(result.layoutMode == roster::LayoutMode::Single,
          "document layout comes from the text layer");
    check(result.usedOcr, "fallback use is reported");
    check(ocr.requests == std::vector<int>({1}),
          "fallback consulted for the empty page only");
    check(result.records.size() == 4, "text layer and OCR records combined");
    if (result.records.size() == 4) {
      check(result.records[1].delegation == "ARGENTINA" &&
                result.records[3].personName == "Ana Lima",
            "OCR page assembled with the two-column rules");
    }
  }

  std::cout << std::endl << "Delegation scope is per page:" << std::endl;
  {
    MemoryTokenSource source;
    source.addPage(singleColumnPage());
    source.addPage({{"Ms. Orphan Line", 50, 20, false},
                    {"Somewhere", 50, 32, false}});
    roster::ExtractorConfig forced = config;
    forced.layout = roster::LayoutOverride::One;
    roster::RosterExtractor extractor(forced);
    auto result = extractor.extract(source);
    check(result.records.size() == 1,
          "page without a bold header emits nothing");
  }

  std::cout << std::endl << "Repeatability:" << std::endl;
  {
    MemoryTokenSource source;
    source.addPage(twoColumnPage());
    source.addPage(singleColumnPage());
    roster::RosterExtractor extractor(config);
    auto first = extractor.extract(source);
    auto second = extractor.extract(source);
    check(first.records == second.records, "identical input, identical rows");
  }

  std::cout << std::endl << "Bold font names:" << std::endl;
  check(roster::PdfTokenSource::isBoldFont("Arial-BoldMT"), "Arial-BoldMT");
  check(roster::PdfTokenSource::isBoldFont("ABCDEF+roboto-bold"),
        "lower-case bold in a subset name");
  check(roster::PdfTokenSource::isBoldFont("Helvetica-BOLDOblique"),
        "upper-case BOLD");
  check(!roster::PdfTokenSource::isBoldFont("Helvetica"), "regular font");
  check(!roster::PdfTokenSource::isBoldFont("*ignored*"),
        "placeholder name is not bold");
  check(!roster::PdfTokenSource::isBoldFont(""), "empty name is not bold");

  std::cout << std::endl << "Command line values:" << std::endl;
  {
    double threshold = 260.0;
    check(roster::parseDoubleArgument("300.5", threshold) &&
              threshold == 300.5,
          "decimal threshold accepted");
    check(!roster::parseDoubleArgument("260abc", threshold) &&
              threshold == 300.5,
          "trailing characters rejected, value kept");
    check(!roster::parseDoubleArgument("", threshold), "empty value rejected");
    check(!roster::parseDoubleArgument("abc", threshold),
          "non-numeric value rejected");
    check(!roster::parseDoubleArgument("1e999", threshold),
          "out of range value rejected");

    int dpi = 300;
    check(roster::parseIntArgument("150", dpi) && dpi == 150,
          "integer accepted");
    check(!roster::parseIntArgument("150dpi", dpi) && dpi == 150,
          "integer with suffix rejected");
    check(!roster::parseIntArgument("72.5", dpi), "fraction rejected");
    check(!roster::parseIntArgument("99999999999", dpi),
          "integer overflow rejected");

    roster::LayoutOverride layout = roster::LayoutOverride::Auto;
    check(roster::parseLayoutOverride("two", layout) &&
              layout == roster::LayoutOverride::Two,
          "layout two");
    check(!roster::parseLayoutOverride("three", layout) &&
              layout == roster::LayoutOverride::Two,
          "unknown layout rejected");
  }

  std::cout << std::endl << "PDF and OCR sources:" << std::endl;
  {
    auto dir = std::filesystem::temp_directory_path() / "roster_dispatch_test";
    std::filesystem::create_directories(dir);
    auto pdfPath = dir / "sample.pdf";
    check(writeSamplePdf(pdfPath), "sample PDF written");

    roster::PdfTokenSource missing;
    check(!missing.open((dir / "absent.pdf").string()) &&
              !missing.isOpen() && !missing.errorMessage().empty(),
          "missing file is reported");
    auto unopened = missing.extractPage(0, roster::TokenGranularity::Word);
    check(!unopened.success && !unopened.errorMessage.empty(),
          "extracting without a document fails");

    roster::PdfTokenSource pdf;
    check(pdf.open(pdfPath.string()) && pdf.isOpen() && pdf.pageCount() == 1,
          "sample PDF opened");

    if (pdf.isOpen()) {
      auto words = pdf.extractPage(0, roster::TokenGranularity::Word);
      bool hasHeader = false;
      for (const auto &token : words.tokens) {
        hasHeader = hasHeader || token.text == "BAHAMAS";
      }
      check(words.success && hasHeader, "text layer words read");

      auto glyphs = pdf.extractPage(0, roster::TokenGranularity::Character);
      bool boldB = false;
      bool regularM = false;
      for (const auto &token : glyphs.tokens) {
        boldB = boldB || (token.text == "B" && token.isBold);
        regularM = regularM || (token.text == "M" && !token.isBold);
      }
      check(glyphs.success && boldB, "Helvetica-Bold glyphs are bold");
      check(regularM, "Helvetica glyphs are regular");

      auto outOfRange = pdf.extractPage(3, roster::TokenGranularity::Word);
      check(!outOfRange.success && !outOfRange.errorMessage.empty(),
            "page out of range fails");

      roster::OcrConfig ocrConfig;
      ocrConfig.dpi = 36;
      roster::OcrTokenSource ocr(*pdf.document(), ocrConfig);
      check(ocr.pageCount() == 1 && !ocr.isInitialized(),
            "OCR source shares the document");

      std::string renderError;
      cv::Mat image = ocr.renderPage(0, renderError);
      check(!image.empty() && image.type() == CV_8UC3 && renderError.empty(),
            "page rendered to a BGR image");

      image = ocr.renderPage(1, renderError);
      check(image.empty() && !renderError.empty(),
            "rendering a missing page reports an error");

      auto page = ocr.extractPage(0, roster::TokenGranularity::Word);
      check(!page.success && !page.errorMessage.empty() &&
                page.tokens.empty(),
            "uninitialized engine fails the page instead of returning "
            "no words");

      std::string recognizeError;
      auto tokens = ocr.recognizeWords(cv::Mat(), 1.0, recognizeError);
      check(tokens.empty() && !recognizeError.empty(),
            "recognition failure is reported, not an empty success");
    }

    roster::RosterExtractor extractor(config);
    auto result = extractor.extractFromPDF(pdfPath.string());
    check(result.success && result.pageCount == 1 &&
              result.pagesProcessed == 1 && !result.usedOcr,
          "sample PDF extracted from its text layer");

    auto failed = extractor.extractFromPDF((dir / "absent.pdf").string());
    check(!failed.success && !failed.errorMessage.empty(),
          "unreadable document fails the run");

    std::filesystem::remove_all(dir);
  }

  std::cout << std::endl;
  if (failures == 0) {
    std::cout << "All RosterExtractor dispatch tests passed" << std::endl;
    return 0;
  }
  std::cout << failures << " RosterExtractor dispatch test(s) failed"
            << std::endl;
  return 1;
}
