#ifndef ROSTER_EXTRACTOR_HPP
#define ROSTER_EXTRACTOR_HPP

#include "Honorifics.hpp"
#include "LayoutEngine.hpp"
#include "OcrTokenSource.hpp"
#include "RosterTypes.hpp"
#include "TokenSource.hpp"

#include <string>
#include <vector>

namespace roster {

/**
 * @brief Configuration options for roster extraction
 */
struct ExtractorConfig {
  LayoutOverride layout = LayoutOverride::Auto; ///< Forced or detected layout
  LayoutConfig geometry;     ///< Column, line and paragraph thresholds
  int layoutSamplePages = 2; ///< Pages inspected by layout detection
  bool forceOcr = false;     ///< OCR every page instead of the text layer
  bool ocrEmptyPages = false; ///< OCR text-layer pages that yield no tokens
  OcrConfig ocr;             ///< Tesseract and rasterization options
  bool verbose = false;      ///< Print DEBUG diagnostics to stderr
};

/**
 * @brief Result of extracting a roster document
 */
struct ExtractionResult {
  std::vector<Record> records;               ///< Records in document order
  LayoutMode layoutMode = LayoutMode::Single; ///< Layout used for assembly
  bool usedOcr = false;        ///< Whether any page went through OCR
  int pageCount = 0;           ///< Number of pages in the document
  int pagesProcessed = 0;      ///< Pages whose tokens were assembled
  std::vector<int> skippedPages; ///< 1-indexed pages that failed extraction
  double processingTimeMs = 0; ///< Processing time in milliseconds
  bool success = false;        ///< Whether the document could be read
  std::string errorMessage;    ///< Error message if failed
};

/**
 * @brief Main class turning roster PDFs into attendee records
 *
 * Picks the text layer or OCR, decides the layout, and feeds every page
 * through the matching record assembler. A page that fails extraction is
 * skipped and reported in ExtractionResult::skippedPages; only a document
 * that cannot be opened fails the whole run.
 *
 * Example usage:
 * @code
 * roster::ExtractorConfig config;
 * config.layout = roster::LayoutOverride::Auto;
 * roster::RosterExtractor extractor(config);
 * auto result = extractor.extractFromPDF("participants.pdf");
 * if (result.success) {
 *     std::cout << result.records.size() << " records\n";
 * }
 * @endcode
 */
class RosterExtractor {
public:
  RosterExtractor();

  explicit RosterExtractor(const ExtractorConfig &config);

  /**
   * @brief Extract records from a PDF file
   *
   * Uses the Poppler text layer unless forceOcr is set, in which case every
   * page is rasterized and recognized with Tesseract.
   *
   * @param pdfPath Path to the PDF file
   */
  ExtractionResult extractFromPDF(const std::string &pdfPath);

  /**
   * @brief Extract records from an already opened token source
   * @param source Primary token source
   * @param emptyPageFallback Optional source consulted for pages where the
   * primary source yields no tokens (used for image-only pages)
   */
  ExtractionResult extract(TokenSource &source,
                           TokenSource *emptyPageFallback = nullptr);

  /**
   * @brief Decide the layout of a document
   *
   * Honors the configured override; in Auto mode samples the first
   * layoutSamplePages pages as words. Sources without font weight always
   * resolve to Two, since only the all-caps strategy works without it.
   */
  LayoutMode resolveLayout(TokenSource &source);

  const ExtractorConfig &getConfig() const;

  void setConfig(const ExtractorConfig &config);

private:
  /**
   * @brief extractPage() that turns an escaping exception into a failed page
   */
  PageTokens safeExtractPage(TokenSource &source, int pageIndex,
                             TokenGranularity granularity) const;

  ExtractorConfig m_config;  ///< Current configuration
  HonorificParser m_parser;  ///< Title lexicon
};

/**
 * @brief Parse "auto", "one" or "two"
 * @return false for any other value; layout is left unchanged
 */
bool parseLayoutOverride(const std::string &value, LayoutOverride &layout);

/**
 * @brief Parse a whole command line value as a number
 *
 * Unlike a bare std::stod, trailing characters ("260abc") and an empty value
 * are rejected.
 *
 * @return false if value is not entirely a number; out is left unchanged
 */
bool parseDoubleArgument(const std::string &value, double &out);

/**
 * @brief Integer counterpart of parseDoubleArgument()
 */
bool parseIntArgument(const std::string &value, int &out);

} // namespace roster

#endif // ROSTER_EXTRACTOR_HPP
