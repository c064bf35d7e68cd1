#include "RosterExtractor.hpp"
#include "PdfTokenSource.hpp"
#include "RecordAssembler.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

namespace roster {

RosterExtractor::RosterExtractor() : m_config(), m_parser() {}

RosterExtractor::RosterExtractor(const ExtractorConfig &config)
    : m_config(config), m_parser() {}

const ExtractorConfig &RosterExtractor::getConfig() const { return m_config; }

void RosterExtractor::setConfig(const ExtractorConfig &config) {
  m_config = config;
}

PageTokens RosterExtractor::safeExtractPage(TokenSource &source, int pageIndex,
                                            TokenGranularity granularity) const {
  try {
    return source.extractPage(pageIndex, granularity);
  } catch (const std::exception &e) {
    PageTokens failed;
    failed.pageNumber = pageIndex + 1;
    failed.granularity = granularity;
    failed.errorMessage = e.what();
    return failed;
  }
}

LayoutMode RosterExtractor::resolveLayout(TokenSource &source) {
  if (!source.hasFontWeight()) {
    return LayoutMode::Two;
  }

  switch (m_config.layout) {
  case LayoutOverride::One:
    return LayoutMode::Single;
  case LayoutOverride::Two:
    return LayoutMode::Two;
  case LayoutOverride::Auto:
    break;
  }

  std::vector<PageTokens> samples;
  int sampleCount = std::min(m_config.layoutSamplePages, source.pageCount());
  for (int pageIndex = 0; pageIndex < sampleCount; ++pageIndex) {
    PageTokens page =
        safeExtractPage(source, pageIndex, TokenGranularity::Word);

    if (!page.success && m_config.verbose) {
      std::cerr << "DEBUG: Layout sample page " << page.pageNumber
                << " unreadable: " << page.errorMessage << std::endl;
    }
    samples.push_back(std::move(page));
  }

  LayoutMode mode = detectLayoutMode(samples, m_config.geometry);

  if (m_config.verbose) {
    std::cerr << "DEBUG: Detected layout '" << layoutModeName(mode)
              << "' from " << samples.size() << " sample pages" << std::endl;
  }
  return mode;
}

ExtractionResult RosterExtractor::extract(TokenSource &source,
                                          TokenSource *emptyPageFallback) {
  ExtractionResult result;
  auto startTime = std::chrono::high_resolution_clock::now();

  result.pageCount = source.pageCount();
  result.usedOcr = !source.hasFontWeight();
  result.layoutMode = resolveLayout(source);

  RecordAssembler assembler(RecordAssembler::selectStrategy(
      result.layoutMode, source.hasFontWeight(), m_config.geometry, m_parser));

  // Image-only pages carry no font weight; they always use the all-caps rules
  RecordAssembler fallbackAssembler(LayoutMode::Two, m_config.geometry,
                                    m_parser);

  for (int pageIndex = 0; pageIndex < result.pageCount; ++pageIndex) {
    PageTokens page =
        safeExtractPage(source, pageIndex, assembler.granularity());

    if (!page.success) {
      std::cerr << "Warning: skipping page " << (pageIndex + 1) << ": "
                << page.errorMessage << std::endl;
      result.skippedPages.push_back(pageIndex + 1);
      continue;
    }

    const RecordAssembler *pageAssembler = &assembler;

    if (page.tokens.empty() && emptyPageFallback != nullptr) {
      if (m_config.verbose) {
        std::cerr << "DEBUG: Page " << (pageIndex + 1)
                  << " has no text layer, trying OCR" << std::endl;
      }

      PageTokens ocrPage = safeExtractPage(*emptyPageFallback, pageIndex,
                                           TokenGranularity::Word);
      if (!ocrPage.success) {
        std::cerr << "Warning: skipping page " << (pageIndex + 1) << ": "
                  << ocrPage.errorMessage << std::endl;
        result.skippedPages.push_back(pageIndex + 1);
        continue;
      }

      page = std::move(ocrPage);
      pageAssembler = &fallbackAssembler;
      result.usedOcr = true;
    }

    std::vector<Record> pageRecords = pageAssembler->assemblePage(page.tokens);

    if (m_config.verbose) {
      std::cerr << "DEBUG: Page " << (pageIndex + 1) << ": "
                << page.tokens.size() << " tokens, " << pageRecords.size()
                << " records" << std::endl;
    }

    result.records.insert(result.records.end(), pageRecords.begin(),
                          pageRecords.end());
    ++result.pagesProcessed;
  }

  result.success = true;

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

ExtractionResult RosterExtractor::extractFromPDF(const std::string &pdfPath) {
  ExtractionResult result;
  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    PdfTokenSource pdf;
    if (!pdf.open(pdfPath)) {
      result.errorMessage = pdf.errorMessage();
      return result;
    }

    if (m_config.verbose) {
      std::cerr << "DEBUG: PDF has " << pdf.pageCount() << " pages"
                << std::endl;
    }

    std::unique_ptr<OcrTokenSource> ocr;
    if (m_config.forceOcr || m_config.ocrEmptyPages) {
      ocr = std::make_unique<OcrTokenSource>(*pdf.document(), m_config.ocr);

      if (!ocr->initialize()) {
        if (m_config.forceOcr) {
          result.errorMessage = "Failed to initialize OCR engine";
          return result;
        }
        std::cerr << "Warning: OCR unavailable, image-only pages will be "
                     "skipped"
                  << std::endl;
        ocr.reset();
      }
    }

    if (m_config.forceOcr) {
      result = extract(*ocr);
    } else {
      result = extract(pdf, ocr.get());
    }
  } catch (const std::exception &e) {
    result = ExtractionResult();
    result.errorMessage = std::string("Roster extraction failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

bool parseLayoutOverride(const std::string &value, LayoutOverride &layout) {
  if (value == "auto") {
    layout = LayoutOverride::Auto;
  } else if (value == "one") {
    layout = LayoutOverride::One;
  } else if (value == "two") {
    layout = LayoutOverride::Two;
  } else {
    return false;
  }
  return true;
}

bool parseDoubleArgument(const std::string &value, double &out) {
  try {
    size_t consumed = 0;
    double parsed = std::stod(value, &consumed);
    if (consumed != value.size()) {
      return false;
    }
    out = parsed;
    return true;
  } catch (const std::invalid_argument &) {
    return false;
  } catch (const std::out_of_range &) {
    return false;
  }
}

bool parseIntArgument(const std::string &value, int &out) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      return false;
    }
    out = parsed;
    return true;
  } catch (const std::invalid_argument &) {
    return false;
  } catch (const std::out_of_range &) {
    return false;
  }
}

} // namespace roster
