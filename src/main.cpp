#include "OcrTokenSource.hpp"
#include "RecordWriter.hpp"
#include "RosterExtractor.hpp"

#include <iomanip>
#include <iostream>
#include <string>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <pdf_path> [options]\n"
      << "\nOptions:\n"
      << "  -o, --out <file>        Output file, .csv, .xls or .xlsx (default: "
         "participants.csv)\n"
      << "  --layout <mode>         auto, one or two (default: auto)\n"
      << "  --x-threshold <val>     Column split on x0 in points (default: "
         "260)\n"
      << "  --force-ocr             OCR every page instead of the text layer\n"
      << "  --ocr-empty-pages       OCR pages without a text layer\n"
      << "  --ocr-dpi <val>         Rasterization DPI for OCR (default: 300)\n"
      << "  --tessdata <dir>        Path to the tessdata directory\n"
      << "  -l, --language <lang>   Set OCR language (default: eng)\n"
      << "  -c, --confidence <val>  Minimum OCR confidence (0-100)\n"
      << "  --no-preprocess         Feed rendered pages to OCR unfiltered\n"
      << "  -v, --verbose           Print diagnostics\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " participants.pdf -o out.csv\n"
      << "  " << programName << " participants.pdf --layout two -o out.xlsx\n"
      << "  " << programName << " scanned.pdf --force-ocr --ocr-dpi 400\n";
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string pdfPath;
  std::string outputPath = "participants.csv";
  roster::ExtractorConfig config;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool hasValue = i + 1 < argc;

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-o" || arg == "--out") {
      if (!hasValue) {
        std::cerr << "Error: --out requires an argument\n";
        return 1;
      }
      outputPath = argv[++i];
    } else if (arg == "--layout") {
      if (!hasValue ||
          !roster::parseLayoutOverride(argv[i + 1], config.layout)) {
        std::cerr << "Error: --layout expects auto, one or two\n";
        return 1;
      }
      ++i;
    } else if (arg == "--x-threshold") {
      if (!hasValue ||
          !roster::parseDoubleArgument(argv[i + 1],
                                       config.geometry.xThreshold)) {
        std::cerr << "Error: --x-threshold expects a number\n";
        return 1;
      }
      ++i;
    } else if (arg == "--force-ocr") {
      config.forceOcr = true;
    } else if (arg == "--ocr-empty-pages") {
      config.ocrEmptyPages = true;
    } else if (arg == "--ocr-dpi") {
      if (!hasValue ||
          !roster::parseIntArgument(argv[i + 1], config.ocr.dpi)) {
        std::cerr << "Error: --ocr-dpi expects an integer\n";
        return 1;
      }
      ++i;
      if (config.ocr.dpi <= 0) {
        std::cerr << "Error: --ocr-dpi must be positive\n";
        return 1;
      }
    } else if (arg == "--tessdata") {
      if (!hasValue) {
        std::cerr << "Error: --tessdata requires an argument\n";
        return 1;
      }
      config.ocr.tessDataPath = argv[++i];
    } else if (arg == "-l" || arg == "--language") {
      if (!hasValue) {
        std::cerr << "Error: --language requires an argument\n";
        return 1;
      }
      config.ocr.language = argv[++i];
    } else if (arg == "-c" || arg == "--confidence") {
      if (!hasValue ||
          !roster::parseIntArgument(argv[i + 1], config.ocr.minConfidence)) {
        std::cerr << "Error: --confidence expects an integer\n";
        return 1;
      }
      ++i;
    } else if (arg == "--no-preprocess") {
      config.ocr.preprocessImage = false;
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (arg[0] != '-') {
      pdfPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (pdfPath.empty()) {
    std::cerr << "Error: No PDF path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  // Fail on an unusable output path before spending time on OCR
  roster::OutputFormat format = roster::OutputFormat::Csv;
  std::string formatError;
  if (!roster::outputFormatForPath(outputPath, format, formatError)) {
    std::cerr << "Error: " << formatError << "\n";
    return 1;
  }

  // Display version info
  std::cout << "=== Roster Extract ===\n"
            << "Tesseract version: "
            << roster::OcrTokenSource::getTesseractVersion() << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Source: " << (config.forceOcr ? "OCR" : "text layer") << "\n"
            << "X threshold: " << config.geometry.xThreshold << "\n"
            << "======================\n\n";

  std::cout << "Extracting: " << pdfPath << "\n";

  roster::RosterExtractor extractor(config);
  auto result = extractor.extractFromPDF(pdfPath);

  if (!result.success) {
    std::cerr << "Extraction failed: " << result.errorMessage << "\n";
    return 1;
  }

  std::cout << "Pages: " << result.pageCount
            << "  processed: " << result.pagesProcessed
            << "  layout: " << roster::layoutModeName(result.layoutMode)
            << (result.usedOcr ? " (OCR)" : "") << "\n";

  if (!result.skippedPages.empty()) {
    std::cout << "Skipped pages:";
    for (int page : result.skippedPages) {
      std::cout << " " << page;
    }
    std::cout << "\n";
  }

  auto written = roster::writeRecords(result.records, outputPath);
  if (!written.success) {
    std::cerr << "Write failed: " << written.errorMessage << "\n";
    return 1;
  }

  std::cout << "\nProcessing time: " << std::fixed << std::setprecision(2)
            << result.processingTimeMs << " ms\n";
  std::cout << "Wrote " << written.rowCount << " rows to " << written.outputPath
            << "\n";

  return 0;
}
