#include "OcrTokenSource.hpp"
#include "LayoutEngine.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <utility>

#include <poppler-page-renderer.h>
#include <poppler-page.h>

namespace roster {

namespace {

/**
 * @brief How a Poppler raster maps onto an OpenCV matrix
 */
struct PixelLayout {
  int matType = CV_8UC3; ///< OpenCV element type of one pixel
  int toBgr = -1;        ///< cvtColor code to BGR, or -1 if none is needed
};

bool pixelLayout(poppler::image::format_enum format, PixelLayout &layout) {
  switch (format) {
  case poppler::image::format_argb32:
    // Native-endian ARGB words are B, G, R, A bytes on x86 and ARM
    layout = PixelLayout{CV_8UC4, cv::COLOR_BGRA2BGR};
    return true;
  case poppler::image::format_rgb24:
    layout = PixelLayout{CV_8UC3, cv::COLOR_RGB2BGR};
    return true;
  case poppler::image::format_bgr24:
    layout = PixelLayout{CV_8UC3, -1};
    return true;
  case poppler::image::format_gray8:
    layout = PixelLayout{CV_8UC1, -1};
    return true;
  default:
    return false;
  }
}

// Copies the pixels out of the Poppler image, which owns its buffer
cv::Mat toBgrMat(const poppler::image &image, const PixelLayout &layout) {
  cv::Mat view(image.height(), image.width(), layout.matType,
               const_cast<char *>(image.const_data()), image.bytes_per_row());

  cv::Mat mat;
  if (layout.toBgr < 0) {
    mat = view.clone();
  } else {
    cv::cvtColor(view, mat, layout.toBgr);
  }
  return mat;
}

} // anonymous namespace

OcrTokenSource::OcrTokenSource(const poppler::document &document,
                               const OcrConfig &config)
    : m_document(document),
      m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_initialized(false) {}

OcrTokenSource::~OcrTokenSource() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

bool OcrTokenSource::initialize() {
  if (m_initialized) {
    return true;
  }

  // An explicit path wins over TESSDATA_PREFIX; with neither, nullptr makes
  // Tesseract fall back to its compiled-in tessdata location
  const char *tessDataPath = m_config.tessDataPath.empty()
                                 ? std::getenv("TESSDATA_PREFIX")
                                 : m_config.tessDataPath.c_str();

  if (m_tesseract->Init(tessDataPath, m_config.language.c_str()) != 0) {
    std::cerr << "Tesseract could not load language '" << m_config.language
              << "' from "
              << (tessDataPath != nullptr ? tessDataPath : "default tessdata")
              << std::endl;
    return false;
  }

  m_tesseract->SetPageSegMode(m_config.pageSegMode);
  m_initialized = true;
  return true;
}

bool OcrTokenSource::isInitialized() const { return m_initialized; }

int OcrTokenSource::pageCount() const { return m_document.pages(); }

const OcrConfig &OcrTokenSource::getConfig() const { return m_config; }

std::string OcrTokenSource::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

PageTokens OcrTokenSource::extractPage(int pageIndex,
                                       TokenGranularity /*granularity*/) {
  PageTokens result;
  result.pageNumber = pageIndex + 1;
  result.granularity = TokenGranularity::Word;

  if (!m_initialized) {
    result.errorMessage =
        "OCR engine not initialized. Call initialize() first.";
    return result;
  }

  try {
    std::string renderError;
    cv::Mat image = renderPage(pageIndex, renderError);
    if (image.empty()) {
      result.errorMessage = renderError;
      return result;
    }

    std::string recognizeError;
    result.tokens = recognizeWords(image, 72.0 / m_config.dpi, recognizeError);
    if (!recognizeError.empty()) {
      result.tokens.clear();
      result.errorMessage = "Page " + std::to_string(pageIndex + 1) + ": " +
                            recognizeError;
      return result;
    }

    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("OCR failed on page ") +
                          std::to_string(pageIndex + 1) + ": " + e.what();
  }

  return result;
}

cv::Mat OcrTokenSource::renderPage(int pageIndex,
                                   std::string &errorMessage) const {
  if (pageIndex < 0 || pageIndex >= m_document.pages()) {
    errorMessage = "Page " + std::to_string(pageIndex + 1) + " is out of range";
    return cv::Mat();
  }

  std::unique_ptr<poppler::page> page(m_document.create_page(pageIndex));
  if (!page) {
    errorMessage = "Failed to create page " + std::to_string(pageIndex + 1);
    return cv::Mat();
  }

  poppler::page_renderer renderer;
  renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
  renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
  renderer.set_image_format(poppler::image::format_argb32);

  const double dpi = static_cast<double>(m_config.dpi);
  poppler::image popplerImage = renderer.render_page(page.get(), dpi, dpi);

  if (!popplerImage.is_valid()) {
    errorMessage = "Failed to render page " + std::to_string(pageIndex + 1);
    return cv::Mat();
  }

  PixelLayout layout;
  if (!pixelLayout(popplerImage.format(), layout)) {
    errorMessage = "Unsupported raster format for page " +
                   std::to_string(pageIndex + 1);
    return cv::Mat();
  }

  return toBgrMat(popplerImage, layout);
}

std::vector<Token> OcrTokenSource::recognizeWords(const cv::Mat &image,
                                                  double scale,
                                                  std::string &errorMessage) {
  std::vector<Token> tokens;

  if (!m_initialized) {
    errorMessage = "OCR engine not initialized. Call initialize() first.";
    return tokens;
  }
  if (image.empty()) {
    errorMessage = "Input image is empty";
    return tokens;
  }

  setImage(m_config.preprocessImage ? preprocessImage(image) : image);

  if (m_tesseract->Recognize(nullptr) != 0) {
    errorMessage = "Tesseract recognition failed";
    return tokens;
  }

  std::unique_ptr<tesseract::ResultIterator> it(m_tesseract->GetIterator());
  if (!it) {
    errorMessage = "Tesseract returned no result iterator";
    return tokens;
  }

  const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
  do {
    std::unique_ptr<char[]> word(it->GetUTF8Text(level));
    if (!word) {
      continue;
    }

    std::string text = trim(word.get());
    float confidence = it->Confidence(level);

    // Tesseract reports -1 for words it could not score
    if (text.empty() || confidence < 0.0f ||
        confidence < m_config.minConfidence) {
      continue;
    }

    int left = 0, top = 0, right = 0, bottom = 0;
    if (!it->BoundingBox(level, &left, &top, &right, &bottom)) {
      continue;
    }

    Token token;
    token.text = std::move(text);
    token.x0 = left * scale;
    token.top = top * scale;
    tokens.push_back(std::move(token));
  } while (it->Next(level));

  return tokens;
}

cv::Mat OcrTokenSource::preprocessImage(const cv::Mat &image) const {
  cv::Mat gray;
  if (image.channels() == 1) {
    gray = image.clone();
  } else {
    cv::cvtColor(image, gray,
                 image.channels() == 4 ? cv::COLOR_BGRA2GRAY
                                       : cv::COLOR_BGR2GRAY);
  }

  // Light denoise, then binarize against the local background
  cv::Mat binary;
  cv::GaussianBlur(gray, gray, cv::Size(3, 3), 0);
  cv::adaptiveThreshold(gray, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                        cv::THRESH_BINARY, 11, 2);
  return binary;
}

void OcrTokenSource::setImage(const cv::Mat &image) {
  // Tesseract copies the pixels, so the temporaries below may go away
  if (image.channels() == 1) {
    m_tesseract->SetImage(image.data, image.cols, image.rows, 1,
                          static_cast<int>(image.step));
    return;
  }

  cv::Mat rgb;
  cv::cvtColor(image, rgb,
               image.channels() == 4 ? cv::COLOR_BGRA2RGB : cv::COLOR_BGR2RGB);
  m_tesseract->SetImage(rgb.data, rgb.cols, rgb.rows, 3,
                        static_cast<int>(rgb.step));
}

} // namespace roster
