#ifndef ROSTER_OCR_TOKEN_SOURCE_HPP
#define ROSTER_OCR_TOKEN_SOURCE_HPP

#include "TokenSource.hpp"

#include <opencv2/opencv.hpp>
#include <poppler-document.h>
#include <tesseract/baseapi.h>

#include <memory>
#include <string>
#include <vector>

namespace roster {

/**
 * @brief Configuration options for the OCR path
 */
struct OcrConfig {
  std::string language = "eng"; ///< Language code (e.g., "eng", "eng+fra")
  tesseract::PageSegMode pageSegMode =
      tesseract::PSM_AUTO;     ///< Page segmentation mode
  bool preprocessImage = true; ///< Apply preprocessing (grayscale, threshold)
  int minConfidence = 0;       ///< Words below this confidence are dropped
  std::string tessDataPath =
      ""; ///< Path to tessdata directory (empty = TESSDATA_PREFIX/default)
  int dpi = 300; ///< Rasterization resolution
};

/**
 * @brief Token source that rasterizes PDF pages and reads them with Tesseract
 *
 * Pages are rendered with Poppler's page renderer, optionally preprocessed
 * with OpenCV, and recognized word by word. Word boxes are scaled from
 * pixels back to page points (72 / dpi) so the same geometry thresholds
 * apply as for the text layer. OCR tokens never carry font weight.
 *
 * Example usage:
 * @code
 * roster::OcrTokenSource ocr(*pdf.document());
 * if (ocr.initialize()) {
 *     auto page = ocr.extractPage(0, roster::TokenGranularity::Word);
 * }
 * @endcode
 */
class OcrTokenSource : public TokenSource {
public:
  /**
   * @param document Document to rasterize; must outlive this source
   * @param config OCR configuration options
   */
  explicit OcrTokenSource(const poppler::document &document,
                          const OcrConfig &config = OcrConfig());

  ~OcrTokenSource() override;

  // Disable copy operations (Tesseract API is not copyable)
  OcrTokenSource(const OcrTokenSource &) = delete;
  OcrTokenSource &operator=(const OcrTokenSource &) = delete;

  /**
   * @brief Initialize the OCR engine
   * @return true if initialization was successful, false otherwise
   */
  bool initialize();

  /**
   * @brief Check if the OCR engine is initialized
   */
  bool isInitialized() const;

  int pageCount() const override;

  /**
   * @brief Rasterize and recognize one page
   *
   * Always produces word tokens whatever granularity is requested.
   */
  PageTokens extractPage(int pageIndex, TokenGranularity granularity) override;

  bool hasFontWeight() const override { return false; }

  /**
   * @brief Render a page to a BGR image at the configured DPI
   * @param pageIndex 0-indexed page number
   * @param errorMessage Set when rendering fails
   * @return Rendered page, or an empty Mat on failure
   */
  cv::Mat renderPage(int pageIndex, std::string &errorMessage) const;

  /**
   * @brief Recognize the words of an image
   * @param image Page image
   * @param scale Factor converting pixel coordinates to output coordinates
   * @param errorMessage Set when recognition could not run; an image that
   * simply holds no text leaves it empty
   * @return Word tokens with non-empty text and confidence >= minConfidence
   */
  std::vector<Token> recognizeWords(const cv::Mat &image, double scale,
                                    std::string &errorMessage);

  const OcrConfig &getConfig() const;

  /**
   * @brief Get the Tesseract version string
   */
  static std::string getTesseractVersion();

private:
  /**
   * @brief Preprocess image for better OCR results
   */
  cv::Mat preprocessImage(const cv::Mat &image) const;

  /**
   * @brief Convert OpenCV Mat to Tesseract-compatible format
   */
  void setImage(const cv::Mat &image);

  const poppler::document &m_document; ///< Document being rasterized
  std::unique_ptr<tesseract::TessBaseAPI>
      m_tesseract;    ///< Tesseract API instance
  OcrConfig m_config; ///< Current configuration
  bool m_initialized; ///< Initialization state
};

} // namespace roster

#endif // ROSTER_OCR_TOKEN_SOURCE_HPP
