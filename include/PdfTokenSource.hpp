#ifndef ROSTER_PDF_TOKEN_SOURCE_HPP
#define ROSTER_PDF_TOKEN_SOURCE_HPP

#include "TokenSource.hpp"

#include <poppler-document.h>
#include <poppler-page.h>

#include <memory>
#include <string>
#include <vector>

namespace roster {

/**
 * @brief Token source reading the text layer of a PDF with Poppler
 *
 * Word tokens come straight from Poppler's text boxes. Glyph tokens are cut
 * from each box with its per-character bounding boxes; a space glyph is
 * emitted after every word Poppler reports as followed by a space, so glyph
 * lines keep their word breaks.
 *
 * Example usage:
 * @code
 * roster::PdfTokenSource source;
 * if (source.open("participants.pdf")) {
 *     auto page = source.extractPage(0, roster::TokenGranularity::Word);
 * }
 * @endcode
 */
class PdfTokenSource : public TokenSource {
public:
  PdfTokenSource();
  ~PdfTokenSource() override;

  PdfTokenSource(const PdfTokenSource &) = delete;
  PdfTokenSource &operator=(const PdfTokenSource &) = delete;

  /**
   * @brief Load a PDF file
   * @param pdfPath Path to the PDF file
   * @return true on success; errorMessage() explains a failure
   */
  bool open(const std::string &pdfPath);

  /**
   * @brief Whether a document is loaded
   */
  bool isOpen() const;

  /**
   * @brief Reason the last open() failed
   */
  const std::string &errorMessage() const;

  int pageCount() const override;

  PageTokens extractPage(int pageIndex, TokenGranularity granularity) override;

  bool hasFontWeight() const override { return true; }

  /**
   * @brief The loaded document, for rasterizing pages
   * @return nullptr if no document is open
   */
  const poppler::document *document() const;

  /**
   * @brief Check a Poppler font name for a bold face
   *
   * Case-insensitive substring match on "bold", so "Helvetica-Bold" and
   * "ABCDEE+Arial,Bold" qualify.
   */
  static bool isBoldFont(const std::string &fontName);

private:
  void appendWordToken(const poppler::text_box &box,
                       std::vector<Token> &tokens) const;
  void appendGlyphTokens(const poppler::text_box &box,
                         std::vector<Token> &tokens) const;

  std::unique_ptr<poppler::document> m_document; ///< Loaded document
  std::string m_errorMessage;                    ///< Last open() failure
};

} // namespace roster

#endif // ROSTER_PDF_TOKEN_SOURCE_HPP
