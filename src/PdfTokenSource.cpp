#include "PdfTokenSource.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

namespace roster {

namespace {

std::string toUtf8(const poppler::ustring &text) {
  poppler::byte_array bytes = text.to_utf8();
  return std::string(bytes.begin(), bytes.end());
}

bool isHighSurrogate(unsigned int unit) {
  return unit >= 0xD800 && unit <= 0xDBFF;
}

} // anonymous namespace

PdfTokenSource::PdfTokenSource() = default;

PdfTokenSource::~PdfTokenSource() = default;

bool PdfTokenSource::open(const std::string &pdfPath) {
  m_document.reset();
  m_errorMessage.clear();

  std::unique_ptr<poppler::document> doc(
      poppler::document::load_from_file(pdfPath));

  if (!doc) {
    m_errorMessage = "Failed to load PDF file: " + pdfPath;
    return false;
  }

  if (doc->is_locked()) {
    m_errorMessage = "PDF file is password protected: " + pdfPath;
    return false;
  }

  m_document = std::move(doc);
  return true;
}

bool PdfTokenSource::isOpen() const { return m_document != nullptr; }

const std::string &PdfTokenSource::errorMessage() const {
  return m_errorMessage;
}

int PdfTokenSource::pageCount() const {
  return m_document ? m_document->pages() : 0;
}

const poppler::document *PdfTokenSource::document() const {
  return m_document.get();
}

bool PdfTokenSource::isBoldFont(const std::string &fontName) {
  if (fontName.empty() || fontName == "*ignored*") {
    return false;
  }

  std::string fontNameLower = fontName;
  std::transform(fontNameLower.begin(), fontNameLower.end(),
                 fontNameLower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return fontNameLower.find("bold") != std::string::npos;
}

PageTokens PdfTokenSource::extractPage(int pageIndex,
                                       TokenGranularity granularity) {
  PageTokens result;
  result.pageNumber = pageIndex + 1;
  result.granularity = granularity;

  if (!isOpen()) {
    result.errorMessage = "No PDF document loaded";
    return result;
  }

  if (pageIndex < 0 || pageIndex >= m_document->pages()) {
    result.errorMessage =
        "Page " + std::to_string(pageIndex + 1) + " is out of range";
    return result;
  }

  try {
    std::unique_ptr<poppler::page> page(m_document->create_page(pageIndex));
    if (!page) {
      result.errorMessage =
          "Failed to create page " + std::to_string(pageIndex + 1);
      return result;
    }

    // Text box coordinates are already top-left origin, in points
    std::vector<poppler::text_box> textBoxes =
        page->text_list(poppler::page::text_list_include_font);

    for (const auto &textBox : textBoxes) {
      if (granularity == TokenGranularity::Word) {
        appendWordToken(textBox, result.tokens);
      } else {
        appendGlyphTokens(textBox, result.tokens);
      }
    }

    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Text extraction failed on page ") +
                          std::to_string(pageIndex + 1) + ": " + e.what();
  }

  return result;
}

void PdfTokenSource::appendWordToken(const poppler::text_box &box,
                                     std::vector<Token> &tokens) const {
  std::string text = toUtf8(box.text());
  if (text.empty()) {
    return;
  }

  poppler::rectf bbox = box.bbox();

  Token token;
  token.text = text;
  token.x0 = bbox.x();
  token.top = bbox.y();
  tokens.push_back(token);
}

void PdfTokenSource::appendGlyphTokens(const poppler::text_box &box,
                                       std::vector<Token> &tokens) const {
  poppler::ustring text = box.text();
  if (text.empty()) {
    return;
  }

  const bool hasFont = box.has_font_info();
  poppler::rectf wordBox = box.bbox();

  poppler::rectf lastBox;
  bool lastBold = false;

  // Poppler indexes glyph boxes per character, not per UTF-16 unit
  int glyphIndex = 0;
  for (size_t i = 0; i < text.size(); ++i, ++glyphIndex) {
    poppler::ustring glyph(1, text[i]);
    if (isHighSurrogate(text[i]) && i + 1 < text.size()) {
      glyph.push_back(text[++i]);
    }

    Token token;
    token.text = toUtf8(glyph);

    // Ligatures can leave more characters than glyph boxes; an empty box
    // means the index is past the glyphs Poppler knows about
    poppler::rectf glyphBox = box.char_bbox(glyphIndex);
    if (glyphBox.is_empty()) {
      token.x0 = lastBox.is_empty() ? wordBox.x() : lastBox.right();
      token.top = wordBox.y();
      token.isBold = lastBold;
    } else {
      token.x0 = glyphBox.x();
      token.top = glyphBox.y();
      token.isBold = hasFont && isBoldFont(box.get_font_name(glyphIndex));
      lastBox = glyphBox;
      lastBold = token.isBold;
    }
    tokens.push_back(token);
  }

  if (box.has_space_after()) {
    Token space;
    space.text = " ";
    space.x0 = wordBox.right();
    space.top = wordBox.y();
    space.isBold = lastBold;
    tokens.push_back(space);
  }
}

} // namespace roster
